/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include "libutil/mybase.h"

#include <ctype.h>

#include <algorithm>
#include <fstream>
#include <string>
#include <vector>

#include "InputPartitioner.h"
#include "SequenceReader.h"

// -------------------------------------------------------------------------
// file-local helpers
//
namespace {
// remove whitespace and make residues uppercase
inline std::string cleanresidues( const std::string& line )
{
    std::string result;
    result.reserve(line.size());
    for(char c: line)
        if(!isspace((unsigned char)c))
            result.push_back((char)toupper((unsigned char)c));
    return result;
}
}//namespace

// -------------------------------------------------------------------------
// IsValidSequence: non-empty sequence of letters
//
bool SequenceReader::IsValidSequence( const std::string& sequence )
{
    return !sequence.empty() &&
        std::all_of(sequence.begin(), sequence.end(),
            [](char c){return isalpha((unsigned char)c) != 0;});
}

// -------------------------------------------------------------------------
// ReadFasta: read sequences in FASTA format; a sequence key is the first
// word of its description line
//
std::vector<TNamedSequence> SequenceReader::ReadFasta( const std::string& filename )
{
    MYMSG(("SequenceReader::ReadFasta: " + filename).c_str(), 3);

    std::ifstream fin(filename);
    if(!fin)
        throw MYRUNTIME_ERROR2("Failed to open file " + filename, INVALIDINPUT);

    std::vector<TNamedSequence> sequences;
    std::string line;

    while(std::getline(fin, line)) {
        if(!line.empty() && line[line.size()-1] == '\r')
            line.erase(line.size()-1);
        if(!line.empty() && line[0] == '>') {
            size_t beg = line.find_first_not_of(" \t", 1);
            size_t end = (beg == std::string::npos)? beg: line.find_first_of(" \t", beg);
            std::string key = (beg == std::string::npos)? std::string(): line.substr(beg, end - beg);
            if(key.empty())
                throw MYRUNTIME_ERROR2(
                "Sequence without a name in file " + filename, INVALIDINPUT);
            sequences.push_back(TNamedSequence(key, std::string()));
            continue;
        }
        std::string residues = cleanresidues(line);
        if(residues.empty())
            continue;
        if(sequences.empty())
            throw MYRUNTIME_ERROR2(
            "Sequence data before the first description line in file " + filename, INVALIDINPUT);
        sequences.back().second += residues;
    }

    if(fin.bad())
        throw MYRUNTIME_ERROR2("Failed to read file " + filename, INVALIDINPUT);

    for(const TNamedSequence& seq: sequences)
        if(!IsValidSequence(seq.second))
            throw MYRUNTIME_ERROR2(
            "Invalid or empty sequence " + seq.first + " in file " + filename, INVALIDINPUT);

    if(sequences.empty())
        throw MYRUNTIME_ERROR2("No sequences in file " + filename, INVALIDINPUT);

    return sequences;
}

// -------------------------------------------------------------------------
// ReadPeptides: read peptides, one per line; blank lines and lines
// beginning with `#' are ignored
//
std::vector<std::string> SequenceReader::ReadPeptides( const std::string& filename )
{
    MYMSG(("SequenceReader::ReadPeptides: " + filename).c_str(), 3);

    std::ifstream fin(filename);
    if(!fin)
        throw MYRUNTIME_ERROR2("Failed to open file " + filename, INVALIDINPUT);

    std::vector<std::string> peptides;
    std::string line;

    while(std::getline(fin, line)) {
        size_t beg = line.find_first_not_of(" \t\r");
        if(beg == std::string::npos || line[beg] == '#')
            continue;
        std::string peptide = cleanresidues(line);
        if(!IsValidSequence(peptide))
            throw MYRUNTIME_ERROR2(
            "Invalid peptide " + peptide + " in file " + filename, INVALIDINPUT);
        peptides.push_back(peptide);
    }

    if(fin.bad())
        throw MYRUNTIME_ERROR2("Failed to read file " + filename, INVALIDINPUT);

    if(peptides.empty())
        throw MYRUNTIME_ERROR2("No peptides in file " + filename, INVALIDINPUT);

    return peptides;
}
