/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include "libutil/mybase.h"

#include <ctype.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <map>
#include <string>
#include <vector>

#include "libmyproc/pcutil/CleanupGuard.h"
#include "InputPartitioner.h"

// -------------------------------------------------------------------------
// constructor
//
InputPartitioner::InputPartitioner(
    const std::string& directory, size_t maxrecords, CleanupGuard& guard )
:   directory_(directory),
    maxrecords_(maxrecords),
    guard_(guard)
{
    MYMSG("InputPartitioner::InputPartitioner", 4);
    if(!directory_exists(directory_.c_str()))
        throw MYRUNTIME_ERROR("InputPartitioner: Directory does not exist: " + directory_);
}

// -------------------------------------------------------------------------
// MakeShortKey: make a key of at most MAXSHORTKEYLEN characters from the
// original key and its index; non-alphanumeric characters become `_'
//
std::string InputPartitioner::MakeShortKey( const std::string& key, size_t index )
{
    std::string sanitized = key;
    for(char& c: sanitized)
        if(!isalnum((unsigned char)c))
            c = '_';
    std::string ndxstr = std::to_string(index);
    size_t keep = (ndxstr.size() < MAXSHORTKEYLEN-1)? MAXSHORTKEYLEN-1 - ndxstr.size(): 0;
    return sanitized.substr(0, keep) + "_" + ndxstr;
}

// -------------------------------------------------------------------------
// PartitionSequences: write sequences in FASTA format; each record's key
// is replaced by a short key
//
void InputPartitioner::PartitionSequences( const std::vector<TNamedSequence>& sequences )
{
    MYMSG("InputPartitioner::PartitionSequences", 3);
    std::map<std::string,std::string>& keymap = keymap_;

    WriteChunks(sequences, 0,
        [&keymap](FILE* fp, const TNamedSequence& seq, size_t index) {
            std::string shortkey = MakeShortKey(seq.first, index);
            keymap[shortkey] = seq.first;
            return fprintf(fp, ">%s%s%s", shortkey.c_str(), NL, seq.second.c_str());
        });
}

// -------------------------------------------------------------------------
// PartitionPeptides: write peptides one per line, grouped by length if
// requested
//
void InputPartitioner::PartitionPeptides(
    const std::vector<std::string>& peptides, bool groupbylength )
{
    MYMSG("InputPartitioner::PartitionPeptides", 3);

    auto writer = [](FILE* fp, const std::string& peptide, size_t) {
        return fprintf(fp, "%s", peptide.c_str());
    };

    if(!groupbylength) {
        WriteChunks(peptides, 0, writer);
        return;
    }

    std::map<int,std::vector<std::string>> groups;
    for(const std::string& peptide: peptides)
        groups[(int)peptide.size()].push_back(peptide);

    for(const auto& group: groups)
        WriteChunks(group.second, group.first, writer);
}

// -------------------------------------------------------------------------
// WriteChunks: write records to files of at most maxrecords_ records;
// records within a file are separated by newlines; no newline follows
// the last record; writer(fp, record, index) writes one record;
// length, length of peptides in the records if they are grouped by length
//
template<typename T, typename F>
void InputPartitioner::WriteChunks(
    const std::vector<T>& records, int length, F writer )
{
    const size_t nrecs = records.size();
    const size_t perfile = maxrecords_? maxrecords_: nrecs;

    for(size_t beg = 0; beg < nrecs; beg += perfile) {
        size_t end = PCMIN(beg + perfile, nrecs);
        InputChunk chunk;
        std::string prefix = "input_file_" + std::to_string(chunks_.size()) + "_";
        if(length)
            prefix += "len" + std::to_string(length) + "_";
        FILE* fp = OpenChunk(prefix, &chunk.filename_);

        for(size_t n = beg; n < end; n++) {
            if(n > beg && fprintf(fp, "%s", NL) < 0)
                throw MYRUNTIME_ERROR(
                "InputPartitioner: Write to file failed: " + chunk.filename_);
            if(writer(fp, records[n], n) < 0)
                throw MYRUNTIME_ERROR(
                "InputPartitioner: Write to file failed: " + chunk.filename_);
        }

        CloseChunk(fp, chunk.filename_);

        chunk.nrecords_ = end - beg;
        chunk.length_ = length;
        chunks_.push_back(chunk);

        MYMSGBEGl(3)
            char msgbuf[BUF_MAX];
            sprintf(msgbuf, "InputPartitioner: %zu record(s) written", chunk.nrecords_);
            MYMSG(msgbuf, 3);
        MYMSGENDl
    }
}

// -------------------------------------------------------------------------
// OpenChunk: create a new uniquely named file; the file is registered
// with the guard at once
//
FILE* InputPartitioner::OpenChunk( const std::string& prefix, std::string* filename )
{
    std::string templ = directory_ + DIRSEP + prefix + "XXXXXX";
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back(0);

    int fd = mkstemp(buf.data());
    if(fd < 0)
        throw MYRUNTIME_ERROR(
        "InputPartitioner: Failed to create file " + templ + ": " + strerror(errno));

    *filename = buf.data();

    FILE* fp = fdopen(fd, "w");
    if(fp == NULL) {
        int err = errno;
        close(fd);
        guard_.AddFile(*filename);
        throw MYRUNTIME_ERROR(
        "InputPartitioner: Failed to open file " + *filename + ": " + strerror(err));
    }

    return guard_.AddHandle(fp, *filename);
}

// -------------------------------------------------------------------------
// CloseChunk: flush and close a file written
//
void InputPartitioner::CloseChunk( FILE* fp, const std::string& filename )
{
    if(ferror(fp))
        throw MYRUNTIME_ERROR("InputPartitioner: Write to file failed: " + filename);
    guard_.CloseHandle(fp);
}
