/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include "libutil/mybase.h"

#include <ctype.h>
#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include <cmath>
#include <limits>
#include <map>
#include <string>
#include <vector>

#include "libmhc/mdats/AlleleNames.h"
#include "libmhc/mdats/PredictionRecord.h"
#include "libmhc/mtools/ParserSpec.h"
#include "TableParser.h"

// -------------------------------------------------------------------------
// file-local helpers
//
namespace {
const char* gHeaderTokens[] = {
    "pos", "Pos", "Seq", "Number", "Protein", "Allele", "NetMHC", "Strong", "Identity"
};

inline std::string mytrim( const std::string& str )
{
    size_t beg = str.find_first_not_of(" \t\r\n");
    if(beg == std::string::npos)
        return std::string();
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(beg, end - beg + 1);
}

inline std::string mytoupper( std::string str )
{
    for(char& c: str) c = (char)toupper((unsigned char)c);
    return str;
}

// readintfield: read an integer occupying the whole field
inline bool readintfield( const std::string& field, int* value )
{
    size_t rbytes = 0;
    if(read_integer(field.c_str(), field.size(), value, &rbytes) != 0)
        return false;
    return rbytes == field.size();
}

// readdoublefield: read a real number occupying the whole field; a value
// out of the range of double is accepted as infinity or zero
inline bool readdoublefield( const std::string& field, double* value )
{
    size_t rbytes = 0;
    int code = read_double(field.c_str(), field.size(), value, &rbytes);
    if(code == 0)
        return rbytes == field.size();
    if(code != ERR_RD_INVL)
        return false;
    char* paux = NULL;
    errno = 0;
    double tmpval = strtod(field.c_str(), &paux);
    if(errno != ERANGE || paux == field.c_str() || *paux)
        return false;
    *value = tmpval;
    return true;
}

inline void droprow( const std::string& line, const char* reason )
{
    MYMSGBEGl(3)
        MYMSG(("TableParser: Row dropped (" + std::string(reason) + "): " + line).c_str(), 3);
    MYMSGENDl
}
}//namespace

// -------------------------------------------------------------------------
// constructor
//
TableParser::TableParser(
    const ParserSpec& spec,
    const std::string& toolname,
    const std::string& method,
    const std::map<std::string,std::string>* keymap,
    bool withkeys )
:   spec_(spec),
    toolname_(toolname),
    method_(method),
    keymap_(keymap),
    withkeys_(withkeys),
    ndropped_(0)
{
    MYMSG("TableParser::TableParser", 4);
    spec_.Validate();
}

// -------------------------------------------------------------------------
// IsHeaderLine: whether the line is a header line of a table
//
bool TableParser::IsHeaderLine( const std::string& line )
{
    for(const char* tkn: gHeaderTokens)
        if(line.compare(0, strlen(tkn), tkn) == 0)
            return true;
    return false;
}

// -------------------------------------------------------------------------
// Tokenize: split a line on runs of whitespace
//
std::vector<std::string> TableParser::Tokenize( const std::string& line )
{
    std::vector<std::string> tokens;
    size_t p = 0;
    for(;;) {
        p = line.find_first_not_of(" \t\r\n", p);
        if(p == std::string::npos)
            break;
        size_t e = line.find_first_of(" \t\r\n", p);
        if(e == std::string::npos)
            e = line.size();
        tokens.push_back(line.substr(p, e - p));
        p = e;
    }
    return tokens;
}

// -------------------------------------------------------------------------
// ParseFile: read a file and parse its contents
//
std::vector<PredictionRecord> TableParser::ParseFile( const std::string& filename ) const
{
    MYMSG(("TableParser::ParseFile: " + filename).c_str(), 3);
    std::string contents;
    int code = read_file_contents(filename.c_str(), contents);
    if(code != 0)
        throw MYRUNTIME_ERROR(
        std::string(TranslateReadError(code)) + ": " + filename);
    return Parse(contents);
}

// -------------------------------------------------------------------------
// Parse: parse the output of a tool; rows follow the first dashed line
//
std::vector<PredictionRecord> TableParser::Parse( const std::string& text ) const
{
    std::vector<PredictionRecord> records;
    bool intable = false;
    size_t p = 0;

    if(spec_.scanforerror_)
        ScanForError(text);

    while(p < text.size()) {
        size_t e = text.find('\n', p);
        if(e == std::string::npos)
            e = text.size();
        std::string line = mytrim(text.substr(p, e - p));
        p = e + 1;

        if(line.compare(0, 3, "---") == 0) {
            intable = true;
            continue;
        }
        if(!intable || line.empty() || line[0] == '#' || IsHeaderLine(line))
            continue;

        if(!ParseRow(line, records))
            ndropped_++;
    }

    MYMSGBEGl(3)
        char msgbuf[BUF_MAX];
        sprintf(msgbuf, "TableParser: %zu record(s) parsed", records.size());
        MYMSG(msgbuf, 3);
    MYMSGENDl

    return records;
}

// -------------------------------------------------------------------------
// ScanForError: throw if the tool has reported an error in its output
//
void TableParser::ScanForError( const std::string& text ) const
{
    size_t p = mytoupper(text).find("ERROR");
    if(p == std::string::npos)
        return;
    size_t e = text.find('\n', p);
    std::string line = mytrim(text.substr(p, (e == std::string::npos)? e: e - p));
    throw MYRUNTIME_ERROR2(toolname_ + " failed - " + line, PROCESSFAILURE);
}

// -------------------------------------------------------------------------
// CleanFields: drop ignorable tokens at their positions and transform
// fields; returns false if a transform fails
//
bool TableParser::CleanFields(
    const std::vector<std::string>& tokens, std::vector<std::string>* fields ) const
{
    fields->clear();
    for(size_t n = 0; n < tokens.size(); n++) {
        std::map<std::string,int>::const_iterator ign = spec_.ignored_.find(tokens[n]);
        if(ign != spec_.ignored_.end() && ign->second == (int)n)
            continue;
        std::map<int,TFieldTransform>::const_iterator trn = spec_.transforms_.find((int)n);
        if(trn == spec_.transforms_.end()) {
            fields->push_back(tokens[n]);
            continue;
        }
        std::string value;
        if(!trn->second(tokens[n], &value))
            return false;
        fields->push_back(value);
    }
    return true;
}

// -------------------------------------------------------------------------
// ResolveKey: original key of a short key
//
std::string TableParser::ResolveKey( const std::string& shortkey ) const
{
    if(keymap_ == NULL)
        return shortkey;
    std::map<std::string,std::string>::const_iterator it = keymap_->find(shortkey);
    if(it == keymap_->end())
        return shortkey;
    return it->second;
}

// -------------------------------------------------------------------------
// ParseRow: parse one row of a table; returns false if the row is dropped
//
bool TableParser::ParseRow( const std::string& line, std::vector<PredictionRecord>& records ) const
{
    std::vector<std::string> fields;
    int offset;
    double affinity = std::numeric_limits<double>::quiet_NaN();
    double score;
    double prank = std::numeric_limits<double>::quiet_NaN();

    if(!CleanFields(Tokenize(line), &fields)) {
        droprow(line, "transform failed");
        return false;
    }

    if((int)fields.size() <= spec_.GetMaxIndex()) {
        droprow(line, "missing columns");
        return false;
    }

    const std::string& fofs = fields[spec_.offsetndx_];
    const std::string& fscr = fields[spec_.scorendx_];

    if(!readintfield(fofs, &offset) ||
       !readdoublefield(fscr, &score) ||
       (0 <= spec_.affinityndx_ &&
        !readdoublefield(fields[spec_.affinityndx_], &affinity))) {
        droprow(line, "invalid number");
        return false;
    }

    if(0 <= spec_.rankndx_) {
        const std::string& frnk = fields[spec_.rankndx_];
        if(!readdoublefield(frnk, &prank)) {
            droprow(line, "invalid rank");
            return false;
        }
    }

    if(0 <= spec_.affinityndx_) {
        if((std::isnan(affinity) || !std::isfinite(affinity) || affinity < 0.0) &&
           spec_.logscore_ && std::isfinite(score))
            affinity = PredictionRecord::AffinityFromScore(score);

        if(std::isnan(affinity) || !PredictionRecord::IsValidAffinity(affinity)) {
            droprow(line, "invalid affinity");
            return false;
        }
    }

    if(!PredictionRecord::IsValidPercentileRank(prank)) {
        droprow(line, "rank out of range");
        return false;
    }

    std::string allele = fields[spec_.allelendx_];
    std::string normalized;
    if(AlleleNames::TryNormalize(allele, &normalized))
        allele = normalized;

    records.push_back(
        PredictionRecord(
            withkeys_? ResolveKey(fields[spec_.keyndx_]): std::string(), withkeys_,
            offset,
            fields[spec_.peptidendx_],
            allele,
            affinity,
            score,
            prank,
            method_));

    return true;
}
