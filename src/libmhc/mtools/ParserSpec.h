/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __ParserSpec_h__
#define __ParserSpec_h__

#include <functional>
#include <map>
#include <string>

// transform of a field: returns false if the field cannot be transformed
typedef std::function<bool(const std::string&, std::string*)> TFieldTransform;

// _________________________________________________________________________
// Struct ParserSpec
//
// description of one format of tabular output of the tools; column
// indices refer to the fields left after ignorable tokens are dropped
//
struct ParserSpec {
    ParserSpec()
    :   keyndx_(-1), offsetndx_(-1), peptidendx_(-1), allelendx_(-1),
        affinityndx_(-1), rankndx_(-1), scorendx_(-1),
        logscore_(true), scanforerror_(false)
    {}

    int GetMaxIndex() const;
    void Validate() const;

    std::string name_;//format name
    int keyndx_;//column of sequence keys
    int offsetndx_;//column of offsets
    int peptidendx_;//column of peptides
    int allelendx_;//column of alleles
    int affinityndx_;//column of affinities (IC50, nM); -1, none
    int rankndx_;//column of percentile ranks; -1, none
    //column of scores: log-scaled affinities when affinities are given,
    //a tool's own score (elution, stability) otherwise
    int scorendx_;
    bool logscore_;//scores are log-scaled affinities; affinities recoverable
    //token -> index (in the original list of tokens) at which it is ignored
    std::map<std::string,int> ignored_;
    //index in the original list of tokens -> transform
    std::map<int,TFieldTransform> transforms_;
    bool scanforerror_;//scan output for an error line before parsing
};

// transform of a 1-based position to a 0-based offset
bool TransformOneBasedOffset( const std::string& field, std::string* result );

#endif//__ParserSpec_h__
