/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include "libutil/mybase.h"

#include <string>

#include "ParserSpec.h"

// -------------------------------------------------------------------------
// GetMaxIndex: largest column index of the required fields
//
int ParserSpec::GetMaxIndex() const
{
    int maxndx = PCMAX(keyndx_, offsetndx_);
    maxndx = PCMAX(maxndx, peptidendx_);
    maxndx = PCMAX(maxndx, allelendx_);
    maxndx = PCMAX(maxndx, affinityndx_);
    maxndx = PCMAX(maxndx, scorendx_);
    return PCMAX(maxndx, rankndx_);
}

// -------------------------------------------------------------------------
// Validate: check that all required columns are given
//
void ParserSpec::Validate() const
{
    if(keyndx_ < 0 || offsetndx_ < 0 || peptidendx_ < 0 || allelendx_ < 0 ||
       scorendx_ < 0)
        throw MYRUNTIME_ERROR2(
        "ParserSpec: Column index not specified for format " + name_, CONFIGURATION);
    if(affinityndx_ < -1 || rankndx_ < -1)
        throw MYRUNTIME_ERROR2(
        "ParserSpec: Invalid column index of affinities or ranks for format " + name_,
        CONFIGURATION);
    for(const auto& ign: ignored_)
        if(ign.first.empty() || ign.second < 0)
            throw MYRUNTIME_ERROR2(
            "ParserSpec: Invalid ignorable token for format " + name_, CONFIGURATION);
    for(const auto& trn: transforms_)
        if(trn.first < 0 || !trn.second)
            throw MYRUNTIME_ERROR2(
            "ParserSpec: Invalid field transform for format " + name_, CONFIGURATION);
}

// -------------------------------------------------------------------------
// TransformOneBasedOffset: decrement a 1-based position
//
bool TransformOneBasedOffset( const std::string& field, std::string* result )
{
    int value;
    if(result == NULL ||
       read_integer(field.c_str(), field.size(), &value, NULL) != 0)
        return false;
    *result = std::to_string(value - 1);
    return true;
}
