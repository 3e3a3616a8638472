/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include "libutil/mybase.h"

#include <string>

#include "ToolPresets.h"
#include "ToolSpec.h"

// -------------------------------------------------------------------------
// Validate: check the flag table and defaults; called before any process
// is started
//
void ToolSpec::Validate() const
{
    MYMSG("ToolSpec::Validate", 4);
    if(program_.empty())
        throw MYRUNTIME_ERROR2("ToolSpec: Program not specified: " + name_, CONFIGURATION);
    if(alleleflag_.empty())
        throw MYRUNTIME_ERROR2("ToolSpec: Allele flag not specified: " + name_, CONFIGURATION);
    if(minpeplength_ < 1)
        throw MYRUNTIME_ERROR2("ToolSpec: Invalid minimum peptide length: " + name_, CONFIGURATION);
    if(groupbylength_ && lengthflag_.empty())
        throw MYRUNTIME_ERROR2(
        "ToolSpec: Grouping by length requires a length flag: " + name_, CONFIGURATION);
    for(int len: peplengths_)
        if(len < minpeplength_)
            throw MYRUNTIME_ERROR2(
            "ToolSpec: Default peptide length below minimum: " + name_, CONFIGURATION);
    for(const std::string& flag: extraflags_)
        if(flag.empty())
            throw MYRUNTIME_ERROR2("ToolSpec: Empty extra flag: " + name_, CONFIGURATION);
    for(const std::string& flag: peptidemodeflags_)
        if(flag.empty())
            throw MYRUNTIME_ERROR2("ToolSpec: Empty peptide-mode flag: " + name_, CONFIGURATION);
    parser_.Validate();
}

// -------------------------------------------------------------------------
// PrepareAlleleName: allele name as the tool expects it
//
std::string ToolSpec::PrepareAlleleName( const std::string& allele ) const
{
    if(allelehook_)
        return allelehook_(allele);
    return PrepareAlleleDefault(allele);
}
