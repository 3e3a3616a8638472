/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __ToolSpec_h__
#define __ToolSpec_h__

#include <stddef.h>

#include "libutil/mylimits.h"

#include <functional>
#include <string>
#include <vector>

#include "ParserSpec.h"

// preparation of a normalized allele name for a tool's command line
typedef std::function<std::string(const std::string&)> TAlleleNameHook;

// _________________________________________________________________________
// Struct ToolSpec
//
// description of one tool family and version: its command-line flags,
// the format of its output, and defaults of a run;
// an empty flag means the tool does not take the argument; an empty
// input flag means the input file is given as a positional argument
//
struct ToolSpec {
    ToolSpec()
    :   processlimit_(0), minpeplength_(1), maxrecords_(DEFMAXRECORDSPERFILE),
        groupbylength_(false)
    {}

    void Validate() const;
    std::string PrepareAlleleName( const std::string& allele ) const;

    std::string name_;//preset name
    std::string program_;//program name or path
    std::string listflag_;//flag to list supported alleles
    std::string inputflag_;//flag of input file
    std::string lengthflag_;//flag of peptide length
    std::string alleleflag_;//flag of allele
    std::string tempdirflag_;//flag of temporary directory
    std::vector<std::string> extraflags_;//flags appended to every command
    std::vector<std::string> peptidemodeflags_;//flags of peptide-list input
    TAlleleNameHook allelehook_;//allele name preparation; NULL, default
    ParserSpec parser_;//output format
    int processlimit_;//default limit on concurrent processes
    std::vector<int> peplengths_;//default peptide lengths
    int minpeplength_;//minimum peptide length accepted
    size_t maxrecords_;//maximum number of records per input file
    bool groupbylength_;//group peptide lists by length
};

#endif//__ToolSpec_h__
