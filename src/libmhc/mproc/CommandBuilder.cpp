/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include "libutil/mybase.h"

#include <string>
#include <vector>

#include "libmhc/mtools/ToolSpec.h"
#include "CommandBuilder.h"

// -------------------------------------------------------------------------
// constructor: the tool description is validated
//
CommandBuilder::CommandBuilder( const ToolSpec& tool )
:   tool_(tool)
{
    MYMSG("CommandBuilder::CommandBuilder", 4);
    tool_.Validate();
}

// -------------------------------------------------------------------------
// Build: make the command line for one input file and one allele;
// length, peptide length; <=0, not given;
// tempdir, temporary directory; empty, not given;
// peptidemode, the input file is a list of peptides
//
std::vector<std::string> CommandBuilder::Build(
    const std::string& allele,
    int length,
    const std::string& inputfile,
    const std::string& tempdir,
    bool peptidemode ) const
{
    std::vector<std::string> argv;

    argv.push_back(tool_.program_);

    if(peptidemode)
        argv.insert(argv.end(),
            tool_.peptidemodeflags_.begin(), tool_.peptidemodeflags_.end());

    argv.push_back(tool_.alleleflag_);
    argv.push_back(tool_.PrepareAlleleName(allele));

    if(0 < length && !tool_.lengthflag_.empty()) {
        argv.push_back(tool_.lengthflag_);
        argv.push_back(std::to_string(length));
    }

    if(!tempdir.empty() && !tool_.tempdirflag_.empty()) {
        argv.push_back(tool_.tempdirflag_);
        argv.push_back(tempdir);
    }

    argv.insert(argv.end(), tool_.extraflags_.begin(), tool_.extraflags_.end());

    if(!tool_.inputflag_.empty())
        argv.push_back(tool_.inputflag_);
    argv.push_back(inputfile);

    return argv;
}

// -------------------------------------------------------------------------
// MakeInvocation: make an invocation writing to the given output file
//
Invocation CommandBuilder::MakeInvocation(
    const std::string& allele,
    int length,
    const std::string& inputfile,
    const std::string& outputfile,
    const std::string& tempdir,
    bool peptidemode ) const
{
    Invocation inv;
    inv.argv_ = Build(allele, length, inputfile, tempdir, peptidemode);
    inv.outputfile_ = outputfile;
    if(!tool_.tempdirflag_.empty())
        inv.tempdir_ = tempdir;
    MYMSGBEGl(4)
        MYMSG(("CommandBuilder: " + argv_string(inv.argv_)).c_str(), 4);
    MYMSGENDl
    return inv;
}
