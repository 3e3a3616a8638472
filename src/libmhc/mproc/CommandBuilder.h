/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __CommandBuilder_h__
#define __CommandBuilder_h__

#include "libutil/mybase.h"

#include <string>
#include <vector>

#include "libmyproc/pcproc/ProcessScheduler.h"
#include "libmhc/mtools/ToolSpec.h"

// one invocation of a tool
struct Invocation {
    std::vector<std::string> argv_;//program and arguments
    std::string outputfile_;//file of the tool's output
    std::string tempdir_;//temporary directory of the tool; empty, none

    ProcessCommand GetProcessCommand() const {
        return ProcessCommand(outputfile_, argv_);
    }
};

// _________________________________________________________________________
// Class CommandBuilder
//
// builds command lines of a tool from its flag table
//
class CommandBuilder
{
public:
    explicit CommandBuilder( const ToolSpec& tool );

    std::vector<std::string> Build(
        const std::string& allele,
        int length,
        const std::string& inputfile,
        const std::string& tempdir,
        bool peptidemode ) const;

    Invocation MakeInvocation(
        const std::string& allele,
        int length,
        const std::string& inputfile,
        const std::string& outputfile,
        const std::string& tempdir,
        bool peptidemode ) const;

    const ToolSpec& GetTool() const { return tool_; }

private:
    const ToolSpec tool_;//tool description
};

#endif//__CommandBuilder_h__
