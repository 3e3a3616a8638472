/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __CmdlinePredictor_h__
#define __CmdlinePredictor_h__

#include "libutil/mybase.h"

#include <stddef.h>

#include <map>
#include <set>
#include <string>
#include <vector>

#include "libmyproc/pcutil/CleanupGuard.h"
#include "libmhc/mdats/InputPartitioner.h"
#include "libmhc/mdats/PredictionCollection.h"
#include "libmhc/mtools/ToolSpec.h"
#include "CommandBuilder.h"
#include "ResultAggregator.h"

// _________________________________________________________________________
// Class CmdlinePredictor
//
// binding predictions by an external command-line tool: input files are
// written, the tool is run for every input file, allele, and length, and
// its outputs are parsed and validated; all temporary files of a
// prediction are removed when it finishes or fails
//
class CmdlinePredictor
{
public:
    explicit CmdlinePredictor( const ToolSpec& tool );

    void CheckToolAvailable() const;
    static std::string DetectNetMHCVersion( const std::string& program );
    static std::string DetectNetMHCIIpanVersion( const std::string& program );

    const std::set<std::string>& SupportedAlleles();

    void SetAlleles( const std::vector<std::string>& alleles );
    const std::vector<std::string>& GetAlleles() const { return alleles_; }

    PredictionCollection PredictPeptides( const std::vector<std::string>& peptides );
    PredictionCollection PredictSubsequences(
        const std::vector<TNamedSequence>& sequences,
        const std::vector<int>& lengths );

    const ToolSpec& GetTool() const { return builder_.GetTool(); }

    void SetProcessLimit( int value ) { processlimit_ = value; }
    int GetProcessLimit() const { return processlimit_; }
    void SetPollInterval( int value ) { pollinterval_ = value; }
    void SetMaxRecords( size_t value ) { maxrecords_ = value; }
    size_t GetMaxRecords() const { return maxrecords_; }
    void SetCaptureStderr( bool value ) { capturestderr_ = value; }
    void SetKeepTemp( bool value ) { keeptemp_ = value; }
    void SetTempRoot( const std::string& value ) { temproot_ = value; }
    const std::string& GetTempRoot() const { return temproot_; }

    static int RunAndCapture(
        const std::vector<std::string>& argv,
        const std::string& temproot,
        std::string* output );

protected:
    static std::string RunHelp( const std::string& program );

    std::string MakeRunDirectory( CleanupGuard& guard ) const;

    void Run(
        CleanupGuard& guard,
        const std::string& rundir,
        const std::vector<InputChunk>& chunks,
        const std::vector<int>& lengths,
        bool peptidemode,
        const std::map<std::string,std::string>* keymap,
        ResultAggregator& aggregator ) const;

    void ValidateLengths( const std::vector<int>& lengths ) const;

private:
    const CommandBuilder builder_;//builder of the tool's commands
    int processlimit_;//limit on concurrent processes
    int pollinterval_;//poll interval (ms)
    size_t maxrecords_;//maximum number of records per input file
    bool capturestderr_;//write stderr of the tool to files
    bool keeptemp_;//keep temporary files
    std::string temproot_;//directory for temporary files
    std::vector<std::string> alleles_;//normalized alleles
    std::set<std::string> supported_;//alleles supported by the tool
    bool supportedread_;//whether supported alleles have been read
};

#endif//__CmdlinePredictor_h__
