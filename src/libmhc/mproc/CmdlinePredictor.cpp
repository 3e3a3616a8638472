/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include "libutil/mybase.h"

#include <stddef.h>

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "libutil/CLOptions.h"
#include "libmyproc/pcproc/AsyncProcess.h"
#include "libmyproc/pcproc/ProcessScheduler.h"
#include "libmyproc/pcutil/CleanupGuard.h"
#include "libmhc/mdats/AlleleNames.h"
#include "libmhc/mdats/InputPartitioner.h"
#include "libmhc/mdats/PredictionCollection.h"
#include "libmhc/mdats/SequenceReader.h"
#include "libmhc/mtools/ToolPresets.h"
#include "libmhc/mtools/ToolSpec.h"
#include "CommandBuilder.h"
#include "TableParser.h"
#include "ResultAggregator.h"
#include "CmdlinePredictor.h"

// -------------------------------------------------------------------------
// file-local helpers
//
namespace {
// whether the exit code means the program could not be run
inline bool failedtorun( int exitcode )
{
    return exitcode == EXITCODE_EXECFAILED || EXITCODE_SIGNALBASE < exitcode;
}

// append a string to the list unless it is already there
inline void pushunique( std::vector<std::string>& list, const std::string& str )
{
    if(std::find(list.begin(), list.end(), str) == list.end())
        list.push_back(str);
}
}//namespace

// -------------------------------------------------------------------------
// constructor: the tool description is validated; process options are
// taken from the command line unless they refer to the tool's defaults
//
CmdlinePredictor::CmdlinePredictor( const ToolSpec& tool )
:   builder_(tool),
    processlimit_(tool.processlimit_),
    pollinterval_(CLOptions::GetP_POLL_INTERVAL()),
    maxrecords_(tool.maxrecords_),
    capturestderr_(CLOptions::GetP_CAPTURE_STDERR() != 0),
    keeptemp_(CLOptions::GetP_KEEP_TEMP() != 0),
    temproot_(CLOptions::GetTemporaryDirectory()),
    supportedread_(false)
{
    MYMSG("CmdlinePredictor::CmdlinePredictor", 4);
    if(CLOptions::GetP_PROCESS_LIMIT() != CLOptions::pplPresetLimit)
        processlimit_ = CLOptions::GetP_PROCESS_LIMIT();
    if(0 < CLOptions::GetP_MAX_RECORDS())
        maxrecords_ = (size_t)CLOptions::GetP_MAX_RECORDS();
}

// -------------------------------------------------------------------------
// RunAndCapture: run a program to completion and read its output;
// output is discarded if `output' is NULL; returns the exit code
//
int CmdlinePredictor::RunAndCapture(
    const std::vector<std::string>& argv,
    const std::string& temproot,
    std::string* output )
{
    MYMSG("CmdlinePredictor::RunAndCapture", 4);

    if(output == NULL) {
        AsyncProcess process(argv, DEVNULL, false);
        process.Start();
        return process.Wait();
    }

    CleanupGuard guard;
    std::string dirname;

    if(mymkdtemp(temproot, "mhcbatch_probe_", &dirname) != 0)
        throw MYRUNTIME_ERROR2(
        "Failed to create a temporary directory under " + temproot, CONFIGURATION);
    guard.AddDirectory(dirname);

    AsyncProcess process(argv, dirname + DIRSEP + "output", false);
    process.Start();
    int exitcode = process.Wait();

    int code = read_file_contents(process.GetOutputFile().c_str(), *output);
    if(code != 0)
        throw MYRUNTIME_ERROR(
        std::string(TranslateReadError(code)) + ": " + process.GetOutputFile());

    return exitcode;
}

// -------------------------------------------------------------------------
// CheckToolAvailable: check that the tool can be run; its exit code is
// not checked, as the tools exit with an error when given no arguments
//
void CmdlinePredictor::CheckToolAvailable() const
{
    MYMSG("CmdlinePredictor::CheckToolAvailable", 3);
    const std::string& program = GetTool().program_;
    int exitcode = 0;
    try {
        exitcode = RunAndCapture(std::vector<std::string>(1, program), temproot_, NULL);
    } catch(myruntime_error const& ex) {
        throw MYRUNTIME_ERROR2(
        "Failed to run " + program + ": " + ex.what(), TOOLUNAVAILABLE);
    }
    if(failedtorun(exitcode))
        throw MYRUNTIME_ERROR2("Failed to run " + program, TOOLUNAVAILABLE);
}

// -------------------------------------------------------------------------
// DetectNetMHCVersion: name of the netMHC preset determined from the
// program's help output
//
std::string CmdlinePredictor::DetectNetMHCVersion( const std::string& program )
{
    MYMSG("CmdlinePredictor::DetectNetMHCVersion", 3);
    std::string preset = DetectNetMHCPreset(RunHelp(program));
    MYMSG(("Detected netMHC version: " + preset).c_str(), 1);
    return preset;
}

// -------------------------------------------------------------------------
// DetectNetMHCIIpanVersion: name of the netMHCIIpan preset determined from
// the program's help output
//
std::string CmdlinePredictor::DetectNetMHCIIpanVersion( const std::string& program )
{
    MYMSG("CmdlinePredictor::DetectNetMHCIIpanVersion", 3);
    std::string preset = DetectNetMHCIIpanPreset(RunHelp(program));
    MYMSG(("Detected netMHCIIpan version: " + preset).c_str(), 1);
    return preset;
}

// -------------------------------------------------------------------------
// RunHelp: help output of a program run with -h; stderr discarded
//
std::string CmdlinePredictor::RunHelp( const std::string& program )
{
    std::vector<std::string> argv;
    std::string output;
    argv.push_back(program);
    argv.push_back("-h");
    int exitcode = RunAndCapture(argv, CLOptions::GetTemporaryDirectory(), &output);
    if(failedtorun(exitcode))
        throw MYRUNTIME_ERROR2("Failed to run " + program, TOOLUNAVAILABLE);
    return output;
}

// -------------------------------------------------------------------------
// SupportedAlleles: alleles listed by the tool, normalized; names that
// cannot be normalized are skipped; read once
//
const std::set<std::string>& CmdlinePredictor::SupportedAlleles()
{
    MYMSG("CmdlinePredictor::SupportedAlleles", 3);

    if(supportedread_)
        return supported_;

    const ToolSpec& tool = GetTool();
    if(tool.listflag_.empty())
        throw MYRUNTIME_ERROR2(
        "Program " + tool.program_ + " does not list supported alleles", CONFIGURATION);

    std::vector<std::string> argv;
    std::string output;
    argv.push_back(tool.program_);
    argv.push_back(tool.listflag_);

    const std::string failure =
        "Failed to run " + tool.program_ + " " + tool.listflag_ +
        ". Possibly an incorrect executable version?";

    if(failedtorun(RunAndCapture(argv, temproot_, &output)))
        throw MYRUNTIME_ERROR2(failure, TOOLUNAVAILABLE);

    size_t p = 0;
    while(p < output.size()) {
        size_t e = output.find('\n', p);
        if(e == std::string::npos)
            e = output.size();
        std::vector<std::string> tokens = TableParser::Tokenize(output.substr(p, e - p));
        p = e + 1;
        if(tokens.empty() || tokens[0][0] == '#')
            continue;
        std::string normalized;
        if(AlleleNames::TryNormalize(tokens[0], &normalized))
            supported_.insert(normalized);
    }

    if(supported_.empty())
        throw MYRUNTIME_ERROR2(failure, TOOLUNAVAILABLE);

    MYMSGBEGl(2)
        char msgbuf[BUF_MAX];
        sprintf(msgbuf, "%zu allele(s) supported by %s", supported_.size(), tool.program_.c_str());
        MYMSG(msgbuf, 2);
    MYMSGENDl

    supportedread_ = true;
    return supported_;
}

// -------------------------------------------------------------------------
// SetAlleles: normalize and deduplicate alleles and check that the tool
// supports them
//
void CmdlinePredictor::SetAlleles( const std::vector<std::string>& alleles )
{
    MYMSG("CmdlinePredictor::SetAlleles", 3);
    const ToolSpec& tool = GetTool();
    std::vector<std::string> normalized;

    if(alleles.empty())
        throw MYRUNTIME_ERROR2("No alleles given", INVALIDINPUT);

    for(const std::string& allele: alleles)
        pushunique(normalized, AlleleNames::Normalize(allele));

    if(!tool.listflag_.empty()) {
        const std::set<std::string>& supported = SupportedAlleles();
        for(const std::string& allele: normalized)
            if(supported.find(allele) == supported.end())
                throw MYRUNTIME_ERROR2(
                "Allele " + allele + " not supported by " + tool.program_ +
                ". Run command " + tool.program_ + " " + tool.listflag_ +
                " to see a list of valid alleles", UNSUPPORTEDALLELE);
    }

    alleles_ = normalized;
}

// -------------------------------------------------------------------------
// MakeRunDirectory: create a private directory for the files of one
// prediction; the directory is registered with the guard
//
std::string CmdlinePredictor::MakeRunDirectory( CleanupGuard& guard ) const
{
    std::string dirname;
    if(!directory_exists(temproot_.c_str()))
        throw MYRUNTIME_ERROR2(
        "Directory for temporary files does not exist: " + temproot_, CONFIGURATION);
    if(mymkdtemp(temproot_, "mhcbatch_", &dirname) != 0)
        throw MYRUNTIME_ERROR2(
        "Failed to create a temporary directory under " + temproot_, CONFIGURATION);
    guard.AddDirectory(dirname);
    MYMSG(("Temporary directory: " + dirname).c_str(), 2);
    return dirname;
}

// -------------------------------------------------------------------------
// ValidateLengths: peptide lengths must not be shorter than the tool's
// minimum
//
void CmdlinePredictor::ValidateLengths( const std::vector<int>& lengths ) const
{
    if(lengths.empty())
        throw MYRUNTIME_ERROR2("No peptide lengths given", INVALIDINPUT);
    for(int len: lengths)
        if(len < GetTool().minpeplength_)
            throw MYRUNTIME_ERROR2(
            "Peptide length " + std::to_string(len) + " is below the minimum of " +
            std::to_string(GetTool().minpeplength_) + " for " + GetTool().name_,
            INVALIDINPUT);
}

// -------------------------------------------------------------------------
// Run: build commands for each input file, allele, and length, run them,
// and parse their outputs;
// lengths, peptide lengths of subsequences; ignored in peptide mode, where
// a length is given only for input files grouped by length
//
void CmdlinePredictor::Run(
    CleanupGuard& guard,
    const std::string& rundir,
    const std::vector<InputChunk>& chunks,
    const std::vector<int>& lengths,
    bool peptidemode,
    const std::map<std::string,std::string>* keymap,
    ResultAggregator& aggregator ) const
{
    MYMSG("CmdlinePredictor::Run", 3);

    const ToolSpec& tool = GetTool();
    std::vector<Invocation> invocations;
    std::vector<ProcessCommand> commands;

    for(size_t n = 0; n < chunks.size(); n++) {
        std::vector<int> chunklengths =
            peptidemode? std::vector<int>(1, chunks[n].length_): lengths;
        size_t m = 0;
        for(const std::string& allele: alleles_) {
            for(int len: chunklengths) {
                const std::string suffix = std::to_string(n) + "_" + std::to_string(m++);
                const std::string outputfile =
                    rundir + DIRSEP + tool.name_ + "_output_" + suffix;
                std::string tempdir;
                guard.AddFile(outputfile);
                if(capturestderr_)
                    guard.AddFile(outputfile + ".stderr");
                if(!tool.tempdirflag_.empty()) {
                    tempdir = rundir + DIRSEP + "tmp_" + suffix + "_" + tool.name_;
                    if(mymkdir(tempdir.c_str()) != 0)
                        throw MYRUNTIME_ERROR("Failed to create directory " + tempdir);
                    guard.AddDirectory(tempdir);
                }
                invocations.push_back(
                    builder_.MakeInvocation(
                        allele, len, chunks[n].filename_, outputfile, tempdir, peptidemode));
                commands.push_back(invocations.back().GetProcessCommand());
            }
        }
    }

    MYMSGBEGl(1)
        char msgbuf[BUF_MAX];
        sprintf(msgbuf, "Running %zu command(s) of %s", commands.size(), tool.program_.c_str());
        MYMSG(msgbuf, 1);
    MYMSGENDl

    ProcessScheduler scheduler(processlimit_, pollinterval_, capturestderr_);
    scheduler.RunAll(commands);

    TableParser parser(tool.parser_, tool.program_, tool.name_, keymap, !peptidemode);

    for(const Invocation& inv: invocations)
        aggregator.Add(parser.ParseFile(inv.outputfile_));

    if(parser.GetNDropped()) {
        MYMSGBEGl(2)
            char msgbuf[BUF_MAX];
            sprintf(msgbuf, "%zu row(s) dropped from the output of %s",
                parser.GetNDropped(), tool.program_.c_str());
            MYMSG(msgbuf, 2);
        MYMSGENDl
    }
}

// -------------------------------------------------------------------------
// PredictPeptides: predictions for a list of peptides and each allele
//
PredictionCollection CmdlinePredictor::PredictPeptides( const std::vector<std::string>& peptides )
{
    MYMSG("CmdlinePredictor::PredictPeptides", 3);

    const ToolSpec& tool = GetTool();
    std::vector<std::string> unique;

    if(alleles_.empty())
        throw MYRUNTIME_ERROR2("CmdlinePredictor: Alleles not set", CONFIGURATION);
    if(peptides.empty())
        throw MYRUNTIME_ERROR2("No peptides given", INVALIDINPUT);

    for(const std::string& peptide: peptides) {
        if(!SequenceReader::IsValidSequence(peptide))
            throw MYRUNTIME_ERROR2("Invalid peptide: \"" + peptide + "\"", INVALIDINPUT);
        if((int)peptide.size() < tool.minpeplength_)
            throw MYRUNTIME_ERROR2(
            "Peptide " + peptide + " is shorter than the minimum length of " +
            std::to_string(tool.minpeplength_) + " for " + tool.name_, INVALIDINPUT);
        pushunique(unique, peptide);
    }

    CleanupGuard guard;
    guard.SetKeep(keeptemp_);

    std::string rundir = MakeRunDirectory(guard);

    InputPartitioner partitioner(rundir, maxrecords_, guard);
    partitioner.PartitionPeptides(unique, tool.groupbylength_);

    ResultAggregator aggregator(tool.program_);
    Run(guard, rundir, partitioner.GetChunks(), std::vector<int>(), true, NULL, aggregator);

    return aggregator.Aggregate(unique, alleles_);
}

// -------------------------------------------------------------------------
// PredictSubsequences: predictions for all subsequences of the given
// lengths of each sequence and each allele
//
PredictionCollection CmdlinePredictor::PredictSubsequences(
    const std::vector<TNamedSequence>& sequences,
    const std::vector<int>& lengths )
{
    MYMSG("CmdlinePredictor::PredictSubsequences", 3);

    const ToolSpec& tool = GetTool();
    const std::vector<int>& peplengths = lengths.empty()? tool.peplengths_: lengths;
    std::vector<std::string> windows;

    if(alleles_.empty())
        throw MYRUNTIME_ERROR2("CmdlinePredictor: Alleles not set", CONFIGURATION);
    if(sequences.empty())
        throw MYRUNTIME_ERROR2("No sequences given", INVALIDINPUT);

    ValidateLengths(peplengths);

    for(const TNamedSequence& seq: sequences) {
        if(!SequenceReader::IsValidSequence(seq.second))
            throw MYRUNTIME_ERROR2("Invalid sequence " + seq.first, INVALIDINPUT);
        for(int len: peplengths)
            for(size_t p = 0; p + len <= seq.second.size(); p++)
                windows.push_back(seq.second.substr(p, len));
    }

    std::sort(windows.begin(), windows.end());
    windows.erase(std::unique(windows.begin(), windows.end()), windows.end());

    CleanupGuard guard;
    guard.SetKeep(keeptemp_);

    std::string rundir = MakeRunDirectory(guard);

    InputPartitioner partitioner(rundir, maxrecords_, guard);
    partitioner.PartitionSequences(sequences);

    ResultAggregator aggregator(tool.program_);
    Run(guard, rundir, partitioner.GetChunks(), peplengths, false,
        &partitioner.GetKeyMap(), aggregator);

    return aggregator.Aggregate(windows, alleles_);
}
