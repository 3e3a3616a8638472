/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __ProcessScheduler_h__
#define __ProcessScheduler_h__

#include "libutil/mybase.h"

#include <stddef.h>

#include <memory>
#include <string>
#include <vector>

#include "AsyncProcess.h"

// command to run: its stdout goes to outputfile_
struct ProcessCommand {
    ProcessCommand() {}
    ProcessCommand(const std::string& outputfile, const std::vector<std::string>& argv)
    :   outputfile_(outputfile), argv_(argv) {}
    std::string outputfile_;
    std::vector<std::string> argv_;
};

// _________________________________________________________________________
// Class ProcessScheduler
//
// runs a batch of commands as child processes with a bound on the number
// of processes running simultaneously; the first non-zero exit code
// stops submission of new commands; running processes are always waited
// for before the error propagates
//
class ProcessScheduler
{
public:
    ProcessScheduler( int processlimit, int pollinterval, bool capturestderr );
    ~ProcessScheduler();

    ProcessScheduler(const ProcessScheduler&) = delete;
    ProcessScheduler& operator=(const ProcessScheduler&) = delete;

    void RunAll( const std::vector<ProcessCommand>& commands );

    int GetProcessLimit() const { return processlimit_; }
    int GetPollInterval() const { return pollinterval_; }
    size_t GetMaxActive() const { return maxactive_; }
    size_t GetNStarted() const { return nstarted_; }
    size_t GetNCompleted() const { return ncompleted_; }

    static size_t GetCapacity( int processlimit, size_t ncommands );

protected:
    void StartCommand( const ProcessCommand& command );
    size_t ReapFinished();
    void CheckExitCode( const AsyncProcess& process ) const;
    void Drain( myprocess_error* mpe, myruntime_error* mre );
    void SleepPollInterval() const;

private:
    const int processlimit_;//0, unlimited; <0, #cpus; >0, maximum #processes
    const int pollinterval_;//interval (ms) between polls of the active set
    const bool capturestderr_;//write stderr of processes to files
    std::vector<std::unique_ptr<AsyncProcess>> active_;//processes running
    size_t maxactive_;//maximum size of the active set observed
    size_t nstarted_;//number of processes started
    size_t ncompleted_;//number of processes reaped
};

#endif//__ProcessScheduler_h__
