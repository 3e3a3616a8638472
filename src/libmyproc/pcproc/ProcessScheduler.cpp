/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include "libutil/mybase.h"

#include <stdio.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "libutil/mptimer.h"
#include "AsyncProcess.h"
#include "ProcessScheduler.h"

// -------------------------------------------------------------------------
// constructor
//
ProcessScheduler::ProcessScheduler( int processlimit, int pollinterval, bool capturestderr )
:   processlimit_(processlimit),
    pollinterval_(pollinterval),
    capturestderr_(capturestderr),
    maxactive_(0),
    nstarted_(0),
    ncompleted_(0)
{
    MYMSG("ProcessScheduler::ProcessScheduler", 4);
    if(pollinterval_ < 1 || MAXPOLLINTERVAL < pollinterval_)
        throw MYRUNTIME_ERROR2("ProcessScheduler: Invalid poll interval.", CONFIGURATION);
}

// destructor: processes still in the active set are reaped by their
// destructors
//
ProcessScheduler::~ProcessScheduler()
{
    MYMSG("ProcessScheduler::~ProcessScheduler", 4);
}

// -------------------------------------------------------------------------
// GetCapacity: maximum number of processes running at once
//
size_t ProcessScheduler::GetCapacity( int processlimit, size_t ncommands )
{
    if(processlimit == 0)
        return PCMAX(ncommands, (size_t)1);
    if(processlimit < 0) {
        size_t ncpus = std::thread::hardware_concurrency();
        return PCMAX(ncpus, (size_t)1);
    }
    return (size_t)processlimit;
}

// -------------------------------------------------------------------------
// RunAll: run all commands, blocking until each of them has completed or
// one of them has failed
//
void ProcessScheduler::RunAll( const std::vector<ProcessCommand>& commands )
{
    MYMSG("ProcessScheduler::RunAll", 3);

    myruntime_error mre;
    myprocess_error mpe;
    MyMpTimer<> timer(true);
    const size_t capacity = GetCapacity(processlimit_, commands.size());

    MYMSGBEGl(3)
        char msgbuf[BUF_MAX];
        sprintf(msgbuf, "ProcessScheduler::RunAll: %zu commands; capacity %zu",
            commands.size(), capacity);
        MYMSG(msgbuf, 3);
    MYMSGENDl

    try {
        for(const ProcessCommand& cmd: commands) {
            while(capacity <= active_.size()) {
                if(ReapFinished() < 1)
                    SleepPollInterval();
            }
            StartCommand(cmd);
        }
    } catch(myprocess_error const& ex) {
        mpe = ex;
    } catch(myexception const& ex) {
        mre = ex;
    } catch(std::exception const& ex) {
        mre = MYRUNTIME_ERROR(std::string("ProcessScheduler::RunAll: ") + ex.what());
    }

    //all children are reaped whatever happened
    Drain(&mpe, &mre);

    timer.Stop();

    if(mpe.isset())
        throw mpe;

    if(mre.isset())
        throw mre;

    MYMSGBEGl(1)
        char msgbuf[BUF_MAX];
        sprintf(msgbuf, "Ran %zu commands in %0.4f seconds",
            commands.size(), timer.GetElapsedTime());
        MYMSG(msgbuf, 1);
    MYMSGENDl
}

// -------------------------------------------------------------------------
// StartCommand: start a process and add it to the active set
//
void ProcessScheduler::StartCommand( const ProcessCommand& command )
{
    MYMSGBEGl(2)
        MYMSG(("Running: " + argv_string(command.argv_)).c_str(), 2);
    MYMSGENDl

    std::unique_ptr<AsyncProcess> process(
        new AsyncProcess(command.argv_, command.outputfile_, capturestderr_));
    process->Start();
    active_.push_back(std::move(process));
    nstarted_++;
    maxactive_ = PCMAX(maxactive_, active_.size());
}

// -------------------------------------------------------------------------
// ReapFinished: poll the active set, remove processes that have exited;
// returns the number of reaped processes; throws on a failed process
//
size_t ProcessScheduler::ReapFinished()
{
    size_t nreaped = 0;
    for(auto it = active_.begin(); it != active_.end();) {
        if(!(*it)->Poll()) {
            ++it;
            continue;
        }
        std::unique_ptr<AsyncProcess> process = std::move(*it);
        it = active_.erase(it);
        nreaped++;
        ncompleted_++;
        CheckExitCode(*process);
    }
    return nreaped;
}

// -------------------------------------------------------------------------
// CheckExitCode: throw if the process did not exit with code 0
//
void ProcessScheduler::CheckExitCode( const AsyncProcess& process ) const
{
    int code = process.GetExitCode();
    if(code == 0)
        return;
    char msgbuf[BUF_MAX];
    if(code == EXITCODE_EXECFAILED)
        sprintf(msgbuf, " exited with code %d (program not found or not executable?)", code);
    else if(EXITCODE_SIGNALBASE < code)
        sprintf(msgbuf, " terminated by signal %d", code - EXITCODE_SIGNALBASE);
    else
        sprintf(msgbuf, " exited with code %d", code);
    throw MYPROCESS_ERROR(
        "Command '" + argv_string(process.GetArgv()) + "'" + msgbuf,
        process.GetProgram(), code);
}

// -------------------------------------------------------------------------
// Drain: wait for every running process; the first failure is recorded
// unless an error has already been recorded
//
void ProcessScheduler::Drain( myprocess_error* mpe, myruntime_error* mre )
{
    MYMSG("ProcessScheduler::Drain", 4);

    for(std::unique_ptr<AsyncProcess>& process: active_) {
        bool errorset = (mpe && mpe->isset()) || (mre && mre->isset());
        try {
            process->Wait();
            ncompleted_++;
            if(!errorset)
                CheckExitCode(*process);
        } catch(myprocess_error const& ex) {
            if(mpe && !errorset) *mpe = ex;
        } catch(myexception const& ex) {
            if(mre && !errorset) *mre = ex;
            else warning(myruntime_error(ex).pretty_format().c_str());
        }
    }
    active_.clear();
}

// -------------------------------------------------------------------------
// SleepPollInterval: pause between polls of the active set
//
void ProcessScheduler::SleepPollInterval() const
{
    std::this_thread::sleep_for(std::chrono::milliseconds(pollinterval_));
}
