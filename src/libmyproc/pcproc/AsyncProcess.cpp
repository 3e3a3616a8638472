/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include "libutil/mybase.h"

#include <sys/types.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>

#include <string>
#include <vector>

#include "AsyncProcess.h"

// -------------------------------------------------------------------------
// constructor: argv[0] is the program name resolved through PATH
//
AsyncProcess::AsyncProcess(
    const std::vector<std::string>& argv,
    const std::string& outputfile,
    bool capturestderr )
:   argv_(argv),
    outputfile_(outputfile),
    capturestderr_(capturestderr),
    pid_(0),
    finished_(false),
    exitcode_(0)
{
    if(argv_.empty() || argv_[0].empty())
        throw MYRUNTIME_ERROR2("AsyncProcess: No program given.", CONFIGURATION);
    if(outputfile_.empty())
        throw MYRUNTIME_ERROR2("AsyncProcess: No output file given.", CONFIGURATION);
}

// destructor
//
AsyncProcess::~AsyncProcess()
{
    if(!IsStarted() || finished_)
        return;
    int status = 0;
    while(waitpid(pid_, &status, 0) < 0 && errno == EINTR);
    finished_ = true;
}

// -------------------------------------------------------------------------
// OpenOutput: create or truncate a file for a child's stream
//
int AsyncProcess::OpenOutput( const std::string& filename ) const
{
    int fd = open(filename.c_str(), O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC, 0644);
    if(fd < 0)
        throw MYRUNTIME_ERROR2(
        "AsyncProcess: Failed to open output file " + filename + ": " + strerror(errno),
        PROCESSFAILURE);
    return fd;
}

// -------------------------------------------------------------------------
// Start: fork and execute the program; a child that fails to execute the
// program exits with code EXITCODE_EXECFAILED
//
void AsyncProcess::Start()
{
    MYMSG("AsyncProcess::Start", 4);

    if(IsStarted())
        throw MYRUNTIME_ERROR("AsyncProcess::Start: Process already started.");

    //prepare everything the child needs before forking
    std::vector<char*> args;
    args.reserve(argv_.size() + 1);
    for(const std::string& arg: argv_)
        args.push_back(const_cast<char*>(arg.c_str()));
    args.push_back(NULL);

    int outfd = OpenOutput(outputfile_);
    int errfd = -1;
    int infd = -1;

    if(capturestderr_)
        errfd = open(GetErrorFile().c_str(), O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC, 0644);
    else
        errfd = open(DEVNULL, O_WRONLY|O_CLOEXEC);
    infd = open(DEVNULL, O_RDONLY|O_CLOEXEC);

    if(errfd < 0 || infd < 0) {
        int err = errno;
        close(outfd);
        if(0 <= errfd) close(errfd);
        if(0 <= infd) close(infd);
        throw MYRUNTIME_ERROR2(
        "AsyncProcess: Failed to open standard streams for " + argv_[0] + ": " + strerror(err),
        PROCESSFAILURE);
    }

    timer_.Start();

    pid_t pid = fork();

    if(pid == 0) {
        //child: async-signal-safe calls only
        if(dup2(infd, STDIN_FILENO) < 0 ||
           dup2(outfd, STDOUT_FILENO) < 0 ||
           dup2(errfd, STDERR_FILENO) < 0)
            _exit(EXITCODE_EXECFAILED);
        execvp(args[0], args.data());
        _exit(EXITCODE_EXECFAILED);
    }

    int err = errno;
    close(outfd);
    close(errfd);
    close(infd);

    if(pid < 0)
        throw MYRUNTIME_ERROR2(
        "AsyncProcess: Failed to create process for " + argv_[0] + ": " + strerror(err),
        PROCESSFAILURE);

    pid_ = pid;

    MYMSGBEGl(4)
        char msgbuf[BUF_MAX];
        sprintf(msgbuf, "AsyncProcess: pid %ld started", (long)pid_);
        MYMSG(msgbuf, 4);
    MYMSGENDl
}

// -------------------------------------------------------------------------
// Poll: check without blocking whether the process has exited; returns
// true if it has
//
bool AsyncProcess::Poll()
{
    if(finished_)
        return true;
    if(!IsStarted())
        throw MYRUNTIME_ERROR("AsyncProcess::Poll: Process not started.");

    int status = 0;
    pid_t ret;

    while((ret = waitpid(pid_, &status, WNOHANG)) < 0 && errno == EINTR);

    if(ret < 0)
        throw MYRUNTIME_ERROR2(
        "AsyncProcess::Poll: Failed to wait for " + argv_[0] + ": " + strerror(errno),
        PROCESSFAILURE);

    if(ret == 0)
        return false;

    SetFinished(status);
    return true;
}

// -------------------------------------------------------------------------
// Wait: block until the process exits; returns its exit code
//
int AsyncProcess::Wait()
{
    if(finished_)
        return exitcode_;
    if(!IsStarted())
        throw MYRUNTIME_ERROR("AsyncProcess::Wait: Process not started.");

    int status = 0;
    pid_t ret;

    while((ret = waitpid(pid_, &status, 0)) < 0 && errno == EINTR);

    if(ret < 0)
        throw MYRUNTIME_ERROR2(
        "AsyncProcess::Wait: Failed to wait for " + argv_[0] + ": " + strerror(errno),
        PROCESSFAILURE);

    SetFinished(status);
    return exitcode_;
}

// -------------------------------------------------------------------------
// SetFinished: record the termination status of the reaped child
//
void AsyncProcess::SetFinished( int status )
{
    timer_.Stop();
    finished_ = true;
    exitcode_ = TranslateStatus(status);

    MYMSGBEGl(2)
        char msgbuf[BUF_MAX];
        sprintf(msgbuf, "Process %ld exited with code %d after %.3fs",
            (long)pid_, exitcode_, timer_.GetElapsedTime());
        MYMSG(msgbuf, 2);
    MYMSGENDl
}

// -------------------------------------------------------------------------
// TranslateStatus: translate wait status to an exit code
//
int AsyncProcess::TranslateStatus( int status )
{
    if(WIFEXITED(status))
        return WEXITSTATUS(status);
    if(WIFSIGNALED(status))
        return EXITCODE_SIGNALBASE + WTERMSIG(status);
    return EXITCODE_SIGNALBASE;
}
