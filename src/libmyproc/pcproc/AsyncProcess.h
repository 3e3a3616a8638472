/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __AsyncProcess_h__
#define __AsyncProcess_h__

#include "libutil/mybase.h"

#include <sys/types.h>

#include <string>
#include <vector>

#include "libutil/mptimer.h"

// _________________________________________________________________________
// Class AsyncProcess
//
// external program run as a child process; stdout is redirected to a
// dedicated file, stderr is discarded or written to <outputfile>.stderr
//
class AsyncProcess
{
public:
    AsyncProcess(
        const std::vector<std::string>& argv,
        const std::string& outputfile,
        bool capturestderr );

    //reaps the child if it is still running
    ~AsyncProcess();

    AsyncProcess(const AsyncProcess&) = delete;
    AsyncProcess& operator=(const AsyncProcess&) = delete;

    void Start();
    bool Poll();
    int Wait();

    bool IsStarted() const { return 0 < pid_; }
    bool IsFinished() const { return finished_; }
    int GetExitCode() const { return exitcode_; }
    double GetElapsedTime() const { return timer_.GetElapsedTime(); }

    const std::vector<std::string>& GetArgv() const { return argv_; }
    const std::string& GetProgram() const { return argv_[0]; }
    const std::string& GetOutputFile() const { return outputfile_; }
    std::string GetErrorFile() const { return outputfile_ + ".stderr"; }

    static int TranslateStatus( int status );

protected:
    void SetFinished( int status );
    int OpenOutput( const std::string& filename ) const;

private:
    const std::vector<std::string> argv_;//program and its arguments
    const std::string outputfile_;//file of the child's stdout
    const bool capturestderr_;//write stderr to file
    pid_t pid_;//child process id
    bool finished_;//whether the child has been reaped
    int exitcode_;//exit code; 128+signal number for signal deaths
    MyMpTimer<> timer_;
};

#endif//__AsyncProcess_h__
