/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __platform_h__
#define __platform_h__

#if defined(WIN32) || defined(_WIN32) || defined(WIN64) || defined(_WIN64)
#   error "POSIX process control (fork, execvp, waitpid) is required."
#endif

#define DIRSEP      '/'
#define DIRSEPSTR   "/"
#define NL          "\n"

#define UPDIR ".."

//null device for discarded process streams
#define DEVNULL     "/dev/null"

//temporary directory used when neither option nor environment give one
#define DEFTMPDIR   "/tmp"
#define TMPDIRENV   "TMPDIR"

#endif//__platform_h__
