/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __mylimits_h__
#define __mylimits_h__

//1024
#define ONEK       1024

#ifndef INT_MAX
#   define INT_MAX 2147483647
#endif

// default size for a short string
#define BUF_MAX     256

// maximum length of a record key written to tool input files;
// tools truncate longer names in their output
#define MAXSHORTKEYLEN  15

// default maximum number of records per tool input file
#define DEFMAXRECORDSPERFILE 10000

// default interval (ms) between polls of running processes
#define DEFPOLLINTERVAL 1000

// maximum poll interval (ms)
#define MAXPOLLINTERVAL 60000

// base of the log-scaled affinity: score = 1 - log_base(affinity)
#define AFFINITYLOGBASE 50000.0

// range of percentile ranks
#define PERCENTILERANK_MIN 0.0
#define PERCENTILERANK_MAX 100.0

// exit code of a child process that could not execute its program
#define EXITCODE_EXECFAILED 127
// exit code base for a child process killed by a signal
#define EXITCODE_SIGNALBASE 128

// maximum number of fractional digits in output
#define MAXOUTPUTPRECISION 12

#endif//__mylimits_h__
