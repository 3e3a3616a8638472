/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include <stdlib.h>

#include <string>

#include "mybase.h"
#include "CLOptions.h"

using namespace CLOptions;

// =========================================================================
// MACROs
//
#define CLDEFINEASSIGNMENT( NAME, TYPE, DEFVALUE, COND, OPTNAME ) \
  TYPE CLOptions::val##NAME##_ = DEFVALUE; \
  void CLOptions::AssignCLOpt##NAME( TYPE newvalue ) { \
    TYPE value = newvalue; \
    if(!( COND )) \
        throw MYRUNTIME_ERROR2(("Invalid command-line option " TOSTR(OPTNAME)), CONFIGURATION); \
    val##NAME##_ = value; \
  }

// -------------------------------------------------------------------------
// command-line options for the main program
//
CLDEFINEASSIGNMENT( P_PROCESS_LIMIT, int, pplPresetLimit, value>=pplPresetLimit, --process-limit);
CLDEFINEASSIGNMENT( P_POLL_INTERVAL, int, DEFPOLLINTERVAL, value>=1 && value<=MAXPOLLINTERVAL, --poll-interval);
CLDEFINEASSIGNMENT( P_MAX_RECORDS, int, 0, value>=0, --max-records-per-file);
CLDEFINEASSIGNMENT( P_CAPTURE_STDERR, int, 0, value==0 || value==1, --capture-stderr);
CLDEFINEASSIGNMENT( P_KEEP_TEMP, int, 0, value==0 || value==1, --keep-temp);
CLDEFINEASSIGNMENT( P_TMPDIR, std::string, "", 1, --tmpdir);
CLDEFINEASSIGNMENT( O_PRECISION, int, 4, value>=0 && value<=MAXOUTPUTPRECISION, --precision);

// -------------------------------------------------------------------------
// GetTemporaryDirectory: directory under which temporary files are created
//
std::string CLOptions::GetTemporaryDirectory()
{
    if(!valP_TMPDIR_.empty())
        return valP_TMPDIR_;
    const char* envdir = getenv(TMPDIRENV);
    if(envdir && *envdir)
        return envdir;
    return DEFTMPDIR;
}
