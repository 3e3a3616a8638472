/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include <unistd.h>
#include <sys/types.h>

#include <stdio.h>
#include <string.h>
#include <time.h>

#include <string>
#include <vector>
#include <chrono>

#include "platform.h"
#include "myexception.h"
#include "mylimits.h"
#include "msg.h"

const
std::chrono::high_resolution_clock::time_point mbSTART =
std::chrono::high_resolution_clock::now();

const char* PROGNAME = NULL;
const char* PROGVERSION = NULL;

int*        __PARGC__ = NULL;
char***     __PARGV__ = NULL;

int         VERBOSE = 0;
bool        WARNINGSRECORDED = false;
bool        ERRORSRECORDED = false;

// -------------------------------------------------------------------------
// set global variables
//
void SetProgramName( const char* name, const char* version )
{
    PROGNAME = my_basename( name );
    if( version )
        PROGVERSION = version;
}

void SetArguments( int* pargc, char*** pargv )
{
    __PARGC__ = pargc;
    __PARGV__ = pargv;
}

void SetVerboseMode( int value )
{
    VERBOSE = value;
}

// -------------------------------------------------------------------------
// messaging routines
//
void error( const char* str, bool putnl )
{
    ERRORSRECORDED = true;
    if(str && PROGNAME && putnl)
        fprintf( stderr, "[%s] ERROR: %s%s%s", PROGNAME, str, NL, NL);
    else if(str && PROGNAME)
        fprintf( stderr, "[%s] ERROR: %s%s", PROGNAME, str, NL);
    else if(str && putnl)
        fprintf( stderr, "ERROR: %s%s%s", str, NL, NL);
    else if(str)
        fprintf( stderr, "ERROR: %s%s", str, NL);
}

void warning( const char* str, bool putnl, int/* minlevel*/)
{
    WARNINGSRECORDED = true;
    if(str && PROGNAME && putnl)
        fprintf( stderr, "[%s] WARNING: %s%s%s", PROGNAME, str, NL, NL);
    else if(str && PROGNAME)
        fprintf( stderr, "[%s] WARNING: %s%s", PROGNAME, str, NL);
    else if(str && putnl)
        fprintf( stderr, "WARNING: %s%s%s", str, NL, NL);
    else if(str)
        fprintf( stderr, "WARNING: %s%s", str, NL);
}

void checkforwarnings()
{
    if( !WARNINGSRECORDED && !ERRORSRECORDED)
        return;
    if(PROGNAME)
        fprintf( stderr, "%s[%s] There are %s.%s", NL, PROGNAME,
                ERRORSRECORDED? "ERRORS": "WARNINGS", NL);
    else
        fprintf( stderr, "%sThere are %s.%s", NL,
                ERRORSRECORDED? "ERRORS": "WARNINGS", NL);
}

// message: print a message with the time elapsed since program start and
// the id of the process issuing it
//
void message( const char* str, bool putnl, int minlevel )
{
    if( VERBOSE < minlevel )
        return;

    std::chrono::high_resolution_clock::time_point tnow =
    std::chrono::high_resolution_clock::now();

    std::chrono::duration<double> elpsd = tnow - mbSTART;

    const long pid = (long)getpid();

    if(str && PROGNAME && putnl)
        fprintf( stderr, "[%s] {%.6fs} (%ld) %s%s%s", PROGNAME, elpsd.count(),
                pid, str, NL, NL);
    else if(str && PROGNAME)
        fprintf( stderr, "[%s] {%.6fs} (%ld) %s%s", PROGNAME, elpsd.count(),
                pid, str, NL);
    else if(str && putnl)
        fprintf( stderr, "{%.6fs} (%ld) %s%s%s", elpsd.count(),
                pid, str, NL, NL);
    else if(str)
        fprintf( stderr, "{%.6fs} (%ld) %s%s", elpsd.count(),
                pid, str, NL);
}

void progname_and_version( FILE* fp )
{
    if( PROGNAME )
        fprintf( fp, "%s", PROGNAME );
    if( PROGVERSION )
        fprintf( fp, " %s", PROGVERSION );
    if( PROGNAME || PROGVERSION )
        fprintf( fp, "%s%s", NL, NL );
}

// -------------------------------------------------------------------------
// cmdline_string: the program's command line as a string
//
std::string cmdline_string()
{
    std::string cmdline;
    if(__PARGV__ && __PARGC__  && *__PARGV__) {
        for(int n = 0; n < *__PARGC__; n++) {
            if(n) cmdline += " ";
            cmdline += (*__PARGV__)[n];
        }
    }
    return cmdline;
}

// -------------------------------------------------------------------------
// print_dtime: print date and local time
//
void print_dtime(int minlevel)
{
    if( VERBOSE < minlevel )
        return;
    char tmstr[BUF_MAX];
    time_t t = time(NULL);
    struct tm* ctm = localtime(&t);
    if( ctm ) {
        if( strftime(tmstr, sizeof(tmstr), "%c", ctm) != 0) {
            if(PROGNAME)
                fprintf(stderr,"[%s] %s%s%s", PROGNAME, tmstr,NL,NL);
            else
                fprintf(stderr,"%s%s%s", tmstr,NL,NL);
        }
    }
}

// -------------------------------------------------------------------------
// path-processing functions
//
const char* my_basename( const char* name )
{
    const char* bp = NULL;
    if( name )
        for(bp  = name + strlen( name );
            bp != name && bp[-1] != DIRSEP;
            bp-- );
    return  bp;
}

// -------------------------------------------------------------------------
// usage: returns <instructions> translated by appropriately inserting
//     program name, version, and date information
//
std::string usage( const char* path, const char* instructions, const char* version, const char* date )
{
    size_t pos;
    std::string instr = instructions;
    std::string prog = path;
    std::string full;
    bool first = true;

    if(!path || !instructions )
        return instr;

    if((pos = prog.rfind( DIRSEP )) != std::string::npos){
        prog = prog.substr( pos+1 );
    }

    full = prog + std::string(" ");

    if(version && strlen( version ))
        full += version;

    if(date && strlen( date ))
        full += std::string(" (" ) + date + std::string( ")");

    while((pos = instr.find("<>")) != std::string::npos){
        instr.erase( pos, 2 );
        instr.insert( pos, first? full: prog );
        if( first )
            first = false;
    }

    while((pos = instr.find("-*")) != std::string::npos){
        instr.erase( pos, 2 );
        for( size_t len = full.length(); len; len-- )
            instr.insert( pos++, "-");
    }

    if((pos = instr.find("[]")) != std::string::npos){
        instr.erase(pos, 2);
        instr.insert(pos, "(POSIX multiprocessing build)");
    }

    return instr;
}

// -------------------------------------------------------------------------
// argv_string: join command arguments for printing; arguments containing
// blanks are quoted
//
std::string argv_string( const std::vector<std::string>& argv )
{
    std::string line;
    for(size_t n = 0; n < argv.size(); n++) {
        if(n) line += " ";
        if(argv[n].empty() || argv[n].find_first_of(" \t") != std::string::npos)
            line += "'" + argv[n] + "'";
        else
            line += argv[n];
    }
    return line;
}
