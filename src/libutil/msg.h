/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __msg_h__
#define __msg_h__

#include <stdio.h>
#include <string>
#include <vector>
#include <chrono>

#if 1//def __DEBUG__
#define MYMSGnonl(CSTR,lev) message(CSTR,false,lev)
#define MYMSG(CSTR,lev) message(CSTR,true,lev)
#define MYMSGBEGl(lvl) if(lvl<=VERBOSE){
#define MYMSGENDl }
#define MYMSGBEG if(1){
#define MYMSGEND }
#else
#define MYMSGnonl(ARG,lev)
#define MYMSG(ARG,lev)
#define MYMSGBEGl(lvl) if(0){
#define MYMSGENDl }
#define MYMSGBEG if(0){
#define MYMSGEND }
#endif

// global variables used
extern const char*  PROGNAME;
extern const char*  PROGVERSION;

extern int*         __PARGC__;
extern char***      __PARGV__;

extern int          VERBOSE;
extern bool         WARNINGSRECORDED;

extern const
std::chrono::high_resolution_clock::time_point mbSTART;

// set global variables
void SetVerboseMode( int );
void SetProgramName( const char* name, const char* version = NULL );
void SetArguments( int* pargc, char*** pargv );

// messaging...
void error( const char*, bool = true );
void warning( const char*, bool = true, int minlevel = 1 );
void checkforwarnings();
void message( const char*, bool = true, int minlevel = 1  );
void progname_and_version( FILE* );
std::string cmdline_string();
void print_dtime(int minlevel);

// string
std::string usage( const char* progname, const char* instructions, const char* version, const char* date );
std::string argv_string( const std::vector<std::string>& argv );

// path processing
const char* my_basename( const char* );

#endif//__msg_h__
