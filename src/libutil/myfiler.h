/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __myfiler_h__
#define __myfiler_h__

#include <stdio.h>
#include <string>

#include <sys/types.h>
#include <sys/stat.h>
#include "platform.h"

// file/directory routines
bool file_exists( const char*, mode_t mode = S_IFREG );
inline
bool directory_exists( const char* pathname ) {
    return file_exists( pathname, S_IFDIR );
}
int file_size(const char*, size_t*);
int mymkdir(const char* pathname);
int mymkdtemp(const std::string& parent, const std::string& prefix, std::string* dirname);
int myremove(const char* pathname);
int myrmtree(const char* pathname);

int read_file_contents( const char* filename, std::string& contents );

int read_double( const char* readfrom, size_t readlen, double* membuf, size_t* rbytes );
int read_integer( const char* readfrom, size_t readlen, int* membuf, size_t* rbytes );

#define ERR_RD_MACC ( 115 )
#define ERR_RD_NOVL ( 117 )
#define ERR_RD_INVL ( 119 )
#define ERR_RI_MACC ( 131 )
#define ERR_RI_NOVL ( 133 )
#define ERR_RI_INVL ( 135 )
#define ERR_RF_OPEN ( 171 )
#define ERR_RF_READ ( 173 )

//error messages
inline const char* TranslateReadError( int code )
{
    switch( code ) {
        case 0: return "OK";
        case ERR_RD_MACC: return "read_double: Memory access error";
        case ERR_RD_NOVL: return "read_double: No double value read";
        case ERR_RD_INVL: return "read_double: Invalid double value";
        case ERR_RI_MACC: return "read_integer: Memory access error";
        case ERR_RI_NOVL: return "read_integer: No integer read";
        case ERR_RI_INVL: return "read_integer: Invalid integer value";
        case ERR_RF_OPEN: return "read_file_contents: Failed to open file";
        case ERR_RF_READ: return "read_file_contents: Reading error";
    }
    return "Unknown";
}

#endif//__myfiler_h__
