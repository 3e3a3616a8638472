/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include <sys/types.h>
#include <sys/stat.h>
#include <dirent.h>
#include <unistd.h>

#include <limits.h>
#include <string.h>
#include <stdlib.h>
#include <errno.h>

#include <string>
#include <memory>
#include <vector>

#include "platform.h"
#include "mylimits.h"
#include "myfiler.h"

// -------------------------------------------------------------------------
// file_exists: check if file exists; return true if it does
//
bool file_exists( const char* name, mode_t mode )
{
    struct stat info;
    bool exists = false;

    if( name ) {
        if( stat( name, &info ) < 0 ) {
            errno = 0;//reset error
            return exists;
        }

        if(( S_IFMT & info.st_mode ) == mode )
            exists = true;
    }

    return exists;
}

// -------------------------------------------------------------------------
// file_size: get the file size for a given filename
//
int file_size(const char* filename, size_t* size)
{
    struct stat info;
    int retcode = -1;

    if(filename) {
        if((retcode = stat(filename, &info)) < 0) {
            errno = 0;//reset error
            return retcode;
        }

        //NOTE: no check of valid address
        *size = (size_t)info.st_size;
    }

    return retcode;
}

// -------------------------------------------------------------------------
// mymkdir: make a directory; returns -1 on error;
//
int mymkdir(const char* pathname)
{
    return mkdir(pathname, 0775/*mode*/);
}

// -------------------------------------------------------------------------
// mymkdtemp: make a uniquely named directory accessible to the owner only
// under directory `parent'; the name begins with `prefix';
// returns -1 on error;
//
int mymkdtemp(const std::string& parent, const std::string& prefix, std::string* dirname)
{
    if(!dirname)
        return -1;
    std::string templ = parent;
    if(!templ.empty() && templ[templ.size()-1] != DIRSEP)
        templ += DIRSEP;
    templ += prefix + "XXXXXX";
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back(0);
    if(mkdtemp(buf.data()) == NULL)
        return -1;
    *dirname = buf.data();
    return 0;
}

// -------------------------------------------------------------------------
// myremove: remove a file; returns -1 on error;
//
int myremove(const char* pathname)
{
    if(!pathname)
        return -1;
    return unlink(pathname);
}

// -------------------------------------------------------------------------
// myrmtree: remove a directory with all its contents; symbolic links are
// removed, not followed; returns -1 if any of the entries could not be
// removed;
//
int myrmtree(const char* pathname)
{
    struct stat info;
    int retcode = 0;

    if(!pathname)
        return -1;

    if(lstat(pathname, &info) < 0)
        return -1;

    if(!S_ISDIR(info.st_mode))
        return unlink(pathname);

    {
        dirent* entry = NULL;
        std::unique_ptr<DIR,void(*)(DIR*)> direct(
            opendir(pathname),
            [](DIR* dp) {if(dp) closedir(dp);}
        );
        std::string dirname = std::string(pathname) + DIRSEP;

        if(!(direct))
            return -1;

        while((entry = readdir(direct.get())))
        {
            if(strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, UPDIR) == 0)
                continue;
            if(myrmtree((dirname + entry->d_name).c_str()) < 0)
                retcode = -1;
        }
    }

    if(rmdir(pathname) < 0)
        retcode = -1;

    return retcode;
}

// -------------------------------------------------------------------------
// read_file_contents: read the whole file into a string
//
int read_file_contents( const char* filename, std::string& contents )
{
    char locbuf[ONEK];
    size_t nread;

    contents.clear();

    std::unique_ptr<FILE,void(*)(FILE*)> fp(
        filename? fopen(filename, "r"): NULL,
        [](FILE* f) {if(f) fclose(f);}
    );

    if(!fp)
        return ERR_RF_OPEN;

    while((nread = fread(locbuf, 1, sizeof(locbuf), fp.get())) > 0)
        contents.append(locbuf, nread);

    if(ferror(fp.get()))
        return ERR_RF_READ;

    return 0;
}

// -------------------------------------------------------------------------
// read_double: read double value
//
int read_double( const char* readfrom, size_t readlen, double* membuf, size_t* rbytes )
{
    const char* p = readfrom;
    const char* pbeg = NULL;
    const char* pend = NULL;

    double      tmpval;
    char*       paux;

    if( !readfrom || !membuf )
        return( ERR_RD_MACC );

    for( pend = p + readlen; p < pend && ( *p == ' ' || *p == '\t' ); p++ );
    for( pbeg = p; p < pend &&
        *p && *p != ' ' && *p != '\t' &&
        *p != ';' && *p != ',' && *p != '(' && *p != ')' &&
        *p != '\n' && *p != '\r'; p++ );

    if( pbeg == p )
        return( ERR_RD_NOVL );

    std::string number( pbeg, size_t( p - pbeg ));

    errno = 0;//NOTE:
    tmpval = strtod( number.c_str(), &paux );

    if( errno || *paux )
        return( ERR_RD_INVL );

    *membuf = tmpval;

    if( rbytes )
        *rbytes = size_t( p - readfrom );

    return 0;
}

// -------------------------------------------------------------------------
// read_integer: read integer value
//
int read_integer( const char* readfrom, size_t readlen, int* membuf, size_t* rbytes )
{
    const char* p = readfrom;
    const char* pbeg = NULL;
    const char* pend = NULL;

    long        tmpval;
    char*       paux;

    if( !readfrom || !membuf )
        return( ERR_RI_MACC );

    for( pend = p + readlen; p < pend && ( *p == ' ' || *p == '\t' ); p++ );
    for( pbeg = p; p < pend &&
        *p && *p != ' ' && *p != '\t' &&
        *p != ';' && *p != '(' && *p != ')' &&
        *p != '\n' && *p != '\r'; p++ );

    if( p <= pbeg )
        return( ERR_RI_NOVL );

    std::string number( pbeg, size_t( p - pbeg ));

    errno = 0;//NOTE:
    tmpval = strtol( number.c_str(), &paux, 10 );

    if( errno || *paux || tmpval < -INT_MAX || INT_MAX < tmpval )
        return( ERR_RI_INVL );

    *membuf = (int)tmpval;

    if( rbytes )
        *rbytes = size_t( p - readfrom );

    return 0;
}
