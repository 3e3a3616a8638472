/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include "libutil/mybase.h"

#include <errno.h>
#include <stdio.h>
#include <string.h>

#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "CleanupGuard.h"

// -------------------------------------------------------------------------
// constructors
//
CleanupGuard::CleanupGuard()
:   keep_(false),
    done_(false)
{
}

CleanupGuard::CleanupGuard(
    const std::vector<std::string>& files,
    const std::vector<std::string>& directories )
:   files_(files),
    directories_(directories),
    keep_(false),
    done_(false)
{
}

// destructor
//
CleanupGuard::~CleanupGuard()
{
    Cleanup();
}

// -------------------------------------------------------------------------
// AddHandle: take ownership of an open handle; the file it writes to is
// registered for removal; returns the handle; a NULL handle is not
// registered
//
FILE* CleanupGuard::AddHandle( FILE* fp, const std::string& filename )
{
    if(fp == NULL)
        return fp;
    std::unique_ptr<FILE,CGFileCloser> handle(fp);
    files_.push_back(filename);
    handles_.push_back(std::move(handle));
    return fp;
}

// -------------------------------------------------------------------------
// CloseHandle: close a registered handle before cleanup; throws if
// closing fails, since buffered data may have been lost
//
void CleanupGuard::CloseHandle( FILE* fp )
{
    for(auto it = handles_.begin(); it != handles_.end(); ++it) {
        if(it->get() != fp)
            continue;
        FILE* released = it->release();
        handles_.erase(it);
        if(fclose(released) != 0)
            throw MYRUNTIME_ERROR(
            std::string("CleanupGuard::CloseHandle: Failed to close file: ") + strerror(errno));
        return;
    }
}

// -------------------------------------------------------------------------
// Cleanup: close handles, then remove files and directories; done once
//
void CleanupGuard::Cleanup() throw()
{
    if(done_)
        return;
    done_ = true;
    CloseHandles();
    RemoveFiles();
    RemoveDirectories();
}

// -------------------------------------------------------------------------
// CloseHandles: close open handles
//
void CleanupGuard::CloseHandles() throw()
{
    for(std::unique_ptr<FILE,CGFileCloser>& handle: handles_) {
        FILE* fp = handle.release();
        if(fp && fclose(fp) != 0)
            warning("CleanupGuard: Failed to close a file handle");
    }
    handles_.clear();
}

// -------------------------------------------------------------------------
// RemoveFiles: remove registered files; missing files are ignored
//
void CleanupGuard::RemoveFiles() throw()
{
    try {
        for(const std::string& filename: files_) {
            if(keep_) {
                MYMSG(("CleanupGuard: Keeping file " + filename).c_str(), 3);
                continue;
            }
            MYMSG(("CleanupGuard: Removing file " + filename).c_str(), 4);
            if(myremove(filename.c_str()) != 0 && errno != ENOENT)
                warning(("CleanupGuard: Failed to remove file " + filename +
                    ": " + strerror(errno)).c_str());
            errno = 0;
        }
    } catch(std::exception const& ex) {
        warning((std::string("CleanupGuard: Removing files interrupted: ") + ex.what()).c_str());
    }
}

// -------------------------------------------------------------------------
// RemoveDirectories: remove registered directories recursively; the most
// recently registered first
//
void CleanupGuard::RemoveDirectories() throw()
{
    try {
        for(auto it = directories_.rbegin(); it != directories_.rend(); ++it) {
            if(keep_) {
                MYMSG(("CleanupGuard: Keeping directory " + *it).c_str(), 3);
                continue;
            }
            MYMSG(("CleanupGuard: Removing directory " + *it).c_str(), 4);
            if(!directory_exists(it->c_str()))
                continue;
            if(myrmtree(it->c_str()) != 0)
                warning(("CleanupGuard: Failed to remove directory " + *it).c_str());
            errno = 0;
        }
    } catch(std::exception const& ex) {
        warning((std::string("CleanupGuard: Removing directories interrupted: ") + ex.what()).c_str());
    }
}
