/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __CleanupGuard_h__
#define __CleanupGuard_h__

#include "libutil/mybase.h"

#include <stdio.h>

#include <memory>
#include <string>
#include <vector>

// -------------------------------------------------------------------------
//
struct CGFileCloser {
    void operator()(FILE* fp) const {
        if(fp)
            fclose(fp);
    };
};

// _________________________________________________________________________
// Class CleanupGuard
//
// owner of temporary files, directories, and open stdio handles of one
// run; removes them once, when Cleanup() is called or the guard goes out
// of scope; failures to remove are logged and never propagated
//
class CleanupGuard
{
public:
    CleanupGuard();
    CleanupGuard(
        const std::vector<std::string>& files,
        const std::vector<std::string>& directories );
    ~CleanupGuard();

    CleanupGuard(const CleanupGuard&) = delete;
    CleanupGuard& operator=(const CleanupGuard&) = delete;

    void AddFile( const std::string& filename ) { files_.push_back(filename); }
    void AddDirectory( const std::string& dirname ) { directories_.push_back(dirname); }
    FILE* AddHandle( FILE* fp, const std::string& filename );
    void CloseHandle( FILE* fp );

    void SetKeep( bool keep ) { keep_ = keep; }
    bool GetKeep() const { return keep_; }
    bool IsDone() const { return done_; }

    const std::vector<std::string>& GetFiles() const { return files_; }
    const std::vector<std::string>& GetDirectories() const { return directories_; }

    void Cleanup() throw();

protected:
    void CloseHandles() throw();
    void RemoveFiles() throw();
    void RemoveDirectories() throw();

private:
    std::vector<std::unique_ptr<FILE,CGFileCloser>> handles_;//open handles
    std::vector<std::string> files_;//files to remove
    std::vector<std::string> directories_;//directories to remove recursively
    bool keep_;//keep resources (only close handles)
    bool done_;//cleanup has been done
};

#endif//__CleanupGuard_h__
