/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __InputPartitioner_h__
#define __InputPartitioner_h__

#include "libutil/mybase.h"

#include <stdio.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

class CleanupGuard;

// sequence key and the sequence itself
typedef std::pair<std::string,std::string> TNamedSequence;

// input file written for the tools
struct InputChunk {
    InputChunk(): nrecords_(0), length_(0) {}
    std::string filename_;//file name
    size_t nrecords_;//number of records in the file
    int length_;//length of peptides when grouped by length; 0 otherwise
};

// _________________________________________________________________________
// Class InputPartitioner
//
// writes sequences or peptides to input files of a bounded number of
// records; sequence keys are replaced by short unique keys
//
class InputPartitioner
{
public:
    InputPartitioner( const std::string& directory, size_t maxrecords, CleanupGuard& guard );

    void PartitionSequences( const std::vector<TNamedSequence>& sequences );
    void PartitionPeptides( const std::vector<std::string>& peptides, bool groupbylength );

    const std::vector<InputChunk>& GetChunks() const { return chunks_; }
    const std::map<std::string,std::string>& GetKeyMap() const { return keymap_; }

    static std::string MakeShortKey( const std::string& key, size_t index );

protected:
    template<typename T, typename F>
    void WriteChunks( const std::vector<T>& records, int length, F writer );

    FILE* OpenChunk( const std::string& prefix, std::string* filename );
    void CloseChunk( FILE* fp, const std::string& filename );

private:
    const std::string directory_;//directory for the files
    const size_t maxrecords_;//maximum number of records per file; 0, no limit
    CleanupGuard& guard_;//guard of the files written
    std::vector<InputChunk> chunks_;//files written
    std::map<std::string,std::string> keymap_;//short key -> original key
};

#endif//__InputPartitioner_h__
