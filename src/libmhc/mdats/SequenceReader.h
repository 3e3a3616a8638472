/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __SequenceReader_h__
#define __SequenceReader_h__

#include "libutil/mybase.h"

#include <string>
#include <vector>

#include "InputPartitioner.h"

// _________________________________________________________________________
// Class SequenceReader
//
// reading of the sequences and peptides given to the program
//
class SequenceReader
{
public:
    static std::vector<TNamedSequence> ReadFasta( const std::string& filename );
    static std::vector<std::string> ReadPeptides( const std::string& filename );

    static bool IsValidSequence( const std::string& sequence );
};

#endif//__SequenceReader_h__
