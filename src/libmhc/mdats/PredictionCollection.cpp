/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include "libutil/mybase.h"

#include <errno.h>
#include <stdio.h>
#include <string.h>

#include <string>
#include <vector>

#include "PredictionCollection.h"

// -------------------------------------------------------------------------
// GetRecordsForAllele: records of the given allele in the collection's
// order
//
std::vector<PredictionRecord> PredictionCollection::GetRecordsForAllele(
    const std::string& allele ) const
{
    std::vector<PredictionRecord> selected;
    for(const PredictionRecord& rec: records_)
        if(rec.GetAllele() == allele)
            selected.push_back(rec);
    return selected;
}

// -------------------------------------------------------------------------
// Print: print the header and all records as tab-separated values
//
void PredictionCollection::Print( FILE* fp, int precision ) const
{
    MYMSG("PredictionCollection::Print", 3);
    if(fp == NULL)
        throw MYRUNTIME_ERROR("PredictionCollection::Print: Null file.");
    fprintf(fp, "%s%s", PredictionRecord::GetHeader(), NL);
    for(const PredictionRecord& rec: records_)
        rec.Print(fp, precision);
    if(ferror(fp))
        throw MYRUNTIME_ERROR(
        std::string("PredictionCollection::Print: Write failed: ") + strerror(errno));
}
