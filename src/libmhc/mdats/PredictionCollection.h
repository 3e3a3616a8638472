/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __PredictionCollection_h__
#define __PredictionCollection_h__

#include "libutil/mybase.h"

#include <stdio.h>

#include <string>
#include <vector>

#include "PredictionRecord.h"

// _________________________________________________________________________
// Class PredictionCollection
//
// validated, deduplicated, and sorted predictions of one run, together
// with the peptides and alleles requested
//
class PredictionCollection
{
public:
    PredictionCollection() {}
    PredictionCollection(
        std::vector<PredictionRecord>&& records,
        const std::vector<std::string>& peptides,
        const std::vector<std::string>& alleles )
    :   records_(std::move(records)), peptides_(peptides), alleles_(alleles)
    {}

    const std::vector<PredictionRecord>& GetRecords() const { return records_; }
    const std::vector<std::string>& GetPeptides() const { return peptides_; }
    const std::vector<std::string>& GetAlleles() const { return alleles_; }

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    const PredictionRecord& operator[]( size_t n ) const { return records_[n]; }

    std::vector<PredictionRecord> GetRecordsForAllele( const std::string& allele ) const;

    void Print( FILE* fp, int precision ) const;

private:
    std::vector<PredictionRecord> records_;//predictions
    std::vector<std::string> peptides_;//peptides requested
    std::vector<std::string> alleles_;//alleles requested (normalized)
};

#endif//__PredictionCollection_h__
