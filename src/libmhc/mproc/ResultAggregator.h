/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __ResultAggregator_h__
#define __ResultAggregator_h__

#include "libutil/mybase.h"

#include <string>
#include <vector>

#include "libmhc/mdats/PredictionRecord.h"
#include "libmhc/mdats/PredictionCollection.h"

// _________________________________________________________________________
// Class ResultAggregator
//
// merges the records parsed from all outputs of a run and checks that
// they cover exactly the requested pairs of peptides and alleles
//
class ResultAggregator
{
public:
    explicit ResultAggregator( const std::string& program );

    void Add( std::vector<PredictionRecord>&& records );
    size_t GetNRecords() const { return records_.size(); }

    PredictionCollection Aggregate(
        const std::vector<std::string>& peptides,
        const std::vector<std::string>& alleles );

protected:
    void Deduplicate();
    void Validate(
        const std::vector<std::string>& peptides,
        const std::vector<std::string>& alleles ) const;

private:
    const std::string program_;//program that produced the records
    std::vector<PredictionRecord> records_;//records collected
};

#endif//__ResultAggregator_h__
