/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include "libutil/mybase.h"

#include <algorithm>
#include <iterator>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "libmhc/mdats/AlleleNames.h"
#include "libmhc/mdats/PredictionRecord.h"
#include "libmhc/mdats/PredictionCollection.h"
#include "ResultAggregator.h"

typedef std::pair<std::string,std::string> TPeptideAllele;

// -------------------------------------------------------------------------
// file-local helpers
//
namespace {
inline std::string normalizedallele( const std::string& allele )
{
    std::string normalized;
    if(AlleleNames::TryNormalize(allele, &normalized))
        return normalized;
    return allele;
}
}//namespace

// -------------------------------------------------------------------------
// constructor
//
ResultAggregator::ResultAggregator( const std::string& program )
:   program_(program)
{
    MYMSG("ResultAggregator::ResultAggregator", 4);
}

// -------------------------------------------------------------------------
// Add: add the records parsed from one output
//
void ResultAggregator::Add( std::vector<PredictionRecord>&& records )
{
    if(records_.empty()) {
        records_ = std::move(records);
        return;
    }
    records_.insert(records_.end(),
        std::make_move_iterator(records.begin()),
        std::make_move_iterator(records.end()));
}

// -------------------------------------------------------------------------
// Aggregate: deduplicate and sort the records and validate them against
// the pairs of the peptides and alleles requested
//
PredictionCollection ResultAggregator::Aggregate(
    const std::vector<std::string>& peptides,
    const std::vector<std::string>& alleles )
{
    MYMSG("ResultAggregator::Aggregate", 3);

    if(records_.empty())
        warning(("No binding predictions from " + program_).c_str());

    Deduplicate();
    std::sort(records_.begin(), records_.end(), PRAffinityLess());
    Validate(peptides, alleles);

    MYMSGBEGl(1)
        char msgbuf[BUF_MAX];
        sprintf(msgbuf, "%zu prediction(s) for %zu peptide(s) and %zu allele(s)",
            records_.size(), peptides.size(), alleles.size());
        MYMSG(msgbuf, 1);
    MYMSGENDl

    return PredictionCollection(std::move(records_), peptides, alleles);
}

// -------------------------------------------------------------------------
// Deduplicate: remove records equal in all fields
//
void ResultAggregator::Deduplicate()
{
    std::sort(records_.begin(), records_.end());
    records_.erase(std::unique(records_.begin(), records_.end()), records_.end());
}

// -------------------------------------------------------------------------
// Validate: the set of observed (peptide, allele) pairs must equal the
// set of requested pairs
//
void ResultAggregator::Validate(
    const std::vector<std::string>& peptides,
    const std::vector<std::string>& alleles ) const
{
    std::set<TPeptideAllele> expected, observed;

    for(const std::string& allele: alleles) {
        std::string normalized = normalizedallele(allele);
        for(const std::string& peptide: peptides)
            expected.insert(TPeptideAllele(peptide, normalized));
    }

    for(const PredictionRecord& rec: records_)
        observed.insert(TPeptideAllele(rec.GetPeptide(), normalizedallele(rec.GetAllele())));

    for(const TPeptideAllele& pa: expected)
        if(observed.find(pa) == observed.end())
            throw MYRUNTIME_ERROR2(
            "Missing prediction for peptide " + pa.first + " and allele " + pa.second +
            " from " + program_, INCOMPLETERESULT);

    for(const TPeptideAllele& pa: observed)
        if(expected.find(pa) == expected.end())
            throw MYRUNTIME_ERROR2(
            "Unexpected prediction for peptide " + pa.first + " and allele " + pa.second +
            " from " + program_, INCOMPLETERESULT);
}
