/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __PredictionRecord_h__
#define __PredictionRecord_h__

#include "libutil/mybase.h"

#include <cmath>
#include <stdio.h>

#include <string>

// _________________________________________________________________________
// Class PredictionRecord
//
// one binding prediction for a peptide and an allele; absent values are
// NaN (and an empty key)
//
class PredictionRecord
{
public:
    PredictionRecord(
        const std::string& sourcekey, bool haskey,
        int offset,
        const std::string& peptide,
        const std::string& allele,
        double affinity,
        double score,
        double prank,
        const std::string& method );

    const std::string& GetSourceKey() const { return sourcekey_; }
    bool HasSourceKey() const { return haskey_; }
    int GetOffset() const { return offset_; }
    const std::string& GetPeptide() const { return peptide_; }
    const std::string& GetAllele() const { return allele_; }
    double GetAffinity() const { return affinity_; }
    bool HasAffinity() const { return !std::isnan(affinity_); }
    double GetScore() const { return score_; }
    bool HasScore() const { return !std::isnan(score_); }
    double GetPercentileRank() const { return prank_; }
    bool HasPercentileRank() const { return !std::isnan(prank_); }
    const std::string& GetMethodName() const { return method_; }

    void Print( FILE* fp, int precision ) const;

    static bool IsValidAffinity( double affinity ) {
        return std::isnan(affinity) || (std::isfinite(affinity) && 0.0 <= affinity);
    }
    static bool IsValidPercentileRank( double prank ) {
        return std::isnan(prank) ||
            (PERCENTILERANK_MIN <= prank && prank <= PERCENTILERANK_MAX);
    }

    static double AffinityFromScore( double score );

    static const char* GetHeader();

private:
    std::string sourcekey_;//original key of the source sequence
    bool haskey_;//whether the source key is given
    int offset_;//0-based offset of the peptide in the source sequence
    std::string peptide_;//peptide sequence
    std::string allele_;//allele name (normalized when possible)
    double affinity_;//IC50 (nM)
    double score_;//log-scaled affinity or tool score
    double prank_;//percentile rank
    std::string method_;//prediction method name
};

// -------------------------------------------------------------------------
// comparison of records over all fields; absent values compare equal to
// each other and after present ones
//
bool operator==( const PredictionRecord&, const PredictionRecord& );
bool operator<( const PredictionRecord&, const PredictionRecord& );

inline
bool operator!=( const PredictionRecord& left, const PredictionRecord& right )
{
    return !(left == right);
}

// ordering by affinity, absent affinities last; ties broken by all fields
struct PRAffinityLess {
    bool operator()( const PredictionRecord& left, const PredictionRecord& right ) const;
};

#endif//__PredictionRecord_h__
