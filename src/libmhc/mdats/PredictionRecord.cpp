/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include "libutil/mybase.h"

#include <cmath>
#include <stdio.h>

#include <string>

#include "PredictionRecord.h"

// -------------------------------------------------------------------------
// file-local helpers
//
namespace {
// compare two values with NaN as the largest value; returns <0, 0, >0
inline int cmpvalues( double a, double b )
{
    bool na = std::isnan(a), nb = std::isnan(b);
    if(na || nb)
        return (int)na - (int)nb;
    return (a < b)? -1: ((b < a)? 1: 0);
}

// compare all fields in order: key, offset, peptide, allele, affinity,
// score, rank, method
inline int cmprecords( const PredictionRecord& l, const PredictionRecord& r )
{
    int c;
    if(l.HasSourceKey() != r.HasSourceKey())
        return l.HasSourceKey()? -1: 1;
    if((c = l.GetSourceKey().compare(r.GetSourceKey())) != 0) return c;
    if(l.GetOffset() != r.GetOffset()) return (l.GetOffset() < r.GetOffset())? -1: 1;
    if((c = l.GetPeptide().compare(r.GetPeptide())) != 0) return c;
    if((c = l.GetAllele().compare(r.GetAllele())) != 0) return c;
    if((c = cmpvalues(l.GetAffinity(), r.GetAffinity())) != 0) return c;
    if((c = cmpvalues(l.GetScore(), r.GetScore())) != 0) return c;
    if((c = cmpvalues(l.GetPercentileRank(), r.GetPercentileRank())) != 0) return c;
    return l.GetMethodName().compare(r.GetMethodName());
}

// print a value or NA
inline void printvalue( FILE* fp, double value, int precision )
{
    if(std::isnan(value))
        fprintf(fp, "\tNA");
    else
        fprintf(fp, "\t%.*f", precision, value);
}
}//namespace

// -------------------------------------------------------------------------
// constructor: invalid affinity or rank is an error of the caller
//
PredictionRecord::PredictionRecord(
    const std::string& sourcekey, bool haskey,
    int offset,
    const std::string& peptide,
    const std::string& allele,
    double affinity,
    double score,
    double prank,
    const std::string& method )
:   sourcekey_(haskey? sourcekey: std::string()),
    haskey_(haskey),
    offset_(offset),
    peptide_(peptide),
    allele_(allele),
    affinity_(affinity),
    score_(score),
    prank_(prank),
    method_(method)
{
    if(!IsValidAffinity(affinity_))
        throw MYRUNTIME_ERROR("PredictionRecord: Invalid affinity for peptide " + peptide_);
    if(!IsValidPercentileRank(prank_))
        throw MYRUNTIME_ERROR("PredictionRecord: Invalid percentile rank for peptide " + peptide_);
}

// -------------------------------------------------------------------------
// AffinityFromScore: recover IC50 from the log-scaled score
// score = 1 - log_50000(affinity)
//
double PredictionRecord::AffinityFromScore( double score )
{
    return std::pow(AFFINITYLOGBASE, 1.0 - score);
}

// -------------------------------------------------------------------------
// GetHeader: header of the tabular output
//
const char* PredictionRecord::GetHeader()
{
    return "source_sequence_name\toffset\tpeptide\tallele\t"
        "affinity\tscore\tpercentile_rank\tprediction_method_name";
}

// -------------------------------------------------------------------------
// Print: print the record as a line of tab-separated values
//
void PredictionRecord::Print( FILE* fp, int precision ) const
{
    if(fp == NULL)
        return;
    fprintf(fp, "%s\t%d\t%s\t%s",
        haskey_? sourcekey_.c_str(): "NA", offset_, peptide_.c_str(), allele_.c_str());
    printvalue(fp, affinity_, precision);
    printvalue(fp, score_, precision);
    printvalue(fp, prank_, precision);
    fprintf(fp, "\t%s%s", method_.c_str(), NL);
}

// -------------------------------------------------------------------------
// comparison operators
//
bool operator==( const PredictionRecord& left, const PredictionRecord& right )
{
    return cmprecords(left, right) == 0;
}

bool operator<( const PredictionRecord& left, const PredictionRecord& right )
{
    return cmprecords(left, right) < 0;
}

bool PRAffinityLess::operator()(
    const PredictionRecord& left, const PredictionRecord& right ) const
{
    int c = cmpvalues(left.GetAffinity(), right.GetAffinity());
    if(c)
        return c < 0;
    return cmprecords(left, right) < 0;
}
