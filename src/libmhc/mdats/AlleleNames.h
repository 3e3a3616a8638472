/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __AlleleNames_h__
#define __AlleleNames_h__

#include "libutil/mybase.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

// one MHC chain parsed from an allele name
struct TAlleleChain {
    std::string species_;//HLA or H-2
    std::string gene_;//gene (HLA) or locus (H-2), e.g., A, DRB1, K, IA
    std::string family_;//allele group; empty for H-2
    std::string protein_;//protein field; haplotype letter for H-2

    bool IsMouse() const { return species_ == "H-2"; }
    bool IsClassII() const;
    bool IsAlphaChain() const;
    std::string GetName() const;
    std::string GetCompactName() const;
};

// _________________________________________________________________________
// Class AlleleNames
//
// parsing and normalization of MHC allele names; normalized names are
// memoized in a table shared by all threads
//
class AlleleNames
{
public:
    static std::string Normalize( const std::string& name );
    static bool TryNormalize( const std::string& name, std::string* normalized );
    static std::vector<TAlleleChain> Parse( const std::string& name );
    static size_t GetCacheSize();

protected:
    static TAlleleChain ParseChain( const std::string& name, const std::string& text );
    static TAlleleChain ParseMouse( const std::string& name, const std::string& text );
    static void ParseFields( const std::string& name, const std::string& text, TAlleleChain* );

private:
    static std::mutex mtx_;
    static std::map<std::string,std::string> cache_;
};

#endif//__AlleleNames_h__
