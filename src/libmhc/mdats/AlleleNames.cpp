/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include "libutil/mybase.h"

#include <ctype.h>
#include <string.h>

#include <algorithm>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "AlleleNames.h"

std::mutex AlleleNames::mtx_;
std::map<std::string,std::string> AlleleNames::cache_;

// -------------------------------------------------------------------------
// file-local helpers
//
namespace {
const char* gHumanGenes[] = {
    "A", "B", "C", "E", "F", "G",
    "DRA1", "DRB1", "DRB2", "DRB3", "DRB4", "DRB5",
    "DQA1", "DQB1", "DPA1", "DPB1"
};
const char* gMouseLoci[] = {"K", "D", "L", "Q", "IA", "IE"};

inline std::string mytoupper( std::string str )
{
    for(char& c: str) c = (char)toupper((unsigned char)c);
    return str;
}

inline std::string mytrim( const std::string& str )
{
    size_t beg = str.find_first_not_of(" \t\r\n");
    if(beg == std::string::npos)
        return std::string();
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(beg, end - beg + 1);
}

inline bool startswith( const std::string& str, const char* prefix )
{
    return str.compare(0, strlen(prefix), prefix) == 0;
}

inline bool alldigits( const std::string& str )
{
    return !str.empty() &&
        std::all_of(str.begin(), str.end(), [](char c){return isdigit((unsigned char)c) != 0;});
}

inline void throwunsupported( const std::string& name, const char* reason )
{
    throw MYRUNTIME_ERROR2(
        "Unsupported allele name: \"" + name + "\" (" + reason + ")", UNSUPPORTEDALLELE);
}
}//namespace

// -------------------------------------------------------------------------
// TAlleleChain methods
//
bool TAlleleChain::IsClassII() const
{
    if(IsMouse())
        return gene_[0] == 'I';
    return gene_[0] == 'D';
}

bool TAlleleChain::IsAlphaChain() const
{
    return IsClassII() && !IsMouse() && gene_.size() >= 3 && gene_[2] == 'A';
}

// GetName: name of the chain without the species prefix
std::string TAlleleChain::GetName() const
{
    if(IsMouse())
        return gene_ + protein_;
    return gene_ + "*" + family_ + ":" + protein_;
}

// GetCompactName: name with fields concatenated, e.g., DQA10501
std::string TAlleleChain::GetCompactName() const
{
    return gene_ + family_ + protein_;
}

// -------------------------------------------------------------------------
// Normalize: canonical name of an allele; throws for unparseable names
//
std::string AlleleNames::Normalize( const std::string& name )
{
    {
        std::lock_guard<std::mutex> lck(mtx_);
        std::map<std::string,std::string>::const_iterator it = cache_.find(name);
        if(it != cache_.end())
            return it->second;
    }

    std::vector<TAlleleChain> chains = Parse(name);
    std::string normalized = chains[0].species_ + "-" + chains[0].GetName();
    for(size_t n = 1; n < chains.size(); n++)
        normalized += "-" + chains[n].GetName();

    std::lock_guard<std::mutex> lck(mtx_);
    cache_.insert(std::make_pair(name, normalized));
    return normalized;
}

// -------------------------------------------------------------------------
// TryNormalize: normalize without throwing; returns false if the name
// cannot be parsed
//
bool AlleleNames::TryNormalize( const std::string& name, std::string* normalized )
{
    try {
        std::string result = Normalize(name);
        if(normalized)
            *normalized = result;
        return true;
    } catch(myruntime_error const& ex) {
        if(ex.eclass() != UNSUPPORTEDALLELE)
            throw;
    }
    return false;
}

// -------------------------------------------------------------------------
// GetCacheSize: number of memoized names
//
size_t AlleleNames::GetCacheSize()
{
    std::lock_guard<std::mutex> lck(mtx_);
    return cache_.size();
}

// -------------------------------------------------------------------------
// Parse: parse an allele name into one chain or a pair of class II chains
//
std::vector<TAlleleChain> AlleleNames::Parse( const std::string& name )
{
    std::string text = mytrim(name);
    std::string upper = mytoupper(text);
    std::vector<TAlleleChain> chains;

    if(text.empty())
        throwunsupported(name, "empty name");

    if(startswith(upper, "H-2-"))
        chains.push_back(ParseMouse(name, text.substr(4)));
    else if(startswith(upper, "H2-"))
        chains.push_back(ParseMouse(name, text.substr(3)));
    else {
        if(startswith(upper, "HLA-"))
            text = text.substr(4);
        else if(startswith(upper, "HLA"))
            text = text.substr(3);

        size_t p = text.find('-');
        if(p == std::string::npos)
            chains.push_back(ParseChain(name, text));
        else {
            chains.push_back(ParseChain(name, text.substr(0, p)));
            chains.push_back(ParseChain(name, text.substr(p+1)));
            if(!chains[0].IsAlphaChain() || !chains[1].IsClassII() || chains[1].IsAlphaChain())
                throwunsupported(name, "invalid pair of chains");
        }
    }

    return chains;
}

// -------------------------------------------------------------------------
// ParseMouse: parse a mouse allele name, e.g., Kb, IAb
//
TAlleleChain AlleleNames::ParseMouse( const std::string& name, const std::string& text )
{
    TAlleleChain chain;
    chain.species_ = "H-2";

    if(text.size() < 2 ||
       !std::all_of(text.begin(), text.end(), [](char c){return isalpha((unsigned char)c) != 0;}))
        throwunsupported(name, "invalid mouse allele");

    chain.gene_ = mytoupper(text.substr(0, text.size()-1));
    chain.protein_ = std::string(1, (char)tolower((unsigned char)text[text.size()-1]));

    if(std::find(gMouseLoci, gMouseLoci + ARRAYLEN(gMouseLoci), chain.gene_) ==
       gMouseLoci + ARRAYLEN(gMouseLoci))
        throwunsupported(name, "unknown mouse locus");

    return chain;
}

// -------------------------------------------------------------------------
// ParseChain: parse one human chain, e.g., A*02:01, A0201, DRB1_0101
//
TAlleleChain AlleleNames::ParseChain( const std::string& name, const std::string& text )
{
    TAlleleChain chain;
    chain.species_ = "HLA";

    std::string upper = mytoupper(text);
    size_t p = 0;

    for(; p < upper.size() && isalpha((unsigned char)upper[p]); p++);
    chain.gene_ = upper.substr(0, p);

    if(chain.gene_.empty())
        throwunsupported(name, "no gene");

    if(chain.gene_[0] == 'D') {
        //class II genes carry a gene number
        if(chain.gene_ == "DRA") {
            //DRA1*01:01, DRA*01:01, DRA10101, DRA0101
            size_t ndigits = std::count_if(upper.begin() + p, upper.end(),
                [](char c){return isdigit((unsigned char)c) != 0;});
            if(p < upper.size() && upper[p] == '1' && (ndigits & 1))
                p++;
            chain.gene_ = "DRA1";
        }
        else {
            if(p >= upper.size() || !isdigit((unsigned char)upper[p]))
                throwunsupported(name, "no gene number");
            chain.gene_ += upper[p++];
        }
    }

    if(std::find(gHumanGenes, gHumanGenes + ARRAYLEN(gHumanGenes), chain.gene_) ==
       gHumanGenes + ARRAYLEN(gHumanGenes))
        throwunsupported(name, "unknown gene");

    if(p < upper.size() && (upper[p] == '*' || upper[p] == '_' || upper[p] == ' '))
        p++;

    ParseFields(name, upper.substr(p), &chain);
    return chain;
}

// -------------------------------------------------------------------------
// ParseFields: parse allele fields, e.g., 02:01, 0201, 02:01:01:02N
//
void AlleleNames::ParseFields( const std::string& name, const std::string& text, TAlleleChain* chain )
{
    std::string fields = text;

    //expression suffix
    while(!fields.empty() && isalpha((unsigned char)fields[fields.size()-1]))
        fields.erase(fields.size()-1);

    if(fields.find(':') != std::string::npos) {
        size_t p1 = fields.find(':');
        size_t p2 = fields.find(':', p1+1);
        chain->family_ = fields.substr(0, p1);
        chain->protein_ = fields.substr(p1+1, (p2 == std::string::npos)? p2: p2-p1-1);
        if(!alldigits(chain->family_) || !alldigits(chain->protein_))
            throwunsupported(name, "invalid allele fields");
        if(chain->family_.size() < 2)
            chain->family_.insert(0, 2 - chain->family_.size(), '0');
        if(chain->protein_.size() < 2)
            chain->protein_.insert(0, 2 - chain->protein_.size(), '0');
        return;
    }

    if(!alldigits(fields) || fields.size() < 4)
        throwunsupported(name, "invalid allele digits");

    //two-digit group; three-digit protein when the count is odd
    size_t nprot = (fields.size() & 1)? 3: 2;
    chain->family_ = fields.substr(0, 2);
    chain->protein_ = fields.substr(2, nprot);
}
