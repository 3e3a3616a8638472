/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include "libutil/mybase.h"

#include <string.h>

#include <algorithm>
#include <string>
#include <vector>

#include "libmhc/mdats/AlleleNames.h"
#include "ParserSpec.h"
#include "ToolSpec.h"
#include "ToolPresets.h"

// -------------------------------------------------------------------------
// file-local data and helpers
//
namespace {
// row of the flag table of presets
struct TPresetRow {
    const char* name;
    const char* program;
    const char* listflag;
    const char* inputflag;
    const char* lengthflag;
    const char* alleleflag;
    const char* tempdirflag;
    const char* extraflag;
    const char* modeflags;//blank-separated
    const char* format;
    int processlimit;
    int minlength;
    int maxlength;//default lengths: minlength..maxlength
    int minpeplength;
    bool groupbylength;
};

const TPresetRow gPresets[] = {
    {TSP_NETMHC3, "netMHC", "-A", "", "--peplen", "--mhc", "", "--nodirect", "-p",
        PSF_NETMHC3, 1, 9, 9, 8, false},
    {TSP_NETMHC4, "netMHC", "-listMHC", "-f", "-l", "-a", "-tdir", "", "-p",
        PSF_NETMHC4, 0, 9, 9, 8, false},
    {TSP_NETMHCPAN28, "netMHCpan", "-listMHC", "-f", "-l", "-a", "", "", "-p",
        PSF_NETMHCPAN28, 0, 9, 9, 8, false},
    {TSP_NETMHCPAN3, "netMHCpan", "-listMHC", "-f", "-l", "-a", "", "", "-p",
        PSF_NETMHCPAN3, -1, 9, 9, 8, false},
    {TSP_NETMHCPAN4, "netMHCpan", "-listMHC", "-f", "-l", "-a", "", "-BA", "-p",
        PSF_NETMHCPAN3, -1, 9, 9, 8, false},
    {TSP_NETMHCPAN4EL, "netMHCpan", "-listMHC", "-f", "-l", "-a", "", "", "-p",
        PSF_NETMHCPAN4EL, -1, 9, 9, 8, false},
    {TSP_NETMHCCONS, "netMHCcons", "", "-f", "-length", "-a", "-tdir", "", "-p",
        PSF_NETMHCCONS, 0, 9, 9, 8, false},
    {TSP_NETMHCIIPAN3, "netMHCIIpan", "-list", "-f", "-length", "-a", "-tdir", "", "-inptype 1",
        PSF_NETMHCIIPAN, -1, 15, 20, 9, false},
    {TSP_NETMHCIIPAN4, "netMHCIIpan", "-list", "-f", "-length", "-a", "-tdir", "-BA", "-inptype 1",
        PSF_NETMHCIIPAN4EL, -1, 15, 20, 9, false},
    {TSP_NETMHCIIPAN4BA, "netMHCIIpan", "-list", "-f", "-length", "-a", "-tdir", "-BA", "-inptype 1",
        PSF_NETMHCIIPAN4BA, -1, 15, 20, 9, false},
    //a peptide list of one length per command
    {TSP_NETMHCSTABPAN, "netMHCstabpan", "-listMHC", "-f", "-l", "-a", "", "", "-p",
        PSF_NETMHCSTABPAN, -1, 9, 9, 8, true}
};

// split a blank-separated list of flags
std::vector<std::string> splitflags( const std::string& flags )
{
    std::vector<std::string> result;
    size_t p = 0;
    while(p < flags.size()) {
        size_t e = flags.find(' ', p);
        if(e == std::string::npos)
            e = flags.size();
        if(p < e)
            result.push_back(flags.substr(p, e - p));
        p = e + 1;
    }
    return result;
}

// remove all occurrences of the given characters
std::string stripchars( std::string str, const char* chars )
{
    str.erase(
        std::remove_if(str.begin(), str.end(),
            [chars](char c){return strchr(chars, c) != NULL;}),
        str.end());
    return str;
}
}//namespace

// -------------------------------------------------------------------------
// GetParserSpec: description of the output format of the given name
//
ParserSpec GetParserSpec( const std::string& format )
{
    ParserSpec spec;
    spec.name_ = format;
    spec.offsetndx_ = 0;

    if(format == PSF_NETMHC3) {
        spec.keyndx_ = 4; spec.peptidendx_ = 1; spec.allelendx_ = 5;
        spec.affinityndx_ = 3; spec.scorendx_ = 2;
        spec.ignored_["WB"] = 4;
        spec.ignored_["SB"] = 4;
    }
    else if(format == PSF_NETMHC4) {
        spec.keyndx_ = 10; spec.peptidendx_ = 2; spec.allelendx_ = 1;
        spec.affinityndx_ = 12; spec.rankndx_ = 13; spec.scorendx_ = 11;
    }
    else if(format == PSF_NETMHCPAN28) {
        spec.keyndx_ = 3; spec.peptidendx_ = 2; spec.allelendx_ = 1;
        spec.affinityndx_ = 5; spec.rankndx_ = 6; spec.scorendx_ = 4;
        spec.scanforerror_ = true;
    }
    else if(format == PSF_NETMHCPAN3) {
        spec.keyndx_ = 10; spec.peptidendx_ = 2; spec.allelendx_ = 1;
        spec.affinityndx_ = 12; spec.rankndx_ = 13; spec.scorendx_ = 11;
        spec.transforms_[0] = TransformOneBasedOffset;
    }
    else if(format == PSF_NETMHCCONS) {
        spec.keyndx_ = 3; spec.peptidendx_ = 2; spec.allelendx_ = 1;
        spec.affinityndx_ = 5; spec.rankndx_ = 6; spec.scorendx_ = 4;
    }
    else if(format == PSF_NETMHCIIPAN) {
        spec.keyndx_ = 3; spec.peptidendx_ = 2; spec.allelendx_ = 1;
        spec.affinityndx_ = 8; spec.rankndx_ = 9; spec.scorendx_ = 7;
        spec.scanforerror_ = true;
    }
    else if(format == PSF_NETMHCPAN4EL) {
        //elution scores and their ranks; no affinities
        spec.keyndx_ = 10; spec.peptidendx_ = 2; spec.allelendx_ = 1;
        spec.rankndx_ = 12; spec.scorendx_ = 11;
        spec.logscore_ = false;
        spec.transforms_[0] = TransformOneBasedOffset;
    }
    else if(format == PSF_NETMHCIIPAN4EL) {
        //Pos MHC Peptide Of Core Core_Rel Identity Score_EL %Rank_EL Exp_Bind
        //Score_BA Affinity(nM) %Rank_BA
        spec.keyndx_ = 6; spec.peptidendx_ = 2; spec.allelendx_ = 1;
        spec.affinityndx_ = 11; spec.rankndx_ = 8; spec.scorendx_ = 7;
        spec.logscore_ = false;
        spec.transforms_[0] = TransformOneBasedOffset;
        spec.scanforerror_ = true;
    }
    else if(format == PSF_NETMHCIIPAN4BA) {
        spec.keyndx_ = 6; spec.peptidendx_ = 2; spec.allelendx_ = 1;
        spec.affinityndx_ = 11; spec.rankndx_ = 12; spec.scorendx_ = 10;
        spec.transforms_[0] = TransformOneBasedOffset;
        spec.scanforerror_ = true;
    }
    else if(format == PSF_NETMHCSTABPAN) {
        //pos HLA peptide Identity Pred Thalf(h) %Rank_Stab
        spec.keyndx_ = 3; spec.peptidendx_ = 2; spec.allelendx_ = 1;
        spec.rankndx_ = 6; spec.scorendx_ = 4;
        spec.logscore_ = false;
    }
    else
        throw MYRUNTIME_ERROR2("Unknown output format: " + format, CONFIGURATION);

    return spec;
}

// -------------------------------------------------------------------------
// GetToolPreset: tool description of the given preset name
//
ToolSpec GetToolPreset( const std::string& name )
{
    for(const TPresetRow& row: gPresets) {
        if(name != row.name)
            continue;
        ToolSpec spec;
        spec.name_ = row.name;
        spec.program_ = row.program;
        spec.listflag_ = row.listflag;
        spec.inputflag_ = row.inputflag;
        spec.lengthflag_ = row.lengthflag;
        spec.alleleflag_ = row.alleleflag;
        spec.tempdirflag_ = row.tempdirflag;
        spec.extraflags_ = splitflags(row.extraflag);
        spec.peptidemodeflags_ = splitflags(row.modeflags);
        spec.parser_ = GetParserSpec(row.format);
        spec.processlimit_ = row.processlimit;
        for(int len = row.minlength; len <= row.maxlength; len++)
            spec.peplengths_.push_back(len);
        spec.minpeplength_ = row.minpeplength;
        spec.maxrecords_ = DEFMAXRECORDSPERFILE;
        spec.groupbylength_ = row.groupbylength;
        if(name == TSP_NETMHC4)
            spec.allelehook_ = PrepareAlleleNetMHC4;
        else if(spec.program_ == "netMHCIIpan")
            spec.allelehook_ = PrepareAlleleNetMHCIIpan;
        else
            spec.allelehook_ = PrepareAlleleDefault;
        return spec;
    }
    throw MYRUNTIME_ERROR2("Unknown tool preset: " + name, CONFIGURATION);
}

// -------------------------------------------------------------------------
// GetToolPresetNames: names of all presets
//
std::vector<std::string> GetToolPresetNames()
{
    std::vector<std::string> names;
    for(const TPresetRow& row: gPresets)
        names.push_back(row.name);
    return names;
}

// -------------------------------------------------------------------------
// DetectNetMHCPreset: preset of netMHC identified from its help output
//
std::string DetectNetMHCPreset( const std::string& helpoutput )
{
    bool v4 = helpoutput.find("-listMHC") != std::string::npos;
    bool v3 = helpoutput.find("--Alleles") != std::string::npos;
    if(v4 && v3)
        throw MYRUNTIME_ERROR2(
        "Ambiguous netMHC version: help output mentions both -listMHC and --Alleles",
        TOOLUNAVAILABLE);
    if(v4)
        return TSP_NETMHC4;
    if(v3)
        return TSP_NETMHC3;
    throw MYRUNTIME_ERROR2("Unable to determine netMHC version", TOOLUNAVAILABLE);
}

// -------------------------------------------------------------------------
// DetectNetMHCIIpanPreset: preset of netMHCIIpan identified from its help
// output; version 4.0 is run in elution-score mode
//
std::string DetectNetMHCIIpanPreset( const std::string& helpoutput )
{
    if(helpoutput.find("NetMHCIIpan-4.0") != std::string::npos)
        return TSP_NETMHCIIPAN4;
    if(helpoutput.find("NetMHCIIpan-3") != std::string::npos)
        return TSP_NETMHCIIPAN3;
    throw MYRUNTIME_ERROR2(
        "Unable to determine netMHCIIpan version: 3.x or 4.0 expected", TOOLUNAVAILABLE);
}

// -------------------------------------------------------------------------
// PrepareAlleleDefault: HLA-A*02:01 -> HLA-A02:01
//
std::string PrepareAlleleDefault( const std::string& allele )
{
    return stripchars(allele, "*");
}

// -------------------------------------------------------------------------
// PrepareAlleleNetMHC4: HLA-A*02:01 -> HLA-A0201
//
std::string PrepareAlleleNetMHC4( const std::string& allele )
{
    return stripchars(allele, "*:");
}

// -------------------------------------------------------------------------
// PrepareAlleleNetMHCIIpan: DR alleles by their beta chain, DRB1_0101;
// mouse alleles, H-2-IAb; other pairs, HLA-DQA10501-DQB10201
//
std::string PrepareAlleleNetMHCIIpan( const std::string& allele )
{
    std::vector<TAlleleChain> chains = AlleleNames::Parse(allele);
    const TAlleleChain& last = chains.back();

    if(!last.IsClassII())
        throw MYRUNTIME_ERROR2(
        "Class II allele expected: " + allele, UNSUPPORTEDALLELE);

    if(last.IsMouse())
        return last.species_ + "-" + last.GetName();

    if(last.gene_.compare(0, 3, "DRB") == 0)
        return last.gene_ + "_" + last.family_ + last.protein_;

    if(chains.size() < 2)
        throw MYRUNTIME_ERROR2(
        "Pair of chains expected: " + allele, UNSUPPORTEDALLELE);

    return chains[0].species_ + "-" + chains[0].GetCompactName() + "-" + last.GetCompactName();
}
