/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __ToolPresets_h__
#define __ToolPresets_h__

#include <string>
#include <vector>

#include "ParserSpec.h"
#include "ToolSpec.h"

// names of the output formats
#define PSF_NETMHC3     "netmhc3"
#define PSF_NETMHC4     "netmhc4"
#define PSF_NETMHCPAN28 "netmhcpan28"
#define PSF_NETMHCPAN3  "netmhcpan3"
#define PSF_NETMHCCONS  "netmhccons"
#define PSF_NETMHCIIPAN "netmhciipan"
#define PSF_NETMHCPAN4EL    "netmhcpan4el"
#define PSF_NETMHCIIPAN4EL  "netmhciipan4el"
#define PSF_NETMHCIIPAN4BA  "netmhciipan4ba"
#define PSF_NETMHCSTABPAN   "netmhcstabpan"

// names of the presets
#define TSP_NETMHC3     "netmhc3"
#define TSP_NETMHC4     "netmhc4"
#define TSP_NETMHCPAN28 "netmhcpan28"
#define TSP_NETMHCPAN3  "netmhcpan3"
#define TSP_NETMHCPAN4  "netmhcpan4"
#define TSP_NETMHCCONS  "netmhccons"
#define TSP_NETMHCIIPAN3 "netmhciipan3"
#define TSP_NETMHCPAN4EL    "netmhcpan4_el"
#define TSP_NETMHCIIPAN4    "netmhciipan4"
#define TSP_NETMHCIIPAN4BA  "netmhciipan4_ba"
#define TSP_NETMHCSTABPAN   "netmhcstabpan"

ParserSpec GetParserSpec( const std::string& format );

ToolSpec GetToolPreset( const std::string& name );
std::vector<std::string> GetToolPresetNames();

std::string DetectNetMHCPreset( const std::string& helpoutput );
std::string DetectNetMHCIIpanPreset( const std::string& helpoutput );

// allele name preparation
std::string PrepareAlleleDefault( const std::string& allele );
std::string PrepareAlleleNetMHC4( const std::string& allele );
std::string PrepareAlleleNetMHCIIpan( const std::string& allele );

#endif//__ToolPresets_h__
