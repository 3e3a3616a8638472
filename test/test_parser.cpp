/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <vector>

#include "libutil/mybase.h"
#include "libmhc/mdats/PredictionRecord.h"
#include "libmhc/mtools/ToolPresets.h"
#include "libmhc/mproc/TableParser.h"
#include "testutil.h"

namespace {
bool processfailure( myruntime_error const& ex ) { return ex.eclass() == PROCESSFAILURE; }

// netMHCcons output for twelve 9-mers of one sequence
const char* gConsOutput =
"# NetMHCcons version 1.1\n"
"# Input is in FSA format\n"
"# Peptide length 9\n"
"\n"
"-------------------------------------------------------------------------------\n"
" pos        HLA    peptide  Identity 1-log50k(aff) Affinity(nM)   %Rank BindLevel\n"
"-------------------------------------------------------------------------------\n"
"    0 HLA-A*02:03  QQQQQYFPE       id0       0.024     38534.25   50.00\n"
"    1 HLA-A*02:03  QQQQYFPEI       id0       0.133     12113.79   18.00\n"
"    2 HLA-A*02:03  QQQYFPEIT       id0       0.052     28460.44   40.00\n"
"    3 HLA-A*02:03  QQYFPEITH       id0       0.019     40563.13   60.00\n"
"    4 HLA-A*02:03  QYFPEITHI       id0       0.326      1463.80    7.00\n"
"    5 HLA-A*02:03  YFPEITHII       id0       0.293      2098.19    8.00\n"
"    6 HLA-A*02:03  FPEITHIII       id0       0.056     27303.20   39.00\n"
"    7 HLA-A*02:03  PEITHIIIA       id0       0.019     40868.24   60.00\n"
"    8 HLA-A*02:03  EITHIIIAS       id0       0.034     34670.11   45.00\n"
"    9 HLA-A*02:03  ITHIIIASS       id0       0.140     11224.94   17.00\n"
"   10 HLA-A*02:03  THIIIASSS       id0       0.040     32426.33   44.00\n"
"   11 HLA-A*02:03  HIIIASSSL       id0       0.515       189.74    4.00 <= WB\n"
"-------------------------------------------------------------------------------\n"
"\n"
"Number of strong binders: 0 Number of weak binders: 1\n"
"-------------------------------------------------------------------------------\n";

std::map<std::string,std::string> consKeymap()
{
    std::map<std::string,std::string> keymap;
    keymap["id0"] = "protein one";
    return keymap;
}
}//namespace

BOOST_AUTO_TEST_SUITE(parser)

BOOST_AUTO_TEST_CASE(tokenize_and_headers)
{
    std::vector<std::string> tokens = TableParser::Tokenize("  0 HLA-A*02:03\tQQQQQYFPE  \r");
    BOOST_REQUIRE_EQUAL(tokens.size(), 3u);
    BOOST_CHECK_EQUAL(tokens[1], "HLA-A*02:03");
    BOOST_CHECK_EQUAL(tokens[2], "QQQQQYFPE");
    BOOST_CHECK(TableParser::Tokenize(" \t ").empty());

    BOOST_CHECK(TableParser::IsHeaderLine("pos HLA peptide"));
    BOOST_CHECK(TableParser::IsHeaderLine("Number of strong binders: 0"));
    BOOST_CHECK(TableParser::IsHeaderLine("Protein id0. Allele HLA-A*02:03"));
    BOOST_CHECK(!TableParser::IsHeaderLine("0 HLA-A*02:03 QQQQQYFPE"));
}

BOOST_AUTO_TEST_CASE(netmhccons_table)
{
    std::map<std::string,std::string> keymap = consKeymap();
    TableParser parser(GetParserSpec(PSF_NETMHCCONS), "netMHCcons", "netmhccons", &keymap, true);
    std::vector<PredictionRecord> records = parser.Parse(gConsOutput);

    BOOST_REQUIRE_EQUAL(records.size(), 12u);
    BOOST_CHECK_EQUAL(parser.GetNDropped(), 0u);
    BOOST_CHECK_EQUAL(records[0].GetPeptide(), "QQQQQYFPE");
    BOOST_CHECK_EQUAL(records[0].GetSourceKey(), "protein one");
    BOOST_CHECK(records[0].HasSourceKey());
    BOOST_CHECK_EQUAL(records[0].GetAllele(), "HLA-A*02:03");
    BOOST_CHECK_EQUAL(records[0].GetMethodName(), "netmhccons");
    BOOST_CHECK_EQUAL(records[11].GetOffset(), 11);
    BOOST_CHECK_CLOSE(records[11].GetAffinity(), 189.74, 1e-9);
    BOOST_CHECK_CLOSE(records[11].GetScore(), 0.515, 1e-9);
    BOOST_CHECK_CLOSE(records[11].GetPercentileRank(), 4.0, 1e-9);

    std::sort(records.begin(), records.end(), PRAffinityLess());
    BOOST_CHECK_EQUAL(records.front().GetPeptide(), "HIIIASSSL");
    BOOST_CHECK_EQUAL(records.back().GetPeptide(), "PEITHIIIA");
}

BOOST_AUTO_TEST_CASE(parse_file)
{
    TestDirectory tdir;
    WriteTextFile(tdir.file("out"), gConsOutput);
    TableParser parser(GetParserSpec(PSF_NETMHCCONS), "netMHCcons", "netmhccons", NULL, true);
    std::vector<PredictionRecord> records = parser.ParseFile(tdir.file("out"));
    BOOST_REQUIRE_EQUAL(records.size(), 12u);
    //unknown short keys are kept
    BOOST_CHECK_EQUAL(records[0].GetSourceKey(), "id0");
    BOOST_CHECK_THROW(parser.ParseFile(tdir.file("absent")), myruntime_error);
}

BOOST_AUTO_TEST_CASE(affinity_recovered_from_score)
{
    const char* output =
    "---\n"
    "0 HLA-A*02:01 SIINFEKLL s_0 0.515 -1 4.00\n"
    "1 HLA-A*02:01 IINFEKLLT s_0 0.200 nan 20.00\n"
    "2 HLA-A*02:01 INFEKLLTE s_0 nan nan 30.00\n"
    "---\n";
    TableParser parser(GetParserSpec(PSF_NETMHCCONS), "netMHCcons", "netmhccons", NULL, true);
    std::vector<PredictionRecord> records = parser.Parse(output);

    BOOST_REQUIRE_EQUAL(records.size(), 2u);
    BOOST_CHECK_CLOSE(records[0].GetAffinity(), std::pow(50000.0, 0.485), 1e-9);
    BOOST_CHECK_CLOSE(records[0].GetAffinity(), PredictionRecord::AffinityFromScore(0.515), 1e-9);
    BOOST_CHECK_CLOSE(records[1].GetAffinity(), std::pow(50000.0, 0.8), 1e-9);
    BOOST_CHECK_EQUAL(parser.GetNDropped(), 1u);
}

BOOST_AUTO_TEST_CASE(numbers_must_fill_field)
{
    const char* output =
    "---\n"
    "0 HLA-A*02:01 SIINFEKLL s_0 0.515 1e999 4.00\n"
    "1 HLA-A*02:01 IINFEKLLT s_0 0.515 12,5 4.00\n"
    "2 HLA-A*02:01 INFEKLLTE s_0 0.200 6000.0 4.00)\n"
    "3; HLA-A*02:01 NFEKLLTES s_0 0.200 6000.0 4.00\n"
    "4 HLA-A*02:01 FEKLLTESS s_0 (0.200 6000.0 4.00\n"
    "---\n";
    TableParser parser(GetParserSpec(PSF_NETMHCCONS), "netMHCcons", "netmhccons", NULL, true);
    std::vector<PredictionRecord> records = parser.Parse(output);

    //overflowing affinity is recovered from the score
    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK_EQUAL(records[0].GetPeptide(), "SIINFEKLL");
    BOOST_CHECK_CLOSE(records[0].GetAffinity(), std::pow(50000.0, 0.485), 1e-9);
    BOOST_CHECK_EQUAL(parser.GetNDropped(), 4u);
}

BOOST_AUTO_TEST_CASE(malformed_rows_dropped)
{
    const char* output =
    "rows before the table are ignored\n"
    "-----\n"
    "0 HLA-A*02:01 SIINFEKLL s_0 0.515 189.0 4.00\n"
    "1 HLA-A*02:01 IINFEKLLT s_0 0.200\n"
    "x HLA-A*02:01 INFEKLLTE s_0 0.200 6000.0 20.00\n"
    "3 HLA-A*02:01 NFEKLLTES s_0 0.200 6000.0 150.00\n"
    "4 HLA-A*02:01 FEKLLTESS s_0 abc 6000.0 20.00\n"
    "5 not-an-allele EKLLTESSS s_0 0.200 6000.0 20.00\n"
    "-----\n";
    TableParser parser(GetParserSpec(PSF_NETMHCCONS), "netMHCcons", "netmhccons", NULL, false);
    std::vector<PredictionRecord> records = parser.Parse(output);

    BOOST_REQUIRE_EQUAL(records.size(), 2u);
    BOOST_CHECK_EQUAL(parser.GetNDropped(), 4u);
    BOOST_CHECK(!records[0].HasSourceKey());
    BOOST_CHECK(records[0].GetSourceKey().empty());
    //names that cannot be normalized are kept as given
    BOOST_CHECK_EQUAL(records[1].GetAllele(), "not-an-allele");
}

BOOST_AUTO_TEST_CASE(netmhc3_binding_level_ignored)
{
    const char* output =
    "NetMHC version 3.4. 9mer predictions using Artificial Neural Networks - Direct. Allele HLA-A02:01.\n"
    "----------------------------------------------------------------------------------------------------\n"
    " pos    peptide      logscore affinity(nM) Bind Level    Protein Name     Allele\n"
    "----------------------------------------------------------------------------------------------------\n"
    "   0  SIINKFELL         0.437          441         WB              A1 HLA-A02:01\n"
    "   1  IINKFELLK         0.006        44556                         A1 HLA-A02:01\n"
    "   2  INKFELLKR         0.812           12         SB              A1 HLA-A02:01\n"
    "----------------------------------------------------------------------------------------------------\n";
    std::map<std::string,std::string> keymap;
    keymap["A1"] = "seq A";
    TableParser parser(GetParserSpec(PSF_NETMHC3), "netMHC", "netmhc3", &keymap, true);
    std::vector<PredictionRecord> records = parser.Parse(output);

    BOOST_REQUIRE_EQUAL(records.size(), 3u);
    BOOST_CHECK_EQUAL(records[0].GetPeptide(), "SIINKFELL");
    BOOST_CHECK_EQUAL(records[0].GetSourceKey(), "seq A");
    BOOST_CHECK_EQUAL(records[0].GetAllele(), "HLA-A*02:01");
    BOOST_CHECK_CLOSE(records[0].GetAffinity(), 441.0, 1e-9);
    BOOST_CHECK(!records[0].HasPercentileRank());
    BOOST_CHECK_CLOSE(records[1].GetAffinity(), 44556.0, 1e-9);
    BOOST_CHECK_CLOSE(records[2].GetScore(), 0.812, 1e-9);
}

BOOST_AUTO_TEST_CASE(netmhcpan3_positions_one_based)
{
    const char* output =
    "# NetMHCpan version 3.0\n"
    "-----------------------------------------------------------------------------------\n"
    "  Pos          HLA         Peptide       Core Of Gp Gl Ip Il        Icore        Identity   Score Aff(nM)   %Rank  BindLevel\n"
    "-----------------------------------------------------------------------------------\n"
    "    1  HLA-B*18:01        MFCQLAKT  MFCQLAK-T  0  0  0  8  1     MFCQLAKT     sequence0_0 0.02864 36676.0   45.00\n"
    "    2  HLA-B*18:01       FCQLAKTYP  FCQLAKTYP  0  0  0  0  0    FCQLAKTYP     sequence0_0 0.52000   180.1    1.10 <= WB\n"
    "-----------------------------------------------------------------------------------\n";
    std::map<std::string,std::string> keymap;
    keymap["sequence0_0"] = "sequence0";
    TableParser parser(GetParserSpec(PSF_NETMHCPAN3), "netMHCpan", "netmhcpan4", &keymap, true);
    std::vector<PredictionRecord> records = parser.Parse(output);

    BOOST_REQUIRE_EQUAL(records.size(), 2u);
    BOOST_CHECK_EQUAL(records[0].GetOffset(), 0);
    BOOST_CHECK_EQUAL(records[1].GetOffset(), 1);
    BOOST_CHECK_EQUAL(records[1].GetSourceKey(), "sequence0");
    BOOST_CHECK_CLOSE(records[1].GetAffinity(), 180.1, 1e-9);
    BOOST_CHECK_CLOSE(records[1].GetPercentileRank(), 1.1, 1e-9);
}

BOOST_AUTO_TEST_CASE(netmhcpan28_error_reported)
{
    TableParser parser(GetParserSpec(PSF_NETMHCPAN28), "netMHCpan", "netmhcpan28", NULL, true);
    BOOST_CHECK_EXCEPTION(
        parser.Parse("netMHCpan version 2.8\nERROR: HLA-A*99:99 is not a valid allele\n"),
        myruntime_error, processfailure);
    try {
        parser.Parse("# run\nError: cannot open file\n---\n");
        BOOST_ERROR("tool error not detected");
    } catch(myruntime_error const& ex) {
        BOOST_CHECK_EQUAL(ex.eclass(), PROCESSFAILURE);
        BOOST_CHECK_EQUAL(std::string(ex.what()), "netMHCpan failed - Error: cannot open file");
    }

    //the same text is an ordinary line for formats not scanned for errors
    TableParser consparser(GetParserSpec(PSF_NETMHCCONS), "netMHCcons", "netmhccons", NULL, true);
    BOOST_CHECK(consparser.Parse("ERROR: text\n").empty());
}

BOOST_AUTO_TEST_CASE(netmhciipan_table)
{
    const char* output =
    "# NetMHCIIpan version 3.1\n"
    "----------------------------------------------------------------------------------------------------------------------------\n"
    "   Seq          Allele              Peptide     Identity  Pos      Core  Core_Rel 1-log50k(aff) Affinity(nM)    %Rank Exp_Bind\n"
    "----------------------------------------------------------------------------------------------------------------------------\n"
    "     0      DRB1_0101      AGFKGEQGPKGEPGG     Sequence    3 KGEQGPKGE     0.560         0.198      5981.16    50.00   9.999\n"
    "     1      DRB1_0101      GFKGEQGPKGEPGGV     Sequence    4 GEQGPKGEP     0.580         0.210      5123.91    47.00   9.999\n"
    "----------------------------------------------------------------------------------------------------------------------------\n"
    "Number of strong binders: 0 Number of weak binders: 0\n";
    TableParser parser(GetParserSpec(PSF_NETMHCIIPAN), "netMHCIIpan", "netmhciipan3", NULL, false);
    std::vector<PredictionRecord> records = parser.Parse(output);

    BOOST_REQUIRE_EQUAL(records.size(), 2u);
    BOOST_CHECK_EQUAL(records[0].GetPeptide(), "AGFKGEQGPKGEPGG");
    BOOST_CHECK_EQUAL(records[0].GetAllele(), "HLA-DRB1*01:01");
    BOOST_CHECK(!records[0].HasSourceKey());
    BOOST_CHECK_CLOSE(records[0].GetAffinity(), 5981.16, 1e-9);
    BOOST_CHECK_CLOSE(records[0].GetScore(), 0.198, 1e-9);
    BOOST_CHECK_CLOSE(records[1].GetPercentileRank(), 47.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(netmhcpan4_elution_table)
{
    const char* output =
    "# NetMHCpan version 4.0\n"
    "-----------------------------------------------------------------------------------\n"
    "  Pos          HLA         Peptide       Core Of Gp Gl Ip Il        Icore        Identity     Score   %Rank  BindLevel\n"
    "-----------------------------------------------------------------------------------\n"
    "    1  HLA-A*02:01       SIINFEKLL  SIINFEKLL  0  0  0  0  0    SIINFEKLL         PEPLIST 0.1064240 2.3405\n"
    "    2  HLA-A*02:01       GILGFVFTL  GILGFVFTL  0  0  0  0  0    GILGFVFTL         PEPLIST 0.8932720 0.0280 <= SB\n"
    "-----------------------------------------------------------------------------------\n"
    "Protein PEPLIST. Allele HLA-A*02:01. Number of high binders 1. Number of weak binders 0. Number of peptides 2\n";
    TableParser parser(GetParserSpec(PSF_NETMHCPAN4EL), "netMHCpan", "netmhcpan4_el", NULL, false);
    std::vector<PredictionRecord> records = parser.Parse(output);

    BOOST_REQUIRE_EQUAL(records.size(), 2u);
    BOOST_CHECK_EQUAL(parser.GetNDropped(), 0u);
    BOOST_CHECK_EQUAL(records[0].GetOffset(), 0);
    BOOST_CHECK_EQUAL(records[1].GetOffset(), 1);
    BOOST_CHECK_EQUAL(records[1].GetPeptide(), "GILGFVFTL");
    //elution scores give no affinity
    BOOST_CHECK(!records[0].HasAffinity());
    BOOST_CHECK(!records[1].HasAffinity());
    BOOST_CHECK_CLOSE(records[1].GetScore(), 0.893272, 1e-9);
    BOOST_CHECK_CLOSE(records[1].GetPercentileRank(), 0.028, 1e-9);
}

BOOST_AUTO_TEST_CASE(netmhciipan4_tables)
{
    const char* output =
    "# NetMHCIIpan version 4.0\n"
    "--------------------------------------------------------------------------------------------------------------------------------------------\n"
    " Pos           MHC              Peptide   Of        Core  Core_Rel        Identity      Score_EL %Rank_EL Exp_Bind      Score_BA  Affinity(nM) %Rank_BA  BindLevel\n"
    "--------------------------------------------------------------------------------------------------------------------------------------------\n"
    "   1     DRB1_0101      PAPAPSWPLSSSVPS    4   PSWPLSSSV    0.327        Sequence      0.000857    92.78       NA      0.327674    1442.28    49.85\n"
    "   2     DRB1_0101      APAPSWPLSSSVPSQ    3   PSWPLSSSV    0.400        Sequence      0.001740    85.37       NA      0.349059    1145.32    44.07\n"
    "   3     DRB1_0101      PAPSWPLSSSVPSQK    2   PSWPLSSSV    0.400        Sequence      0.001740    85.37       NA      0.349059         -1    44.07\n"
    "--------------------------------------------------------------------------------------------------------------------------------------------\n";

    TableParser elparser(GetParserSpec(PSF_NETMHCIIPAN4EL), "netMHCIIpan", "netmhciipan4", NULL, false);
    std::vector<PredictionRecord> records = elparser.Parse(output);

    //an elution score does not recover an affinity
    BOOST_REQUIRE_EQUAL(records.size(), 2u);
    BOOST_CHECK_EQUAL(elparser.GetNDropped(), 1u);
    BOOST_CHECK_EQUAL(records[0].GetOffset(), 0);
    BOOST_CHECK_EQUAL(records[0].GetAllele(), "HLA-DRB1*01:01");
    BOOST_CHECK(!records[0].HasSourceKey());
    BOOST_CHECK_CLOSE(records[0].GetAffinity(), 1442.28, 1e-9);
    BOOST_CHECK_CLOSE(records[0].GetScore(), 0.000857, 1e-9);
    BOOST_CHECK_CLOSE(records[0].GetPercentileRank(), 92.78, 1e-9);

    TableParser baparser(GetParserSpec(PSF_NETMHCIIPAN4BA), "netMHCIIpan", "netmhciipan4_ba", NULL, false);
    records = baparser.Parse(output);

    BOOST_REQUIRE_EQUAL(records.size(), 3u);
    BOOST_CHECK_EQUAL(baparser.GetNDropped(), 0u);
    BOOST_CHECK_CLOSE(records[1].GetAffinity(), 1145.32, 1e-9);
    BOOST_CHECK_CLOSE(records[1].GetScore(), 0.349059, 1e-9);
    BOOST_CHECK_CLOSE(records[1].GetPercentileRank(), 44.07, 1e-9);
    BOOST_CHECK_CLOSE(records[2].GetAffinity(), PredictionRecord::AffinityFromScore(0.349059), 1e-9);
}

BOOST_AUTO_TEST_CASE(netmhcstabpan_table)
{
    const char* output =
    "# NetMHCstabpan version 1.0\n"
    "-----------------------------------------------------------------------------------------------------\n"
    " pos          HLA         peptide          Identity     Pred    Thalf(h) %Rank_Stab BindLevel\n"
    "-----------------------------------------------------------------------------------------------------\n"
    "    0    HLA-A*02:01       SIINFEKLL         PEPLIST    0.452      1.63      4.50 <= WB\n"
    "    1    HLA-A*02:01       GILGFVFTL         PEPLIST    0.819      9.31      0.10 <= SB\n"
    "-----------------------------------------------------------------------------------------------------\n";
    TableParser parser(GetParserSpec(PSF_NETMHCSTABPAN), "netMHCstabpan", "netmhcstabpan", NULL, false);
    std::vector<PredictionRecord> records = parser.Parse(output);

    BOOST_REQUIRE_EQUAL(records.size(), 2u);
    BOOST_CHECK_EQUAL(records[0].GetOffset(), 0);
    BOOST_CHECK_EQUAL(records[1].GetPeptide(), "GILGFVFTL");
    BOOST_CHECK_EQUAL(records[1].GetAllele(), "HLA-A*02:01");
    BOOST_CHECK(!records[1].HasAffinity());
    BOOST_CHECK_CLOSE(records[1].GetScore(), 0.819, 1e-9);
    BOOST_CHECK_CLOSE(records[1].GetPercentileRank(), 0.1, 1e-9);
}

BOOST_AUTO_TEST_SUITE_END()
