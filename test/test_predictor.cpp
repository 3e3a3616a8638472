/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include <boost/test/unit_test.hpp>

#include <set>
#include <string>
#include <vector>

#include "libutil/mybase.h"
#include "libmhc/mdats/InputPartitioner.h"
#include "libmhc/mdats/PredictionCollection.h"
#include "libmhc/mtools/ToolPresets.h"
#include "libmhc/mtools/ToolSpec.h"
#include "libmhc/mproc/CmdlinePredictor.h"
#include "testutil.h"

namespace {
bool hasclass( myruntime_error const& ex, int ecl ) { return ex.eclass() == ecl; }
bool unavailable( myruntime_error const& ex ) { return hasclass(ex, TOOLUNAVAILABLE); }
bool unsupported( myruntime_error const& ex ) { return hasclass(ex, UNSUPPORTEDALLELE); }
bool invalidinput( myruntime_error const& ex ) { return hasclass(ex, INVALIDINPUT); }
bool incomplete( myruntime_error const& ex ) { return hasclass(ex, INCOMPLETERESULT); }
bool processfailure( myruntime_error const& ex ) { return hasclass(ex, PROCESSFAILURE); }

// lines of a text
std::vector<std::string> lines( const std::string& text )
{
    std::vector<std::string> result;
    size_t p = 0;
    while(p < text.size()) {
        size_t e = text.find('\n', p);
        if(e == std::string::npos)
            e = text.size();
        result.push_back(text.substr(p, e - p));
        p = e + 1;
    }
    return result;
}

// _________________________________________________________________________
// directory with a fake tool, its invocation log, and a root for
// temporary files
//
struct FakeToolFixture {
    FakeToolFixture()
    {
        logfile = tdir.file("log");
        temproot = tdir.file("tmp");
        if(mymkdir(temproot.c_str()) != 0)
            throw MYRUNTIME_ERROR("Failed to create directory " + temproot);
        program = WriteScript(tdir.file("fakecons"), FakeConsTool(logfile));
    }

    // tool description of the given preset run by the fake tool
    ToolSpec tool( const std::string& preset = TSP_NETMHCCONS ) const {
        ToolSpec spec = GetToolPreset(preset);
        spec.program_ = program;
        return spec;
    }

    void configure( CmdlinePredictor& predictor ) const {
        predictor.SetTempRoot(temproot);
        predictor.SetPollInterval(20);
    }

    size_t ninvocations() const {
        return file_exists(logfile.c_str())? lines(ReadTextFile(logfile)).size(): 0;
    }

    bool tempclean() const { return TestDirectory::ListDirectory(temproot).empty(); }

    TestDirectory tdir;
    std::string logfile;
    std::string temproot;
    std::string program;
};
}//namespace

BOOST_FIXTURE_TEST_SUITE(predictor, FakeToolFixture)

BOOST_AUTO_TEST_CASE(subsequences_of_sequences)
{
    CmdlinePredictor predictor(tool());
    configure(predictor);
    predictor.SetAlleles(std::vector<std::string>(1, "HLA-A0201"));
    BOOST_REQUIRE_EQUAL(predictor.GetAlleles().size(), 1u);
    BOOST_CHECK_EQUAL(predictor.GetAlleles()[0], "HLA-A*02:01");

    std::vector<TNamedSequence> sequences;
    sequences.push_back(TNamedSequence("seq one", "AAAAAAAAAC"));
    sequences.push_back(TNamedSequence("seq|two", "CCCCCCCCC"));
    sequences.push_back(TNamedSequence("short", "DDDD"));

    PredictionCollection result = predictor.PredictSubsequences(sequences, std::vector<int>(1, 9));

    BOOST_REQUIRE_EQUAL(result.size(), 3u);
    BOOST_CHECK_EQUAL(result[0].GetPeptide(), "AAAAAAAAA");
    BOOST_CHECK_EQUAL(result[0].GetSourceKey(), "seq one");
    BOOST_CHECK_EQUAL(result[0].GetOffset(), 0);
    BOOST_CHECK_EQUAL(result[1].GetPeptide(), "CCCCCCCCC");
    BOOST_CHECK_EQUAL(result[1].GetSourceKey(), "seq|two");
    BOOST_CHECK_EQUAL(result[1].GetOffset(), 0);
    BOOST_CHECK_EQUAL(result[2].GetPeptide(), "AAAAAAAAC");
    BOOST_CHECK_EQUAL(result[2].GetSourceKey(), "seq one");
    BOOST_CHECK_EQUAL(result[2].GetOffset(), 1);
    BOOST_CHECK_CLOSE(result[2].GetAffinity(), 102.0, 1e-9);
    BOOST_CHECK_EQUAL(result[2].GetAllele(), "HLA-A*02:01");
    BOOST_CHECK_EQUAL(result[2].GetMethodName(), TSP_NETMHCCONS);

    BOOST_CHECK_EQUAL(ninvocations(), 1u);
    BOOST_CHECK(lines(ReadTextFile(logfile))[0].find("-length 9") != std::string::npos);
    BOOST_CHECK(tempclean());
}

BOOST_AUTO_TEST_CASE(default_lengths)
{
    CmdlinePredictor predictor(tool());
    configure(predictor);
    predictor.SetAlleles(std::vector<std::string>(1, "HLA-A*02:01"));

    std::vector<TNamedSequence> sequences(1, TNamedSequence("seq", "SIINFEKLLT"));
    PredictionCollection result = predictor.PredictSubsequences(sequences, std::vector<int>());
    BOOST_CHECK_EQUAL(result.size(), 2u);

    BOOST_CHECK_EXCEPTION(
        predictor.PredictSubsequences(sequences, std::vector<int>(1, 7)),
        myruntime_error, invalidinput);
    BOOST_CHECK(tempclean());
}

BOOST_AUTO_TEST_CASE(peptide_list)
{
    CmdlinePredictor predictor(tool());
    configure(predictor);
    predictor.SetAlleles(std::vector<std::string>(1, "HLA-A*02:01"));

    std::vector<std::string> peptides;
    peptides.push_back("SIINFEKLL");
    peptides.push_back("SIINFEKL");
    peptides.push_back("SIINFEKLL");

    PredictionCollection result = predictor.PredictPeptides(peptides);

    BOOST_REQUIRE_EQUAL(result.size(), 2u);
    BOOST_CHECK_EQUAL(result[0].GetPeptide(), "SIINFEKL");
    BOOST_CHECK_CLOSE(result[0].GetAffinity(), 1008.0, 1e-9);
    BOOST_CHECK(!result[0].HasSourceKey());
    BOOST_CHECK_EQUAL(result[1].GetPeptide(), "SIINFEKLL");
    BOOST_CHECK_EQUAL(result.GetPeptides().size(), 2u);

    BOOST_REQUIRE_EQUAL(ninvocations(), 1u);
    std::string invocation = lines(ReadTextFile(logfile))[0];
    BOOST_CHECK(invocation.find("-p -a HLA-A02:01") == 0);
    BOOST_CHECK(invocation.find("-length") == std::string::npos);
    BOOST_CHECK(tempclean());
}

BOOST_AUTO_TEST_CASE(one_command_per_file_and_allele)
{
    CmdlinePredictor predictor(tool());
    configure(predictor);
    predictor.SetMaxRecords(1);
    predictor.SetProcessLimit(2);
    std::vector<std::string> alleles;
    alleles.push_back("HLA-A*02:01");
    alleles.push_back("HLA-B*07:02");
    alleles.push_back("HLA-B0702");
    predictor.SetAlleles(alleles);
    BOOST_CHECK_EQUAL(predictor.GetAlleles().size(), 2u);

    std::vector<std::string> peptides;
    peptides.push_back("SIINFEKLL");
    peptides.push_back("GILGFVFTL");
    peptides.push_back("NLVPMVATV");

    PredictionCollection result = predictor.PredictPeptides(peptides);
    BOOST_CHECK_EQUAL(result.size(), 6u);
    BOOST_CHECK_EQUAL(result.GetRecordsForAllele("HLA-B*07:02").size(), 3u);
    BOOST_CHECK_EQUAL(ninvocations(), 6u);
    BOOST_CHECK(tempclean());
}

BOOST_AUTO_TEST_CASE(temporary_files_kept)
{
    CmdlinePredictor predictor(tool());
    configure(predictor);
    predictor.SetKeepTemp(true);
    predictor.SetAlleles(std::vector<std::string>(1, "HLA-A*02:01"));
    predictor.PredictPeptides(std::vector<std::string>(1, "SIINFEKLL"));

    std::vector<std::string> entries = TestDirectory::ListDirectory(temproot);
    BOOST_REQUIRE_EQUAL(entries.size(), 1u);
    BOOST_CHECK(entries[0].find("mhcbatch_") == 0);
    std::vector<std::string> files = TestDirectory::ListDirectory(temproot + DIRSEP + entries[0]);
    BOOST_REQUIRE_EQUAL(files.size(), 3u);
    BOOST_CHECK(files[0].find("input_file_0_") == 0);
    BOOST_CHECK_EQUAL(files[1], "netmhccons_output_0_0");
    BOOST_CHECK_EQUAL(files[2], "tmp_0_0_netmhccons");
}

BOOST_AUTO_TEST_CASE(invalid_peptides)
{
    CmdlinePredictor predictor(tool());
    configure(predictor);
    predictor.SetAlleles(std::vector<std::string>(1, "HLA-A*02:01"));
    BOOST_CHECK_EXCEPTION(
        predictor.PredictPeptides(std::vector<std::string>(1, "SIIN1FEKL")),
        myruntime_error, invalidinput);
    BOOST_CHECK_EXCEPTION(
        predictor.PredictPeptides(std::vector<std::string>(1, "SIIN")),
        myruntime_error, invalidinput);
    BOOST_CHECK_EXCEPTION(
        predictor.PredictPeptides(std::vector<std::string>()),
        myruntime_error, invalidinput);
    BOOST_CHECK_EXCEPTION(
        predictor.SetAlleles(std::vector<std::string>()),
        myruntime_error, invalidinput);
    BOOST_CHECK_EQUAL(ninvocations(), 0u);
}

BOOST_AUTO_TEST_CASE(supported_alleles)
{
    ToolSpec spec = tool();
    spec.listflag_ = "-listMHC";
    CmdlinePredictor predictor(spec);
    configure(predictor);

    const std::set<std::string>& supported = predictor.SupportedAlleles();
    BOOST_REQUIRE_EQUAL(supported.size(), 3u);
    BOOST_CHECK(supported.count("HLA-A*02:03"));
    BOOST_CHECK(supported.count("HLA-B*07:02"));

    try {
        std::vector<std::string> alleles;
        alleles.push_back("HLA-A*02:01");
        alleles.push_back("HLA-C*07:01");
        predictor.SetAlleles(alleles);
        BOOST_ERROR("unsupported allele accepted");
    } catch(myruntime_error const& ex) {
        BOOST_CHECK_EQUAL(ex.eclass(), UNSUPPORTEDALLELE);
        BOOST_CHECK(std::string(ex.what()).find(
            "Run command " + program + " -listMHC to see a list of valid alleles") !=
            std::string::npos);
    }
    BOOST_CHECK_EXCEPTION(
        predictor.SetAlleles(std::vector<std::string>(1, "HLA-Q*01:01")),
        myruntime_error, unsupported);

    predictor.SetAlleles(std::vector<std::string>(1, "A0201"));
    BOOST_CHECK_EQUAL(predictor.GetAlleles()[0], "HLA-A*02:01");
    //the list is read once
    BOOST_CHECK_EQUAL(ninvocations(), 1u);
    BOOST_CHECK(tempclean());
}

BOOST_AUTO_TEST_CASE(empty_allele_list)
{
    ToolSpec spec = tool();
    spec.program_ = WriteScript(tdir.file("nolist"), "echo '# no alleles'\n");
    spec.listflag_ = "-listMHC";
    CmdlinePredictor predictor(spec);
    configure(predictor);
    try {
        predictor.SupportedAlleles();
        BOOST_ERROR("empty list accepted");
    } catch(myruntime_error const& ex) {
        BOOST_CHECK_EQUAL(ex.eclass(), TOOLUNAVAILABLE);
        BOOST_CHECK(std::string(ex.what()).find(
            "Possibly an incorrect executable version?") != std::string::npos);
    }

    CmdlinePredictor nolistflag(tool());
    BOOST_CHECK_THROW(nolistflag.SupportedAlleles(), myruntime_error);
}

BOOST_AUTO_TEST_CASE(tool_availability)
{
    CmdlinePredictor predictor(tool());
    configure(predictor);
    BOOST_CHECK_NO_THROW(predictor.CheckToolAvailable());

    ToolSpec spec = tool();
    spec.program_ = tdir.file("no_such_tool");
    CmdlinePredictor missing(spec);
    configure(missing);
    BOOST_CHECK_EXCEPTION(missing.CheckToolAvailable(), myruntime_error, unavailable);
}

BOOST_AUTO_TEST_CASE(netmhc_version)
{
    std::string v4 = WriteScript(tdir.file("netmhc4"), "echo 'Usage: netMHC -listMHC -f file'\n");
    std::string v3 = WriteScript(tdir.file("netmhc3"), "echo 'netMHC --Alleles'; exit 1\n");
    std::string unknown = WriteScript(tdir.file("netmhcx"), "echo 'help'\n");
    BOOST_CHECK_EQUAL(CmdlinePredictor::DetectNetMHCVersion(v4), TSP_NETMHC4);
    BOOST_CHECK_EQUAL(CmdlinePredictor::DetectNetMHCVersion(v3), TSP_NETMHC3);
    BOOST_CHECK_EXCEPTION(CmdlinePredictor::DetectNetMHCVersion(unknown), myruntime_error, unavailable);
    BOOST_CHECK_EXCEPTION(
        CmdlinePredictor::DetectNetMHCVersion(tdir.file("absent")), myruntime_error, unavailable);
}

BOOST_AUTO_TEST_CASE(netmhciipan_version)
{
    std::string v4 = WriteScript(tdir.file("netmhciipan4"), "echo '# NetMHCIIpan-4.0 options'\n");
    std::string v3 = WriteScript(tdir.file("netmhciipan3"), "echo 'NetMHCIIpan-3.2 usage'; exit 1\n");
    std::string unknown = WriteScript(tdir.file("netmhciipanx"), "echo 'NetMHCIIpan-2.0'\n");
    BOOST_CHECK_EQUAL(CmdlinePredictor::DetectNetMHCIIpanVersion(v4), TSP_NETMHCIIPAN4);
    BOOST_CHECK_EQUAL(CmdlinePredictor::DetectNetMHCIIpanVersion(v3), TSP_NETMHCIIPAN3);
    BOOST_CHECK_EXCEPTION(
        CmdlinePredictor::DetectNetMHCIIpanVersion(unknown), myruntime_error, unavailable);
}

// -------------------------------------------------------------------------
// temporary files are removed whichever stage fails
//
BOOST_AUTO_TEST_CASE(cleanup_on_command_build_failure)
{
    ToolSpec spec = tool(TSP_NETMHCIIPAN3);
    spec.listflag_.clear();
    CmdlinePredictor predictor(spec);
    configure(predictor);
    predictor.SetAlleles(std::vector<std::string>(1, "HLA-A*02:01"));
    BOOST_CHECK_EXCEPTION(
        predictor.PredictPeptides(std::vector<std::string>(1, "AGFKGEQGPKGEPGG")),
        myruntime_error, unsupported);
    BOOST_CHECK_EQUAL(ninvocations(), 0u);
    BOOST_CHECK(tempclean());
}

BOOST_AUTO_TEST_CASE(cleanup_on_process_failure)
{
    ToolSpec spec = tool();
    spec.program_ = WriteScript(tdir.file("failing"), "echo 'Segmentation fault' >&2; exit 4\n");
    CmdlinePredictor predictor(spec);
    configure(predictor);
    predictor.SetCaptureStderr(true);
    predictor.SetAlleles(std::vector<std::string>(1, "HLA-A*02:01"));
    try {
        predictor.PredictPeptides(std::vector<std::string>(1, "SIINFEKLL"));
        BOOST_ERROR("process failure not reported");
    } catch(myprocess_error const& ex) {
        BOOST_CHECK_EQUAL(ex.eclass(), PROCESSFAILURE);
        BOOST_CHECK_EQUAL(ex.exitcode(), 4);
    }
    BOOST_CHECK(tempclean());
}

BOOST_AUTO_TEST_CASE(cleanup_on_reported_error)
{
    ToolSpec spec = tool(TSP_NETMHCPAN28);
    spec.program_ = WriteScript(tdir.file("erroneous"), "echo 'ERROR: bad allele name'\n");
    spec.listflag_.clear();
    CmdlinePredictor predictor(spec);
    configure(predictor);
    predictor.SetAlleles(std::vector<std::string>(1, "HLA-A*02:01"));
    BOOST_CHECK_EXCEPTION(
        predictor.PredictPeptides(std::vector<std::string>(1, "SIINFEKLL")),
        myruntime_error, processfailure);
    BOOST_CHECK(tempclean());
}

BOOST_AUTO_TEST_CASE(cleanup_on_incomplete_output)
{
    ToolSpec spec = tool();
    spec.program_ = WriteScript(tdir.file("silent"), "echo '---'; echo '---'\n");
    CmdlinePredictor predictor(spec);
    configure(predictor);
    predictor.SetAlleles(std::vector<std::string>(1, "HLA-A*02:01"));
    BOOST_CHECK_EXCEPTION(
        predictor.PredictPeptides(std::vector<std::string>(1, "SIINFEKLL")),
        myruntime_error, incomplete);
    BOOST_CHECK(tempclean());
}

BOOST_AUTO_TEST_CASE(missing_temporary_root)
{
    CmdlinePredictor predictor(tool());
    configure(predictor);
    predictor.SetTempRoot(tdir.file("absent"));
    predictor.SetAlleles(std::vector<std::string>(1, "HLA-A*02:01"));
    BOOST_CHECK_THROW(
        predictor.PredictPeptides(std::vector<std::string>(1, "SIINFEKLL")), myruntime_error);
}

BOOST_AUTO_TEST_SUITE_END()
