/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include "libutil/mybase.h"
#include "libmhc/mdats/AlleleNames.h"

namespace {
bool unsupported( myruntime_error const& ex ) { return ex.eclass() == UNSUPPORTEDALLELE; }
}

BOOST_AUTO_TEST_SUITE(alleles)

BOOST_AUTO_TEST_CASE(human_class_i_variants)
{
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("HLA-A0201"), "HLA-A*02:01");
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("A*02:01"), "HLA-A*02:01");
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("HLA-A02:01"), "HLA-A*02:01");
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("HLA-A*02:01"), "HLA-A*02:01");
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("hla-b*7:2"), "HLA-B*07:02");
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("HLA-A*02:01:01:02N"), "HLA-A*02:01");
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("HLAC0701"), "HLA-C*07:01");
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("B57011"), "HLA-B*57:011");
}

BOOST_AUTO_TEST_CASE(human_class_ii_variants)
{
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("DRB1_0101"), "HLA-DRB1*01:01");
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("HLA-DRB1*15:01"), "HLA-DRB1*15:01");
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("HLA-DQA10501-DQB10201"),
        "HLA-DQA1*05:01-DQB1*02:01");
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("HLA-DQA1*05:01-DQB1*02:01"),
        "HLA-DQA1*05:01-DQB1*02:01");
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("HLA-DRA10101-DRB10101"),
        "HLA-DRA1*01:01-DRB1*01:01");
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("HLA-DRA*01:01-DRB1*01:01"),
        "HLA-DRA1*01:01-DRB1*01:01");
}

BOOST_AUTO_TEST_CASE(mouse_alleles)
{
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("H-2-Kb"), "H-2-Kb");
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("H2-Db"), "H-2-Db");
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("H-2-IAb"), "H-2-IAb");
    BOOST_CHECK_EQUAL(AlleleNames::Normalize("H2-KB"), "H-2-Kb");
}

BOOST_AUTO_TEST_CASE(parsed_chains)
{
    std::vector<TAlleleChain> chains = AlleleNames::Parse("HLA-DQA10501-DQB10201");
    BOOST_REQUIRE_EQUAL(chains.size(), 2u);
    BOOST_CHECK(chains[0].IsAlphaChain());
    BOOST_CHECK(chains[1].IsClassII());
    BOOST_CHECK(!chains[1].IsAlphaChain());
    BOOST_CHECK_EQUAL(chains[0].GetCompactName(), "DQA10501");
    BOOST_CHECK_EQUAL(chains[1].GetName(), "DQB1*02:01");

    chains = AlleleNames::Parse("H-2-IAb");
    BOOST_REQUIRE_EQUAL(chains.size(), 1u);
    BOOST_CHECK(chains[0].IsMouse());
    BOOST_CHECK(chains[0].IsClassII());

    chains = AlleleNames::Parse("HLA-A*02:01");
    BOOST_REQUIRE_EQUAL(chains.size(), 1u);
    BOOST_CHECK(!chains[0].IsClassII());
}

BOOST_AUTO_TEST_CASE(invalid_names_rejected)
{
    BOOST_CHECK_EXCEPTION(AlleleNames::Normalize(""), myruntime_error, unsupported);
    BOOST_CHECK_EXCEPTION(AlleleNames::Normalize("HLA-Z*01:01"), myruntime_error, unsupported);
    BOOST_CHECK_EXCEPTION(AlleleNames::Normalize("HLA-A*02"), myruntime_error, unsupported);
    BOOST_CHECK_EXCEPTION(AlleleNames::Normalize("HLA-A*xx:01"), myruntime_error, unsupported);
    BOOST_CHECK_EXCEPTION(AlleleNames::Normalize("HLA-B*07:02-DRB1*01:01"), myruntime_error, unsupported);
    BOOST_CHECK_EXCEPTION(AlleleNames::Normalize("H-2-Zb"), myruntime_error, unsupported);
    BOOST_CHECK_EXCEPTION(AlleleNames::Normalize("DRB_0101"), myruntime_error, unsupported);

    std::string normalized = "unchanged";
    BOOST_CHECK(!AlleleNames::TryNormalize("not-an-allele", &normalized));
    BOOST_CHECK_EQUAL(normalized, "unchanged");
    BOOST_CHECK(AlleleNames::TryNormalize("A0201", &normalized));
    BOOST_CHECK_EQUAL(normalized, "HLA-A*02:01");
}

BOOST_AUTO_TEST_CASE(normalized_names_memoized)
{
    const std::string name = "HLA-B*44:03";
    AlleleNames::Normalize(name);
    size_t size = AlleleNames::GetCacheSize();
    BOOST_CHECK_EQUAL(AlleleNames::Normalize(name), "HLA-B*44:03");
    BOOST_CHECK_EQUAL(AlleleNames::GetCacheSize(), size);
    AlleleNames::Normalize("HLA-B4403");
    BOOST_CHECK_EQUAL(AlleleNames::GetCacheSize(), size + 1);
}

BOOST_AUTO_TEST_SUITE_END()
