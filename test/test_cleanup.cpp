/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#include <boost/test/unit_test.hpp>

#include <stdio.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "libutil/mybase.h"
#include "libmyproc/pcutil/CleanupGuard.h"
#include "testutil.h"

BOOST_AUTO_TEST_SUITE(cleanup)

BOOST_AUTO_TEST_CASE(resources_removed_at_scope_exit)
{
    TestDirectory tdir;
    const std::string dir = tdir.file("work");
    BOOST_REQUIRE_EQUAL(mymkdir(dir.c_str()), 0);
    WriteTextFile(dir + "/nested", "x");
    WriteTextFile(tdir.file("input"), "x");
    {
        CleanupGuard guard(
            std::vector<std::string>(1, tdir.file("input")),
            std::vector<std::string>(1, dir));
        FILE* fp = guard.AddHandle(fopen(tdir.file("output").c_str(), "w"), tdir.file("output"));
        BOOST_REQUIRE(fp != NULL);
        fprintf(fp, "data");
        guard.AddFile(tdir.file("never_created"));
    }
    BOOST_CHECK(tdir.list().empty());
}

BOOST_AUTO_TEST_CASE(resources_removed_on_exception)
{
    TestDirectory tdir;
    WriteTextFile(tdir.file("input"), "x");
    auto failing = [&tdir]() {
        CleanupGuard guard;
        guard.AddFile(tdir.file("input"));
        throw std::runtime_error("failure");
    };
    BOOST_CHECK_THROW(failing(), std::runtime_error);
    BOOST_CHECK(tdir.list().empty());
}

BOOST_AUTO_TEST_CASE(cleanup_done_once)
{
    TestDirectory tdir;
    CleanupGuard guard;
    WriteTextFile(tdir.file("a"), "x");
    guard.AddFile(tdir.file("a"));
    guard.Cleanup();
    BOOST_CHECK(guard.IsDone());
    BOOST_CHECK(!file_exists(tdir.file("a").c_str()));

    //registered after cleanup: not touched again
    WriteTextFile(tdir.file("b"), "x");
    guard.AddFile(tdir.file("b"));
    guard.Cleanup();
    BOOST_CHECK(file_exists(tdir.file("b").c_str()));
}

BOOST_AUTO_TEST_CASE(removal_failure_warned)
{
    TestDirectory tdir;
    const std::string dir = tdir.file("notafile");
    BOOST_REQUIRE_EQUAL(mymkdir(dir.c_str()), 0);
    WriteTextFile(dir + "/nested", "x");

    WARNINGSRECORDED = false;
    {
        //a directory cannot be removed as a file
        CleanupGuard guard;
        guard.AddFile(dir);
    }
    BOOST_CHECK(WARNINGSRECORDED);
    BOOST_CHECK(directory_exists(dir.c_str()));
    WARNINGSRECORDED = false;
}

BOOST_AUTO_TEST_CASE(keep_mode_closes_handles_only)
{
    TestDirectory tdir;
    {
        CleanupGuard guard;
        guard.SetKeep(true);
        FILE* fp = guard.AddHandle(fopen(tdir.file("kept").c_str(), "w"), tdir.file("kept"));
        BOOST_REQUIRE(fp != NULL);
        fprintf(fp, "data");
    }
    BOOST_CHECK_EQUAL(ReadTextFile(tdir.file("kept")), "data");
}

BOOST_AUTO_TEST_CASE(closed_handle_flushed_before_removal)
{
    TestDirectory tdir;
    CleanupGuard guard;
    FILE* fp = guard.AddHandle(fopen(tdir.file("f").c_str(), "w"), tdir.file("f"));
    BOOST_REQUIRE(fp != NULL);
    fprintf(fp, "abc");
    guard.CloseHandle(fp);
    BOOST_CHECK_EQUAL(ReadTextFile(tdir.file("f")), "abc");
    guard.Cleanup();
    BOOST_CHECK(tdir.list().empty());
}

BOOST_AUTO_TEST_SUITE_END()
