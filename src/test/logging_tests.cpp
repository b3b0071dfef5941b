// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.h"

#include "test/test_kitties.h"

#include <string>

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(logging_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(format_log_message)
{
    BOOST_CHECK_EQUAL(logging::FormatLogMessage("plain\n"), "plain\n");
    BOOST_CHECK_EQUAL(logging::FormatLogMessage("%s owns %d kitties\n", std::string("alice"), 3), "alice owns 3 kitties\n");
    // too few arguments is reported in the message rather than thrown
    BOOST_CHECK(logging::FormatLogMessage("%s and %s\n", 1).find("Error") == 0);
}

BOOST_AUTO_TEST_CASE(categories)
{
    SetLogCategories({"kitties"});
    BOOST_CHECK(LogAcceptCategory("kitties"));
    BOOST_CHECK(!LogAcceptCategory("genetics"));
    BOOST_CHECK(LogAcceptCategory(nullptr));
    BOOST_CHECK_EQUAL(LogPrint("genetics", "hidden %d\n", 1), 0);

    SetLogCategories({"all"});
    BOOST_CHECK(LogAcceptCategory("genetics"));
    SetLogCategories({});
    BOOST_CHECK(!LogAcceptCategory("kitties"));
}

BOOST_AUTO_TEST_CASE(debug_log_file)
{
    const boost::filesystem::path dir = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path();
    const boost::filesystem::path path = dir / "debug.log";

    CloseDebugLog(); // drop anything buffered so far
    fPrintToDebugLog = true;
    const bool fOldTimestamps = fLogTimestamps;
    fLogTimestamps = false;
    LogPrintf("before open %d\n", 1);
    OpenDebugLog(path);
    LogPrintf("after open %s\n", std::string("x"));
    CloseDebugLog();
    fPrintToDebugLog = false;
    fLogTimestamps = fOldTimestamps;

    boost::filesystem::ifstream file(path);
    std::string line1, line2;
    std::getline(file, line1);
    std::getline(file, line2);
    BOOST_CHECK_EQUAL(line1, "before open 1");
    BOOST_CHECK_EQUAL(line2, "after open x");
    file.close();
    boost::filesystem::remove_all(dir);
}

BOOST_AUTO_TEST_SUITE_END()
