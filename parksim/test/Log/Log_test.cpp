// <Log_test> -*- C++ -*-

/**
 * \file Log_test
 * \brief Message sources, taps and destinations
 */

#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

#include "parksim/kernel/Scheduler.hpp"
#include "parksim/log/Destination.hpp"
#include "parksim/log/MessageInfo.hpp"
#include "parksim/log/MessageSource.hpp"
#include "parksim/log/Tap.hpp"
#include "parksim/log/categories/CategoryManager.hpp"
#include "parksim/utils/ParksimTester.hpp"

TEST_INIT

using parksim::log::MessageSource;
using parksim::log::Tap;

size_t countOf(const std::string & haystack, const std::string & needle)
{
    size_t n = 0;
    for(size_t pos = haystack.find(needle); pos != std::string::npos;
        pos = haystack.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

void testCategoryFiltering()
{
    MessageSource info(nullptr, "ride.0", parksim::log::categories::INFO_STR, "info");
    MessageSource debug(nullptr, "ride.0", parksim::log::categories::DEBUG_STR, "debug");
    EXPECT_FALSE(info.observed());

    std::stringstream info_out, all_out;
    {
        Tap info_tap("info", info_out);
        Tap all_tap("*", all_out);
        EXPECT_TRUE(info.observed());
        EXPECT_TRUE(debug.observed());

        info << "an info message";
        debug << "a debug message";
        EXPECT_EQUAL(info_tap.getNumMessages(), 1);
        EXPECT_EQUAL(all_tap.getNumMessages(), 2);
    }
    EXPECT_FALSE(info.observed());
    info << "nobody listens";

    EXPECT_EQUAL(countOf(info_out.str(), "\n"), 1);
    EXPECT_TRUE(info_out.str().find("an info message") != std::string::npos);
    EXPECT_TRUE(info_out.str().find("debug message") == std::string::npos);
    EXPECT_EQUAL(countOf(all_out.str(), "\n"), 2);
    EXPECT_TRUE(all_out.str().find("nobody listens") == std::string::npos);

    // Unobserved messages are still counted
    EXPECT_EQUAL(info.getNumEmitted(), 2);
    EXPECT_EQUAL(info.getOrigin(), std::string("ride.0"));
    EXPECT_EQUAL(info.getCategoryName(), std::string("info"));
}

void testOriginMatching()
{
    MessageSource ride(nullptr, "ride.1", "info", "ride");
    MessageSource failures(nullptr, "ride.1.failures", "info", "failures");
    MessageSource ride10(nullptr, "ride.10", "info", "other ride");

    std::stringstream out;
    {
        Tap t("info", out, "ride.1");
        EXPECT_TRUE(t.observes("ride.1", "info"));
        EXPECT_TRUE(t.observes("ride.1.failures", "info"));
        EXPECT_FALSE(t.observes("ride.10", "info"));
        EXPECT_FALSE(t.observes("ride.1", "debug"));
        EXPECT_EQUAL(t.getOrigin(), std::string("ride.1"));

        ride << "from ride";
        failures << "from failures";
        ride10 << "from ride ten";
    }
    const std::string s = out.str();
    EXPECT_TRUE(s.find("from ride") != std::string::npos);
    EXPECT_TRUE(s.find("from failures") != std::string::npos);
    EXPECT_TRUE(s.find("from ride ten") == std::string::npos);
}

void testDuplicateSuppression()
{
    MessageSource src(nullptr, "park", "info", "park");
    std::stringstream out;
    {
        // Two taps on one stream see every message, which is written once
        Tap a("info", out);
        Tap b("info", out, "park");
        EXPECT_EQUAL(a.getDestination(), b.getDestination());

        src << "once";
        src << "twice";

        EXPECT_EQUAL(a.getDestination()->getNumMessageDuplicates(), 2);
    }
    EXPECT_EQUAL(countOf(out.str(), "once"), 1);
    EXPECT_EQUAL(countOf(out.str(), "twice"), 1);
}

void testMessageHeader()
{
    parksim::Scheduler sched("clock");
    MessageSource src(&sched, "visitors", "info", "visitors");
    std::stringstream out;
    {
        Tap t("info", out);
        src << "value " << std::fixed << std::setprecision(2) << 1.5 << " min";
    }
    const std::string s = out.str();
    EXPECT_TRUE(s.find("{000000.000 0x") == 0);
    EXPECT_TRUE(s.find(" visitors info} value 1.50 min") != std::string::npos);
}

void testFileDestination()
{
    const std::string filename = "Log_test.log.txt";
    MessageSource src(nullptr, "park", "warning", "park warnings");
    {
        Tap t("warning", filename);
        src << "to the file";
        EXPECT_TRUE(t.getDestination()->compare(filename));
        EXPECT_FALSE(t.getDestination()->compare(std::cout));
    }

    std::ifstream in(filename);
    EXPECT_TRUE(in.good());
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_TRUE(contents.str().find("park warning} to the file") != std::string::npos);

    // An unopenable file is an error
    const std::string bad_filename = "no/such/dir/file.txt";
    EXPECT_THROW(Tap("warning", bad_filename));
}

void testGlobalWarn()
{
    std::stringstream out;
    {
        Tap t("warning", out, "global");
        MessageSource::getGlobalWarn() << "careful";
    }
    EXPECT_TRUE(out.str().find("global warning} careful") != std::string::npos);
}

void testDestinationManager()
{
    std::stringstream s1, s2;
    const uint32_t before = parksim::log::DestinationManager::getNumDestinations();
    parksim::log::Destination * d1 = parksim::log::DestinationManager::getDestination(s1);
    parksim::log::Destination * d1_again = parksim::log::DestinationManager::getDestination(s1);
    parksim::log::Destination * d2 = parksim::log::DestinationManager::getDestination(s2);
    EXPECT_EQUAL(d1, d1_again);
    EXPECT_NOTEQUAL(d1, d2);
    EXPECT_EQUAL(parksim::log::DestinationManager::getNumDestinations(), before + 2);

    std::stringstream dump;
    parksim::log::DestinationManager::dumpDestinations(dump);
    EXPECT_TRUE(dump.str().find("<destination") != std::string::npos);
}

int main()
{
    testCategoryFiltering();
    testOriginMatching();
    testDuplicateSuppression();
    testMessageHeader();
    testFileDestination();
    testGlobalWarn();
    testDestinationManager();

    REPORT_ERROR;
    return ERROR_CODE;
}
