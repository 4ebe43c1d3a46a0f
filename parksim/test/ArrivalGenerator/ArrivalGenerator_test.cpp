// <ArrivalGenerator_test> -*- C++ -*-

/**
 * \file ArrivalGenerator_test
 * \brief Arrival times produced by the piecewise-rate arrival generator
 */

#include <algorithm>
#include <memory>
#include <vector>

#include "parksim/model/ArrivalGenerator.hpp"
#include "parksim/model/ThemePark.hpp"
#include "parksim/utils/ParksimTester.hpp"

TEST_INIT

parksim::SimulationConfig arrivalsOnly()
{
    parksim::SimulationConfig cfg;
    cfg.failures_enabled = false;
    return cfg;
}

//! Runs only the arrival generator of a park and returns the arrival times
std::vector<parksim::Time> collectArrivals(const parksim::SimulationConfig & cfg,
                                           uint64_t & num_spawned)
{
    parksim::ThemePark park(cfg);
    parksim::Process * p = park.getScheduler().spawn(std::unique_ptr<parksim::Process>(
        new parksim::ArrivalGenerator(park, park.getStatistics())));
    park.getScheduler().run(cfg.horizon);

    // The generator never completes, so it is still owned by the scheduler
    num_spawned = static_cast<parksim::ArrivalGenerator *>(p)->getNumSpawned();
    return park.getStatistics().getArrivals();
}

void testArrivalsWithinHorizon()
{
    const parksim::SimulationConfig cfg = arrivalsOnly();
    uint64_t spawned = 0;
    const std::vector<parksim::Time> arrivals = collectArrivals(cfg, spawned);

    EXPECT_FALSE(arrivals.empty());
    EXPECT_EQUAL(arrivals.size(), spawned);
    EXPECT_TRUE(std::is_sorted(arrivals.begin(), arrivals.end()));
    EXPECT_TRUE(arrivals.front() >= 0.0);
    EXPECT_TRUE(arrivals.back() < cfg.horizon);

    // 10 + 20 + 60 expected over the three default bands
    EXPECT_TRUE(arrivals.size() > 40);
    EXPECT_TRUE(arrivals.size() < 160);
}

void testBusierBandsArriveFaster()
{
    const parksim::SimulationConfig cfg = arrivalsOnly();
    uint64_t spawned = 0;
    const std::vector<parksim::Time> arrivals = collectArrivals(cfg, spawned);

    const auto first_band = std::count_if(arrivals.begin(), arrivals.end(),
                                          [](parksim::Time t) { return t < 120; });
    const auto last_band = std::count_if(arrivals.begin(), arrivals.end(),
                                         [](parksim::Time t) { return t >= 240; });
    // 5 per hour over two hours against 15 per hour over four
    EXPECT_TRUE(last_band > first_band);
}

void testSameSeedSameArrivals()
{
    parksim::SimulationConfig cfg = arrivalsOnly();
    cfg.seed = 1234;
    uint64_t n1 = 0, n2 = 0, n3 = 0;
    const auto a1 = collectArrivals(cfg, n1);
    const auto a2 = collectArrivals(cfg, n2);
    EXPECT_TRUE(a1 == a2);
    EXPECT_EQUAL(n1, n2);

    cfg.seed = 4321;
    const auto a3 = collectArrivals(cfg, n3);
    EXPECT_FALSE(a1 == a3);
}

void testZeroHorizon()
{
    parksim::SimulationConfig cfg = arrivalsOnly();
    cfg.horizon = 0;
    uint64_t spawned = 99;
    const auto arrivals = collectArrivals(cfg, spawned);
    EXPECT_TRUE(arrivals.empty());
    EXPECT_EQUAL(spawned, 0);
}

void testRateLookup()
{
    parksim::SimulationConfig cfg;
    EXPECT_EQUAL(cfg.getArrivalRate(0), 5.0);
    EXPECT_EQUAL(cfg.getArrivalRate(119.9), 5.0);
    EXPECT_EQUAL(cfg.getArrivalRate(120), 10.0);
    EXPECT_EQUAL(cfg.getArrivalRate(300), 15.0);
    EXPECT_EQUAL(cfg.getArrivalRate(10000), 15.0);
}

int main()
{
    testArrivalsWithinHorizon();
    testBusierBandsArriveFaster();
    testSameSeedSameArrivals();
    testZeroHorizon();
    testRateLookup();

    REPORT_ERROR;
    return ERROR_CODE;
}
