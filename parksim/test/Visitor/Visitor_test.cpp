// <Visitor_test> -*- C++ -*-

/**
 * \file Visitor_test
 * \brief Ride selection, queueing and statistics recording of a visitor
 */

#include <memory>
#include <numeric>
#include <sstream>
#include <string>

#include "parksim/log/Tap.hpp"
#include "parksim/model/ThemePark.hpp"
#include "parksim/model/Visitor.hpp"
#include "parksim/utils/ParksimTester.hpp"

TEST_INIT

//! Park without arrivals or failures. Visitors are placed by the test
parksim::SimulationConfig quietPark(uint32_t num_rides, uint32_t capacity)
{
    parksim::SimulationConfig cfg;
    cfg.horizon = 100;
    cfg.num_rides = num_rides;
    cfg.ride_capacity = {capacity};
    cfg.failures_enabled = false;
    cfg.service_min = 3;
    cfg.service_mode = 3;
    cfg.service_max = 3;
    return cfg;
}

void spawnVisitor(parksim::ThemePark & park, uint64_t id)
{
    park.getScheduler().spawn(std::unique_ptr<parksim::Process>(
        new parksim::Visitor(park, park.getStatistics(), id)));
}

//! Brings every ride of the park back into service after a delay
class RepairCrew : public parksim::Process
{
public:
    RepairCrew(parksim::ThemePark & park, parksim::Time at) :
        parksim::Process("repair_crew"), park_(park), at_(at)
    {}

private:
    void start_() override {
        hold_(at_, CREATE_PARKSIM_HANDLER(RepairCrew, repair_));
    }

    void repair_() {
        for(uint32_t i = 0; i < park_.getNumRides(); ++i) {
            park_.getRide(i).setOperational(true);
        }
    }

    parksim::ThemePark & park_;
    const parksim::Time at_;
};

uint64_t totalUsage(parksim::ThemePark & park)
{
    const auto & u = park.getStatistics().getUsageCounts();
    return std::accumulate(u.begin(), u.end(), uint64_t(0));
}

// Two visitors on a one-slot ride: the second waits for the first ride
void testRideAndWait()
{
    parksim::ThemePark park(quietPark(1, 1));
    spawnVisitor(park, 1);
    spawnVisitor(park, 2);
    park.getScheduler().run(100);

    const auto & waits = park.getStatistics().getQueueWaits();
    EXPECT_EQUAL(waits.size(), 2);
    EXPECT_EQUAL(waits[0], 0.0);
    EXPECT_EQUAL(waits[1], 3.0);
    EXPECT_EQUAL(park.getStatistics().getUsageCounts()[0], 2);
    EXPECT_EQUAL(park.getStatistics().getArrivals().size(), 2);
    EXPECT_EQUAL(park.getRide(0).getOccupancy(), 0);
    EXPECT_EQUAL(park.getScheduler().getNumLiveProcesses(), 0);
}

// Every ride down for good: after the retries the visitor leaves without
// a queue wait or a ride
void testGivesUpWhenEveryRideIsDown()
{
    parksim::SimulationConfig cfg = quietPark(3, 10);
    cfg.selection_policy = parksim::SelectionPolicy::BOUNDED_RETRY;
    cfg.max_selection_retries = 5;
    parksim::ThemePark park(cfg);
    for(uint32_t i = 0; i < park.getNumRides(); ++i) {
        park.getRide(i).setOperational(false);
    }

    std::stringstream log;
    {
        parksim::log::Tap t("info", log, "visitors");
        spawnVisitor(park, 1);
        park.getScheduler().run(100);
    }

    EXPECT_EQUAL(park.getStatistics().getArrivals().size(), 1);
    EXPECT_TRUE(park.getStatistics().getQueueWaits().empty());
    EXPECT_EQUAL(totalUsage(park), 0);
    for(uint32_t i = 0; i < park.getNumRides(); ++i) {
        EXPECT_EQUAL(park.getRide(i).getNumWaiting(), 0);
    }
    EXPECT_EQUAL(park.getScheduler().getNumLiveProcesses(), 0);

    // One message per failed draw, then the give-up
    const std::string out = log.str();
    size_t retries = 0;
    for(size_t pos = out.find("out of service"); pos != std::string::npos;
        pos = out.find("out of service", pos + 1)) {
        ++retries;
    }
    EXPECT_EQUAL(retries, 5);
    EXPECT_TRUE(out.find("Visitor 1 couldn't find any working ride") != std::string::npos);

    const parksim::StatisticsSnapshot snap = park.snapshot();
    EXPECT_EQUAL(snap.getTotalVisitors(), 0);
    EXPECT_EQUAL(snap.getNumArrivals(), 1);
}

// With unconditional selection a visitor queues on a broken ride and
// boards once it is repaired
void testUnconditionalQueuesOnBrokenRide()
{
    parksim::SimulationConfig cfg = quietPark(2, 10);
    cfg.selection_policy = parksim::SelectionPolicy::UNCONDITIONAL;
    parksim::ThemePark park(cfg);
    for(uint32_t i = 0; i < park.getNumRides(); ++i) {
        park.getRide(i).setOperational(false);
    }

    park.getScheduler().spawn(std::unique_ptr<parksim::Process>(new RepairCrew(park, 7)));
    spawnVisitor(park, 1);
    park.getScheduler().run(1);
    EXPECT_EQUAL(park.getRide(0).getNumWaiting() + park.getRide(1).getNumWaiting(), 1);
    EXPECT_TRUE(park.getStatistics().getQueueWaits().empty());

    park.getScheduler().run(100);
    const auto & waits = park.getStatistics().getQueueWaits();
    EXPECT_EQUAL(waits.size(), 1);
    EXPECT_EQUAL(waits[0], 7.0);
    EXPECT_EQUAL(totalUsage(park), 1);
}

// With enough retries a visitor finds the one working ride
void testRetryFindsWorkingRide()
{
    parksim::SimulationConfig cfg = quietPark(2, 10);
    cfg.max_selection_retries = 200;
    parksim::ThemePark park(cfg);
    park.getRide(0).setOperational(false);

    for(uint64_t id = 1; id <= 5; ++id) {
        spawnVisitor(park, id);
    }
    park.getScheduler().run(100);

    EXPECT_EQUAL(park.getStatistics().getUsageCounts()[0], 0);
    EXPECT_EQUAL(park.getStatistics().getUsageCounts()[1], 5);
    EXPECT_EQUAL(park.getStatistics().getQueueWaits().size(), 5);
}

// A visitor mid-ride at the horizon is abandoned and never releases
void testAbandonedAtHorizon()
{
    parksim::ThemePark park(quietPark(1, 1));
    spawnVisitor(park, 1);
    spawnVisitor(park, 2);
    park.getScheduler().run(2);

    EXPECT_EQUAL(park.getStatistics().getQueueWaits().size(), 1);
    EXPECT_EQUAL(park.getRide(0).getOccupancy(), 1);
    EXPECT_EQUAL(park.getRide(0).getNumWaiting(), 1);
    EXPECT_EQUAL(park.getScheduler().getNumLiveProcesses(), 2);
}

int main()
{
    testRideAndWait();
    testGivesUpWhenEveryRideIsDown();
    testUnconditionalQueuesOnBrokenRide();
    testRetryFindsWorkingRide();
    testAbandonedAtHorizon();

    REPORT_ERROR;
    return ERROR_CODE;
}
