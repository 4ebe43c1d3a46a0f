// <FailureRepairCycle_test> -*- C++ -*-

/**
 * \file FailureRepairCycle_test
 * \brief Alternating failures and repairs of a ride
 */

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "parksim/log/Tap.hpp"
#include "parksim/model/FailureRepairCycle.hpp"
#include "parksim/model/ThemePark.hpp"
#include "parksim/utils/ParksimTester.hpp"

TEST_INIT

//! Samples whether a ride is operational once per minute
class ServiceSampler : public parksim::Process
{
public:
    ServiceSampler(parksim::ResourcePool & ride, std::vector<bool> & samples) :
        parksim::Process("sampler"), ride_(ride), samples_(samples)
    {}

private:
    void start_() override {
        hold_(0.5, CREATE_PARKSIM_HANDLER(ServiceSampler, sample_));
    }

    void sample_() {
        samples_.push_back(ride_.isOperational());
        hold_(1.0, CREATE_PARKSIM_HANDLER(ServiceSampler, sample_));
    }

    parksim::ResourcePool & ride_;
    std::vector<bool> & samples_;
};

parksim::SimulationConfig failingPark()
{
    parksim::SimulationConfig cfg;
    cfg.horizon = 1000;
    cfg.num_rides = 2;
    cfg.mean_time_to_failure = 10;
    cfg.mean_repair_time = 5;
    return cfg;
}

void testFailuresAreCounted()
{
    parksim::ThemePark park(failingPark());
    parksim::Scheduler & sched = park.getScheduler();
    auto * cycle = static_cast<parksim::FailureRepairCycle *>(sched.spawn(
        std::unique_ptr<parksim::Process>(new parksim::FailureRepairCycle(park, park.getStatistics(), 1))));
    EXPECT_EQUAL(cycle->getRideIndex(), 1);
    EXPECT_EQUAL(cycle->getName(), std::string("ride.1.failures"));

    std::vector<bool> samples;
    sched.spawn(std::unique_ptr<parksim::Process>(new ServiceSampler(park.getRide(1), samples)));
    sched.run(1000);

    const auto & failures = park.getStatistics().getFailureCounts();
    EXPECT_EQUAL(failures[0], 0);
    EXPECT_EQUAL(failures[1], cycle->getNumFailures());

    // About one failure per 15 minutes
    EXPECT_TRUE(failures[1] > 30);
    EXPECT_TRUE(failures[1] < 120);

    // Down about a third of the time
    size_t down = 0;
    for(bool up : samples) {
        if(!up) {
            ++down;
        }
    }
    EXPECT_EQUAL(samples.size(), 1000);
    EXPECT_TRUE(down > 100);
    EXPECT_TRUE(down < 600);

    // Ride 0 has no cycle
    EXPECT_TRUE(park.getRide(0).isOperational());
}

void testAlreadyDownIsSkipped()
{
    parksim::ThemePark park(failingPark());
    parksim::Scheduler & sched = park.getScheduler();
    park.getRide(0).setOperational(false);
    auto * cycle = static_cast<parksim::FailureRepairCycle *>(sched.spawn(
        std::unique_ptr<parksim::Process>(new parksim::FailureRepairCycle(park, park.getStatistics(), 0))));
    sched.run(500);

    // Nothing repairs the ride, so no failure is ever recorded
    EXPECT_EQUAL(cycle->getNumFailures(), 0);
    EXPECT_EQUAL(park.getStatistics().getFailureCounts()[0], 0);
    EXPECT_FALSE(park.getRide(0).isOperational());
}

void testFailureLogging()
{
    parksim::ThemePark park(failingPark());
    std::stringstream log;
    {
        parksim::log::Tap t("info", log, "ride.0");
        park.getScheduler().spawn(std::unique_ptr<parksim::Process>(
            new parksim::FailureRepairCycle(park, park.getStatistics(), 0)));
        park.getScheduler().run(200);
    }
    const std::string out = log.str();
    EXPECT_TRUE(out.find("Ride 0 FAILED") != std::string::npos);
    EXPECT_TRUE(out.find("Ride 0 REPAIRED") != std::string::npos);
    EXPECT_TRUE(out.find("ride.0.failures") != std::string::npos);
}

void testDisabledFailures()
{
    parksim::SimulationConfig cfg = failingPark();
    cfg.failures_enabled = false;
    cfg.horizon = 300;
    const parksim::StatisticsSnapshot snap = parksim::runSimulation(cfg);
    EXPECT_EQUAL(snap.getTotalFailures(), 0);
}

int main()
{
    testFailuresAreCounted();
    testAlreadyDownIsSkipped();
    testFailureLogging();
    testDisabledFailures();

    REPORT_ERROR;
    return ERROR_CODE;
}
