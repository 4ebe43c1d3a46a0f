// <ThemePark.cpp> -*- C++ -*-

#include "parksim/model/ThemePark.hpp"

#include <memory>
#include <string>
#include <utility>

#include "parksim/log/categories/CategoryManager.hpp"
#include "parksim/model/ArrivalGenerator.hpp"
#include "parksim/model/FailureRepairCycle.hpp"
#include "parksim/utils/MathUtils.hpp"
#include "parksim/utils/ParksimAssert.hpp"

namespace parksim
{

namespace {
    // Validate before any member is built from the configuration
    const SimulationConfig & validated(const SimulationConfig & config) {
        config.validate();
        return config;
    }
}

ThemePark::ThemePark(const SimulationConfig & config) :
    config_(validated(config)),
    scheduler_("scheduler"),
    rng_(config.seed),
    stats_(config.num_rides),
    visitor_info_(&scheduler_, "visitors", log::categories::INFO_STR, "Visitor arrivals and rides"),
    info_(&scheduler_, "park", log::categories::INFO_STR, "Park run information")
{
    // Per-ride durations are drawn first so they do not depend on traffic
    if(config_.service_per_ride) {
        for(uint32_t i = 0; i < config_.num_rides; ++i) {
            ride_durations_.push_back(rng_.triangular(config_.service_min,
                                                      config_.service_mode,
                                                      config_.service_max));
        }
    }

    rides_.reserve(config_.num_rides);
    for(uint32_t i = 0; i < config_.num_rides; ++i) {
        std::unique_ptr<ResourcePool> ride(new ResourcePool(&scheduler_, "ride." + std::to_string(i),
                                                            config_.getCapacity(i)));
        rides_.emplace_back(std::move(ride));
    }
}

void ThemePark::start()
{
    parksim_assert(!started_, "Theme park already started");
    started_ = true;

    if(PARKSIM_EXPECT_FALSE(info_)) {
        info_ << "Opening " << config_.num_rides << " rides for " << config_.horizon
              << " min (seed " << config_.seed << ", policy " << config_.selection_policy
              << ", failures " << (config_.failures_enabled ? "on" : "off") << ")";
    }

    scheduler_.spawn(std::unique_ptr<Process>(new ArrivalGenerator(*this, stats_)));
    if(config_.failures_enabled) {
        for(uint32_t i = 0; i < config_.num_rides; ++i) {
            scheduler_.spawn(std::unique_ptr<Process>(new FailureRepairCycle(*this, stats_, i)));
        }
    }
}

StatisticsSnapshot ThemePark::run()
{
    start();
    scheduler_.run(config_.horizon);
    return snapshot();
}

StatisticsSnapshot ThemePark::snapshot()
{
    StatisticsSnapshot snap = stats_.snapshot(scheduler_.getCurrentTime(),
                                              getMeanServiceDuration(),
                                              ride_durations_);
    if(PARKSIM_EXPECT_FALSE(info_)) {
        info_ << "Closing: " << snap;
    }
    return snap;
}

double ThemePark::getServiceDuration(uint32_t ride)
{
    if(config_.service_per_ride) {
        return ride_durations_.at(ride);
    }
    return rng_.triangular(config_.service_min, config_.service_mode, config_.service_max);
}

double ThemePark::getMeanServiceDuration() const
{
    if(config_.service_per_ride) {
        return utils::mean(ride_durations_);
    }
    return config_.getServiceMean();
}

StatisticsSnapshot runSimulation(const SimulationConfig & config)
{
    ThemePark park(config);
    return park.run();
}

} // namespace parksim
