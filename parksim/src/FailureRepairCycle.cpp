// <FailureRepairCycle.cpp> -*- C++ -*-

#include "parksim/model/FailureRepairCycle.hpp"

#include <string>

#include "parksim/kernel/Scheduler.hpp"
#include "parksim/log/categories/CategoryManager.hpp"
#include "parksim/model/ThemePark.hpp"
#include "parksim/statistics/StatisticsCollector.hpp"

namespace parksim
{

FailureRepairCycle::FailureRepairCycle(ThemePark & park, StatisticsCollector & stats, uint32_t ride) :
    Process("ride." + std::to_string(ride) + ".failures"),
    park_(park),
    stats_(stats),
    ride_(ride),
    info_(&park.getScheduler(), "ride." + std::to_string(ride) + ".failures",
          log::categories::INFO_STR, "Ride failures and repairs")
{
}

void FailureRepairCycle::start_()
{
    scheduleFailure_();
}

void FailureRepairCycle::scheduleFailure_()
{
    const Time up = park_.getRandom().exponential(1.0 / park_.getConfig().mean_time_to_failure);
    hold_(up, CREATE_PARKSIM_HANDLER(FailureRepairCycle, fail_));
}

void FailureRepairCycle::fail_()
{
    ResourcePool & ride = park_.getRide(ride_);
    if(!ride.isOperational()) {
        // Already down through some other path
        scheduleFailure_();
        return;
    }

    ride.setOperational(false);
    stats_.recordFailure(ride_);
    ++num_failures_;
    if(PARKSIM_EXPECT_FALSE(info_)) {
        info_ << "Ride " << ride_ << " FAILED (" << ride.getOccupancy() << " aboard, "
              << ride.getNumWaiting() << " queued)";
    }

    const Time down = park_.getRandom().exponential(1.0 / park_.getConfig().mean_repair_time);
    hold_(down, CREATE_PARKSIM_HANDLER(FailureRepairCycle, repaired_));
}

void FailureRepairCycle::repaired_()
{
    park_.getRide(ride_).setOperational(true);
    if(PARKSIM_EXPECT_FALSE(info_)) {
        info_ << "Ride " << ride_ << " REPAIRED";
    }
    scheduleFailure_();
}

} // namespace parksim
