// <Visitor.cpp> -*- C++ -*-

#include "parksim/model/Visitor.hpp"

#include <iomanip>
#include <string>

#include "parksim/model/ThemePark.hpp"
#include "parksim/statistics/StatisticsCollector.hpp"
#include "parksim/utils/ParksimAssert.hpp"

namespace parksim
{

Visitor::Visitor(ThemePark & park, StatisticsCollector & stats, uint64_t visitor_id) :
    Process("visitor." + std::to_string(visitor_id)),
    park_(park),
    stats_(stats),
    visitor_id_(visitor_id)
{
}

void Visitor::start_()
{
    arrival_ = now_();
    stats_.recordArrival(arrival_);

    const log::MessageSource & info = park_.getVisitorLogger();
    if(PARKSIM_EXPECT_FALSE(info)) {
        info << "Visitor " << visitor_id_ << " arrived";
    }

    if(!pickRide_()) {
        return;
    }

    queue_start_ = now_();
    acquire_(park_.getRide(ride_), CREATE_PARKSIM_HANDLER(Visitor, boarded_));
}

bool Visitor::pickRide_()
{
    const SimulationConfig & cfg = park_.getConfig();
    const log::MessageSource & info = park_.getVisitorLogger();

    ride_ = park_.getRandom().uniformIndex(park_.getNumRides());
    if(cfg.selection_policy == SelectionPolicy::UNCONDITIONAL) {
        return true;
    }

    uint32_t attempts = 0;
    while(!park_.getRide(ride_).isOperational() && attempts < cfg.max_selection_retries) {
        if(PARKSIM_EXPECT_FALSE(info)) {
            info << "Visitor " << visitor_id_ << " found Ride " << ride_ << " out of service";
        }
        ride_ = park_.getRandom().uniformIndex(park_.getNumRides());
        ++attempts;
    }

    if(!park_.getRide(ride_).isOperational()) {
        if(PARKSIM_EXPECT_FALSE(info)) {
            info << "Visitor " << visitor_id_ << " couldn't find any working ride";
        }
        return false;
    }
    return true;
}

void Visitor::boarded_()
{
    const Time wait = now_() - queue_start_;
    stats_.recordQueueWait(wait);
    stats_.recordUsage(ride_);

    const log::MessageSource & info = park_.getVisitorLogger();
    if(PARKSIM_EXPECT_FALSE(info)) {
        info << "Visitor " << visitor_id_ << " started Ride " << ride_ << " after waiting "
             << std::fixed << std::setprecision(2) << wait << " min";
    }

    hold_(park_.getServiceDuration(ride_), CREATE_PARKSIM_HANDLER(Visitor, finished_));
}

void Visitor::finished_()
{
    const log::MessageSource & info = park_.getVisitorLogger();
    if(PARKSIM_EXPECT_FALSE(info)) {
        info << "Visitor " << visitor_id_ << " finished Ride " << ride_;
    }
    release_(park_.getRide(ride_));
}

} // namespace parksim
