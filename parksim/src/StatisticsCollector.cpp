// <StatisticsCollector.cpp> -*- C++ -*-

#include "parksim/statistics/StatisticsCollector.hpp"

#include "parksim/utils/ParksimAssert.hpp"

namespace parksim
{

StatisticsCollector::StatisticsCollector(uint32_t resource_count) :
    usage_(resource_count, 0),
    failures_(resource_count, 0)
{
}

void StatisticsCollector::recordQueueWait(double wait)
{
    checkNotFrozen_();
    parksim_assert(wait >= 0, "Negative queue wait " << wait);
    queue_waits_.push_back(wait);
}

void StatisticsCollector::recordUsage(uint32_t resource_index)
{
    checkNotFrozen_();
    checkIndex_(resource_index);
    ++usage_[resource_index];
}

void StatisticsCollector::recordFailure(uint32_t resource_index)
{
    checkNotFrozen_();
    checkIndex_(resource_index);
    ++failures_[resource_index];
}

void StatisticsCollector::recordArrival(Time t)
{
    checkNotFrozen_();
    parksim_assert(arrivals_.empty() || t >= arrivals_.back(),
                   "Arrival at " << t << " recorded after arrival at " << arrivals_.back());
    arrivals_.push_back(t);
}

StatisticsSnapshot StatisticsCollector::snapshot(Time horizon,
                                                 double mean_service_duration,
                                                 const std::vector<double> & service_durations)
{
    frozen_ = true;
    return StatisticsSnapshot(horizon, queue_waits_, usage_, failures_, arrivals_,
                              mean_service_duration, service_durations);
}

void StatisticsCollector::checkIndex_(uint32_t resource_index) const
{
    parksim_assert(resource_index < usage_.size(),
                   "Ride index " << resource_index << " out of range (" << usage_.size() << " rides)");
}

void StatisticsCollector::checkNotFrozen_() const
{
    parksim_assert(!frozen_, "Statistics recorded after the snapshot was taken");
}

} // namespace parksim
