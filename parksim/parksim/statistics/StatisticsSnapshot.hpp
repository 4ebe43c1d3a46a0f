// <StatisticsSnapshot> -*- C++ -*-

/**
 * \file StatisticsSnapshot.hpp
 * \brief Immutable result of one simulation run
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <vector>

#include "parksim/kernel/EventQueue.hpp"
#include "parksim/statistics/BasicHistogram.hpp"

namespace parksim
{
    /**
     * \class StatisticsSnapshot
     * \brief Frozen statistics of a run, produced by
     * StatisticsCollector::snapshot once the scheduler has halted.
     *
     * Averages and utilization are computed once on construction.
     * Utilization is the busy slot-time divided by the available ride
     * time: sum(usage) * mean service duration / (horizon * ride count).
     */
    class StatisticsSnapshot
    {
    public:

        StatisticsSnapshot(Time horizon,
                           std::vector<double> queue_waits,
                           std::vector<uint64_t> usage,
                           std::vector<uint64_t> failures,
                           std::vector<Time> arrivals,
                           double mean_service_duration,
                           std::vector<double> service_durations);

        Time getHorizon() const {
            return horizon_;
        }

        uint32_t getResourceCount() const {
            return static_cast<uint32_t>(usage_.size());
        }

        //! Visitors who were granted a ride (one queue-wait sample each)
        uint64_t getTotalVisitors() const {
            return queue_waits_.size();
        }

        //! Visitors spawned by the arrival generator
        uint64_t getNumArrivals() const {
            return arrivals_.size();
        }

        //! Queue-wait samples in grant order
        const std::vector<double> & getQueueWaits() const {
            return queue_waits_;
        }

        const std::vector<uint64_t> & getUsageCounts() const {
            return usage_;
        }

        const std::vector<uint64_t> & getFailureCounts() const {
            return failures_;
        }

        //! Arrival timestamps in spawn order
        const std::vector<Time> & getArrivals() const {
            return arrivals_;
        }

        //! 0 when nobody was served
        double getAverageQueueWait() const {
            return avg_queue_wait_;
        }

        //! 0 for a zero horizon
        double getUtilization() const {
            return utilization_;
        }

        double getMeanServiceDuration() const {
            return mean_service_duration_;
        }

        //! Fixed service duration of each ride; empty when durations are
        //! drawn per visit
        const std::vector<double> & getServiceDurations() const {
            return service_durations_;
        }

        uint64_t getTotalUsage() const;

        uint64_t getTotalFailures() const;

        //! Share of all rides taken on each ride, in percent. All zero when
        //! no ride was taken
        std::vector<double> getUsageShares() const;

        /**
         * \brief Distribution of queue waits over \a num_bins equal-width
         * bins spanning [0, longest wait]
         */
        BasicHistogram<double> getQueueWaitHistogram(uint32_t num_bins = 20) const;

        /**
         * \brief Arrivals counted in consecutive bins of \a bin_width
         * minutes over [0, horizon]
         */
        BasicHistogram<double> getArrivalHistogram(Time bin_width = 10.0) const;

        bool operator==(const StatisticsSnapshot & rhs) const;

        bool operator!=(const StatisticsSnapshot & rhs) const {
            return !operator==(rhs);
        }

    private:

        Time horizon_;
        std::vector<double> queue_waits_;
        std::vector<uint64_t> usage_;
        std::vector<uint64_t> failures_;
        std::vector<Time> arrivals_;
        double mean_service_duration_;
        std::vector<double> service_durations_;

        double avg_queue_wait_ = 0;
        double utilization_ = 0;
    };

    //! One line summary
    std::ostream & operator<<(std::ostream & o, const StatisticsSnapshot & snap);

} // namespace parksim
