// <StatisticsCollector> -*- C++ -*-

/**
 * \file StatisticsCollector.hpp
 * \brief Append-only recorder of run statistics
 */

#pragma once

#include <cstdint>
#include <vector>

#include "parksim/kernel/EventQueue.hpp"
#include "parksim/statistics/StatisticsSnapshot.hpp"

namespace parksim
{
    /**
     * \class StatisticsCollector
     * \brief Accumulates queue waits, per-ride usage and failure counts, and
     * arrival times while a run is in progress.
     *
     * One collector is handed to every process of a run. Nothing is
     * aggregated while recording; snapshot() freezes the collector and
     * computes the aggregates once.
     */
    class StatisticsCollector
    {
    public:

        //! \param resource_count Number of rides to count usage and failures for
        explicit StatisticsCollector(uint32_t resource_count);

        StatisticsCollector(const StatisticsCollector &) = delete;
        StatisticsCollector & operator=(const StatisticsCollector &) = delete;

        //! \pre \a wait >= 0
        void recordQueueWait(double wait);

        void recordUsage(uint32_t resource_index);

        void recordFailure(uint32_t resource_index);

        void recordArrival(Time t);

        uint32_t getResourceCount() const {
            return static_cast<uint32_t>(usage_.size());
        }

        const std::vector<double> & getQueueWaits() const {
            return queue_waits_;
        }

        const std::vector<uint64_t> & getUsageCounts() const {
            return usage_;
        }

        const std::vector<uint64_t> & getFailureCounts() const {
            return failures_;
        }

        const std::vector<Time> & getArrivals() const {
            return arrivals_;
        }

        bool isFrozen() const {
            return frozen_;
        }

        /**
         * \brief Freeze the collector and build the immutable snapshot
         * \param horizon Horizon the run stopped at
         * \param mean_service_duration Mean service duration used for the
         * utilization figure
         * \param service_durations Fixed duration per ride, or empty
         * \post Any further record call throws
         */
        StatisticsSnapshot snapshot(Time horizon,
                                    double mean_service_duration,
                                    const std::vector<double> & service_durations);

    private:

        void checkIndex_(uint32_t resource_index) const;
        void checkNotFrozen_() const;

        std::vector<double> queue_waits_;
        std::vector<uint64_t> usage_;
        std::vector<uint64_t> failures_;
        std::vector<Time> arrivals_;
        bool frozen_ = false;
    };

} // namespace parksim
