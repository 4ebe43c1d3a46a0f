// <ThemePark> -*- C++ -*-

/**
 * \file ThemePark.hpp
 * \brief The theme park model and the runSimulation entry point
 */

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "parksim/kernel/Scheduler.hpp"
#include "parksim/log/MessageSource.hpp"
#include "parksim/model/RandomSource.hpp"
#include "parksim/model/SimulationConfig.hpp"
#include "parksim/resources/ResourcePool.hpp"
#include "parksim/statistics/StatisticsCollector.hpp"
#include "parksim/statistics/StatisticsSnapshot.hpp"

namespace parksim
{
    /**
     * \class ThemePark
     * \brief Owns everything a run needs: the scheduler, one resource
     * pool per ride, the random stream and the statistics collector.
     *
     * \code
     * ThemePark park(cfg);       // validates cfg, draws per-ride durations
     * StatisticsSnapshot s = park.run();
     * \endcode
     *
     * run() is start(), then the scheduler run to the horizon, then
     * snapshot(). Tests drive the three steps separately to place their
     * own visitors.
     */
    class ThemePark
    {
    public:

        /**
         * \throw InvalidConfiguration if \a config is not valid
         */
        explicit ThemePark(const SimulationConfig & config);

        ThemePark(const ThemePark &) = delete;
        ThemePark & operator=(const ThemePark &) = delete;

        /**
         * \brief Spawn the arrival generator and, when failures are
         * enabled, one failure/repair cycle per ride
         */
        void start();

        /**
         * \brief start(), run to the horizon and take the snapshot
         * \throw ParksimException if called twice
         */
        StatisticsSnapshot run();

        //! Freeze the statistics at the current simulation time
        StatisticsSnapshot snapshot();

        const SimulationConfig & getConfig() const {
            return config_;
        }

        Scheduler & getScheduler() {
            return scheduler_;
        }

        RandomSource & getRandom() {
            return rng_;
        }

        StatisticsCollector & getStatistics() {
            return stats_;
        }

        uint32_t getNumRides() const {
            return static_cast<uint32_t>(rides_.size());
        }

        //! \throw std::out_of_range for a bad index
        ResourcePool & getRide(uint32_t ride) {
            return *rides_.at(ride);
        }

        /**
         * \brief Service duration for the next ride on \a ride: its fixed
         * duration when durations are drawn per ride, else a fresh draw
         */
        double getServiceDuration(uint32_t ride);

        //! Fixed per-ride durations; empty when drawn per visit
        const std::vector<double> & getRideDurations() const {
            return ride_durations_;
        }

        //! Mean service duration used for utilization
        double getMeanServiceDuration() const;

        //! Info source for visitor narrative
        const log::MessageSource & getVisitorLogger() const {
            return visitor_info_;
        }

    private:

        const SimulationConfig config_;
        Scheduler scheduler_;
        RandomSource rng_;
        std::vector<double> ride_durations_;
        std::vector<std::unique_ptr<ResourcePool>> rides_;
        StatisticsCollector stats_;
        bool started_ = false;

        log::MessageSource visitor_info_;
        log::MessageSource info_;
    };

    /**
     * \brief Run one complete simulation
     * \throw InvalidConfiguration if \a config is not valid
     */
    StatisticsSnapshot runSimulation(const SimulationConfig & config);

} // namespace parksim
