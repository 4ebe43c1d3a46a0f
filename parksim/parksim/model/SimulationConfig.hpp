// <SimulationConfig> -*- C++ -*-

/**
 * \file SimulationConfig.hpp
 * \brief Input of one theme park simulation run
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "parksim/kernel/EventQueue.hpp"

namespace parksim
{
    //! How a visitor picks the ride to queue for
    enum class SelectionPolicy {
        //! Pick one ride uniformly and queue for it even while it is down
        UNCONDITIONAL,
        //! Redraw while the pick is down, up to a bound, then leave the park
        BOUNDED_RETRY
    };

    /**
     * \brief Parse "unconditional" or "bounded_retry"
     * \throw InvalidConfiguration for anything else
     */
    SelectionPolicy parseSelectionPolicy(const std::string & name);

    std::ostream & operator<<(std::ostream & o, SelectionPolicy p);

    //! Arrival pressure from \a start until the next band starts
    struct ArrivalBand
    {
        Time   start;  //!< Minutes since opening
        double rate;   //!< Visitors per hour. Gaps are exponential with mean 60/rate minutes
    };

    /**
     * \brief Everything runSimulation needs. Defaults describe an eight
     * hour day in a three ride park.
     */
    struct SimulationConfig
    {
        Time     horizon   = 480;   //!< Minutes simulated
        uint64_t seed      = 42;
        uint32_t num_rides = 3;

        //! Slots per ride. One value applies to every ride
        std::vector<uint32_t> ride_capacity {10};

        //! Bands in increasing start order, the first starting at 0
        std::vector<ArrivalBand> arrival_bands {{0, 5}, {120, 10}, {240, 15}};

        bool   failures_enabled     = true;
        double mean_time_to_failure = 90;
        double mean_repair_time     = 15;

        double service_min  = 4;
        double service_mode = 5;
        double service_max  = 6;

        //! Draw one service duration per ride up front instead of one per visit
        bool service_per_ride = true;

        SelectionPolicy selection_policy      = SelectionPolicy::BOUNDED_RETRY;
        uint32_t        max_selection_retries = 5;

        /**
         * \brief Check the configuration before a run
         * \throw InvalidConfiguration describing the first problem found
         */
        void validate() const;

        //! Capacity of ride \a ride
        uint32_t getCapacity(uint32_t ride) const;

        //! Arrival rate (visitors per hour) in effect at \a t
        double getArrivalRate(Time t) const;

        //! Mean of the triangular service distribution
        double getServiceMean() const {
            return (service_min + service_mode + service_max) / 3.0;
        }
    };

} // namespace parksim
