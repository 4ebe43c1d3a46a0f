// <ThemeParkParameterSet> -*- C++ -*-

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "parksim/model/SimulationConfig.hpp"
#include "parksim/simulation/ParameterSet.hpp"

namespace parksim
{
    /**
     * \class ThemeParkParameterSet
     * \brief Every configurable knob of a theme park run, settable by name
     * from YAML files and the command line.
     *
     * Single-value checks are attached as validators. Checks spanning
     * several parameters happen in makeConfig().
     */
    class ThemeParkParameterSet : public ParameterSet
    {
    public:

        ThemeParkParameterSet();

        PARAMETER(double, run_time, 480, "Minutes of park opening simulated")
        PARAMETER(uint64_t, seed, 42, "Seed of the random stream")
        PARAMETER(uint32_t, num_rides, 3, "Number of rides")
        PARAMETER(std::vector<uint32_t>, ride_capacity, (std::vector<uint32_t>{10}),
                  "Riders per ride. A single value applies to every ride")
        PARAMETER(std::vector<double>, arrival_band_starts, (std::vector<double>{0, 120, 240}),
                  "Minute at which each arrival band starts. The first must be 0")
        PARAMETER(std::vector<double>, arrival_band_rates, (std::vector<double>{5, 10, 15}),
                  "Visitors per hour in each arrival band")
        PARAMETER(bool, failures_enabled, true, "Rides fail and get repaired")
        PARAMETER(double, mean_time_to_failure, 90, "Mean minutes between a repair and the next failure")
        PARAMETER(double, mean_repair_time, 15, "Mean minutes to repair a failed ride")
        PARAMETER(double, service_min, 4, "Shortest ride duration in minutes")
        PARAMETER(double, service_mode, 5, "Most likely ride duration in minutes")
        PARAMETER(double, service_max, 6, "Longest ride duration in minutes")
        PARAMETER(bool, service_per_ride, true,
                  "Draw one duration per ride up front instead of one per visit")
        PARAMETER(std::string, selection_policy, "bounded_retry",
                  "How visitors pick a ride: bounded_retry or unconditional")
        PARAMETER(uint32_t, max_selection_retries, 5,
                  "Redraws a bounded_retry visitor makes before leaving")

        /**
         * \brief Build the run configuration from the current values
         * \throw InvalidConfiguration if the values are inconsistent
         */
        SimulationConfig makeConfig() const;
    };

} // namespace parksim
