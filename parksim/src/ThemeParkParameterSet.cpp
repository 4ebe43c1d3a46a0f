// <ThemeParkParameterSet.cpp> -*- C++ -*-

#include "parksim/model/ThemeParkParameterSet.hpp"

#include <cmath>

#include "parksim/utils/ParksimException.hpp"

namespace parksim
{

namespace {
    bool positive(const double & v) {
        return std::isfinite(v) && v > 0;
    }

    template <class T>
    bool allPositive(const std::vector<T> & vals) {
        for(const T & v : vals) {
            if(!(v > 0)) {
                return false;
            }
        }
        return true;
    }
}

ThemeParkParameterSet::ThemeParkParameterSet()
{
    run_time.addValidator("non-negative", [](const double & v) { return std::isfinite(v) && v >= 0; });
    num_rides.addValidator("positive", [](const uint32_t & v) { return v > 0; });
    ride_capacity.addValidator("non-empty", [](const std::vector<uint32_t> & v) { return !v.empty(); });
    ride_capacity.addValidator("positive", [](const std::vector<uint32_t> & v) { return allPositive(v); });
    arrival_band_starts.addValidator("non-empty", [](const std::vector<double> & v) { return !v.empty(); });
    arrival_band_rates.addValidator("positive", [](const std::vector<double> & v) { return allPositive(v); });
    mean_time_to_failure.addValidator("positive", positive);
    mean_repair_time.addValidator("positive", positive);
    service_min.addValidator("non-negative", [](const double & v) { return std::isfinite(v) && v >= 0; });
    selection_policy.addValidator("known policy", [](const std::string & v) {
        return v == "bounded_retry" || v == "unconditional";
    });
}

SimulationConfig ThemeParkParameterSet::makeConfig() const
{
    if(arrival_band_starts.getValue().size() != arrival_band_rates.getValue().size()) {
        throw InvalidConfiguration("arrival_band_starts has ")
            << arrival_band_starts.getValue().size() << " entries but arrival_band_rates has "
            << arrival_band_rates.getValue().size();
    }

    SimulationConfig cfg;
    cfg.horizon = run_time;
    cfg.seed = seed;
    cfg.num_rides = num_rides;
    cfg.ride_capacity = ride_capacity.getValue();
    cfg.arrival_bands.clear();
    for(size_t i = 0; i < arrival_band_starts.getValue().size(); ++i) {
        cfg.arrival_bands.push_back({arrival_band_starts.getValue()[i], arrival_band_rates.getValue()[i]});
    }
    cfg.failures_enabled = failures_enabled;
    cfg.mean_time_to_failure = mean_time_to_failure;
    cfg.mean_repair_time = mean_repair_time;
    cfg.service_min = service_min;
    cfg.service_mode = service_mode;
    cfg.service_max = service_max;
    cfg.service_per_ride = service_per_ride;
    cfg.selection_policy = parseSelectionPolicy(selection_policy.getValue());
    cfg.max_selection_retries = max_selection_retries;

    cfg.validate();
    return cfg;
}

} // namespace parksim
