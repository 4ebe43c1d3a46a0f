// <SimulationConfig.cpp> -*- C++ -*-

#include "parksim/model/SimulationConfig.hpp"

#include <cmath>

#include "parksim/utils/ParksimException.hpp"

namespace parksim
{

namespace {
    bool positiveFinite(double v) {
        return std::isfinite(v) && v > 0;
    }
}

SelectionPolicy parseSelectionPolicy(const std::string & name)
{
    if(name == "unconditional") {
        return SelectionPolicy::UNCONDITIONAL;
    }
    if(name == "bounded_retry") {
        return SelectionPolicy::BOUNDED_RETRY;
    }
    throw InvalidConfiguration("Unknown selection policy \"") << name
        << "\". Expected \"unconditional\" or \"bounded_retry\"";
}

std::ostream & operator<<(std::ostream & o, SelectionPolicy p)
{
    switch(p) {
    case SelectionPolicy::UNCONDITIONAL:
        o << "unconditional";
        break;
    case SelectionPolicy::BOUNDED_RETRY:
        o << "bounded_retry";
        break;
    }
    return o;
}

void SimulationConfig::validate() const
{
    if(!std::isfinite(horizon) || horizon < 0) {
        throw InvalidConfiguration("Horizon must be a finite, non-negative number of minutes, got ")
            << horizon;
    }
    if(num_rides == 0) {
        throw InvalidConfiguration("The park needs at least one ride");
    }

    if(ride_capacity.size() != 1 && ride_capacity.size() != num_rides) {
        throw InvalidConfiguration("Expected 1 or ") << num_rides << " ride capacities, got "
            << ride_capacity.size();
    }
    for(size_t i = 0; i < ride_capacity.size(); ++i) {
        if(ride_capacity[i] == 0) {
            throw InvalidConfiguration("Ride capacity ") << i << " must be positive";
        }
    }

    if(arrival_bands.empty()) {
        throw InvalidConfiguration("At least one arrival band is required");
    }
    if(arrival_bands.front().start != 0) {
        throw InvalidConfiguration("The first arrival band must start at 0, not ")
            << arrival_bands.front().start;
    }
    for(size_t i = 0; i < arrival_bands.size(); ++i) {
        const ArrivalBand & b = arrival_bands[i];
        if(!positiveFinite(b.rate)) {
            throw InvalidConfiguration("Arrival rate of band ") << i
                << " must be positive, got " << b.rate;
        }
        if(!std::isfinite(b.start) || (i > 0 && b.start <= arrival_bands[i - 1].start)) {
            throw InvalidConfiguration("Arrival band starts must increase, band ") << i
                << " starts at " << b.start;
        }
    }

    if(!positiveFinite(mean_time_to_failure)) {
        throw InvalidConfiguration("Mean time to failure must be positive, got ")
            << mean_time_to_failure;
    }
    if(!positiveFinite(mean_repair_time)) {
        throw InvalidConfiguration("Mean repair time must be positive, got ") << mean_repair_time;
    }

    if(!std::isfinite(service_min) || !std::isfinite(service_max) || service_min < 0) {
        throw InvalidConfiguration("Service durations must be finite and non-negative");
    }
    if(!(service_min <= service_mode && service_mode <= service_max)) {
        throw InvalidConfiguration("Service duration must satisfy min <= mode <= max, got ")
            << service_min << ", " << service_mode << ", " << service_max;
    }
}

uint32_t SimulationConfig::getCapacity(uint32_t ride) const
{
    if(ride_capacity.size() == 1) {
        return ride_capacity.front();
    }
    return ride_capacity.at(ride);
}

double SimulationConfig::getArrivalRate(Time t) const
{
    double rate = arrival_bands.front().rate;
    for(const ArrivalBand & b : arrival_bands) {
        if(t < b.start) {
            break;
        }
        rate = b.rate;
    }
    return rate;
}

} // namespace parksim
