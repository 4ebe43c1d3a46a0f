// <StatisticsSnapshot.cpp> -*- C++ -*-

#include "parksim/statistics/StatisticsSnapshot.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <utility>

#include "parksim/utils/MathUtils.hpp"
#include "parksim/utils/ParksimAssert.hpp"

namespace parksim
{

StatisticsSnapshot::StatisticsSnapshot(Time horizon,
                                       std::vector<double> queue_waits,
                                       std::vector<uint64_t> usage,
                                       std::vector<uint64_t> failures,
                                       std::vector<Time> arrivals,
                                       double mean_service_duration,
                                       std::vector<double> service_durations) :
    horizon_(horizon),
    queue_waits_(std::move(queue_waits)),
    usage_(std::move(usage)),
    failures_(std::move(failures)),
    arrivals_(std::move(arrivals)),
    mean_service_duration_(mean_service_duration),
    service_durations_(std::move(service_durations))
{
    parksim_assert(usage_.size() == failures_.size(),
                   "usage and failure counters disagree on the ride count");

    avg_queue_wait_ = utils::mean(queue_waits_);

    const double available = horizon_ * static_cast<double>(usage_.size());
    if(available > 0) {
        utilization_ = static_cast<double>(getTotalUsage()) * mean_service_duration_ / available;
    }
}

uint64_t StatisticsSnapshot::getTotalUsage() const
{
    return std::accumulate(usage_.begin(), usage_.end(), uint64_t(0));
}

uint64_t StatisticsSnapshot::getTotalFailures() const
{
    return std::accumulate(failures_.begin(), failures_.end(), uint64_t(0));
}

std::vector<double> StatisticsSnapshot::getUsageShares() const
{
    std::vector<double> shares(usage_.size(), 0.0);
    const uint64_t total = getTotalUsage();
    if(total == 0) {
        return shares;
    }
    for(size_t i = 0; i < usage_.size(); ++i) {
        shares[i] = 100.0 * static_cast<double>(usage_[i]) / static_cast<double>(total);
    }
    return shares;
}

BasicHistogram<double> StatisticsSnapshot::getQueueWaitHistogram(uint32_t num_bins) const
{
    double longest = 0;
    if(!queue_waits_.empty()) {
        longest = *std::max_element(queue_waits_.begin(), queue_waits_.end());
    }
    // A degenerate range is widened so the bins keep a positive width
    if(longest <= 0) {
        longest = 1.0;
    }

    auto hist = BasicHistogram<double>::equalWidth("queue_wait", 0.0, longest, num_bins);
    for(double w : queue_waits_) {
        hist.addValue(w);
    }
    return hist;
}

BasicHistogram<double> StatisticsSnapshot::getArrivalHistogram(Time bin_width) const
{
    parksim_assert(bin_width > 0, "Arrival bin width must be positive");
    std::vector<double> edges;
    for(Time t = 0; t < horizon_ || edges.empty(); t += bin_width) {
        edges.push_back(t);
    }
    BasicHistogram<double> hist("arrivals", edges);
    hist.setUpperBound(edges.back() + bin_width);
    for(Time t : arrivals_) {
        hist.addValue(t);
    }
    return hist;
}

bool StatisticsSnapshot::operator==(const StatisticsSnapshot & rhs) const
{
    return horizon_ == rhs.horizon_ &&
        queue_waits_ == rhs.queue_waits_ &&
        usage_ == rhs.usage_ &&
        failures_ == rhs.failures_ &&
        arrivals_ == rhs.arrivals_ &&
        mean_service_duration_ == rhs.mean_service_duration_ &&
        service_durations_ == rhs.service_durations_;
}

std::ostream & operator<<(std::ostream & o, const StatisticsSnapshot & snap)
{
    std::ios::fmtflags f = o.flags();
    const auto prec = o.precision();
    o << "<snapshot horizon:" << snap.getHorizon()
      << " rides:" << snap.getResourceCount()
      << " arrivals:" << snap.getNumArrivals()
      << " visitors:" << snap.getTotalVisitors()
      << std::fixed << std::setprecision(2)
      << " avg_wait:" << snap.getAverageQueueWait()
      << " utilization:" << (snap.getUtilization() * 100.0) << "%>";
    o.flags(f);
    o.precision(prec);
    return o;
}

} // namespace parksim
