// <CsvFormatter.cpp> -*- C++ -*-

#include "parksim/report/format/CSV.hpp"

#include <iomanip>

namespace parksim
{
    namespace report
    {
        namespace format
        {

void CSV::writeHeaderToStream_(std::ostream& out) const
{
    out << "section,name,value\n";
}

void CSV::writeContentToStream_(std::ostream& out) const
{
    const StatisticsSnapshot& s = *snapshot_;
    std::ios::fmtflags f = out.flags();
    const auto prec = out.precision();
    out << std::setprecision(6);

    out << "summary,horizon," << s.getHorizon() << '\n'
        << "summary,rides," << s.getResourceCount() << '\n'
        << "summary,arrivals," << s.getNumArrivals() << '\n'
        << "summary,total_visitors," << s.getTotalVisitors() << '\n'
        << "summary,average_queue_time," << s.getAverageQueueWait() << '\n'
        << "summary,utilization," << s.getUtilization() << '\n'
        << "summary,mean_service_duration," << s.getMeanServiceDuration() << '\n';

    const auto shares = s.getUsageShares();
    for(uint32_t i = 0; i < s.getResourceCount(); ++i){
        out << "ride." << i << ",usage_count," << s.getUsageCounts()[i] << '\n'
            << "ride." << i << ",failures," << s.getFailureCounts()[i] << '\n'
            << "ride." << i << ",usage_share_pct," << shares[i] << '\n';
        if(i < s.getServiceDurations().size()){
            out << "ride." << i << ",service_duration," << s.getServiceDurations()[i] << '\n';
        }
    }

    const auto qhist = s.getQueueWaitHistogram();
    for(size_t i = 0; i < qhist.getCounts().size(); ++i){
        out << "queue_time_bin." << i << ",[" << std::fixed << std::setprecision(2)
            << qhist.getBuckets()[i] << ';' << qhist.getUpperBound(i)
            << (i + 1 == qhist.getCounts().size() ? "]," : "),")
            << qhist.getCounts()[i] << '\n';
    }
    out.flags(f);
    out << std::setprecision(6);

    const auto ahist = s.getArrivalHistogram();
    for(size_t i = 0; i < ahist.getCounts().size(); ++i){
        out << "arrivals_bin." << i << ",[" << ahist.getBuckets()[i] << ';'
            << ahist.getUpperBound(i) << ")," << ahist.getCounts()[i] << '\n';
    }

    out.flags(f);
    out.precision(prec);
}

        } // namespace format
    } // namespace report
} // namespace parksim
