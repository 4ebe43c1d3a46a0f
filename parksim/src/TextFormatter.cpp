// <TextFormatter.cpp> -*- C++ -*-

#include "parksim/report/format/Text.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "parksim/utils/ParksimAssert.hpp"

namespace parksim
{
    namespace report
    {
        namespace format
        {

namespace
{
    std::string center(const std::string& s, size_t width)
    {
        if(s.size() >= width){
            return s;
        }
        const size_t pad = width - s.size();
        const size_t left = pad / 2;
        return std::string(left, ' ') + s + std::string(pad - left, ' ');
    }

    template<typename T>
    std::string fixed2(const T& val)
    {
        std::stringstream ss;
        ss << std::fixed << std::setprecision(2) << val;
        return ss.str();
    }
}

void Text::writeTable(std::ostream& out,
                      const std::vector<std::vector<std::string>>& rows)
{
    if(rows.empty()){
        return;
    }
    std::vector<size_t> widths;
    for(const auto& row : rows){
        if(row.size() > widths.size()){
            widths.resize(row.size(), 0);
        }
        for(size_t c = 0; c < row.size(); ++c){
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    std::stringstream rule;
    rule << '+';
    for(size_t w : widths){
        rule << std::string(w + 2, '-') << '+';
    }

    auto write_row = [&](const std::vector<std::string>& row) {
        out << '|';
        for(size_t c = 0; c < widths.size(); ++c){
            const std::string cell = c < row.size() ? row[c] : std::string();
            out << ' ' << center(cell, widths[c]) << " |";
        }
        out << '\n';
    };

    out << rule.str() << '\n';
    write_row(rows.front());
    out << rule.str() << '\n';
    for(size_t r = 1; r < rows.size(); ++r){
        write_row(rows[r]);
    }
    if(rows.size() > 1){
        out << rule.str() << '\n';
    }
}

void Text::writeHeaderToStream_(std::ostream& out) const
{
    out << "Simulation Results\n";
}

void Text::writeContentToStream_(std::ostream& out) const
{
    const StatisticsSnapshot& s = *snapshot_;

    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Ride", "Usage Count", "Failures"});
    for(uint32_t i = 0; i < s.getResourceCount(); ++i){
        rows.push_back({std::to_string(i),
                        std::to_string(s.getUsageCounts()[i]),
                        std::to_string(s.getFailureCounts()[i])});
    }
    writeTable(out, rows);

    writeSummary_(out);
    if(show_distributions_){
        writeDistributions_(out);
    }
}

void Text::writeSummary_(std::ostream& out) const
{
    const StatisticsSnapshot& s = *snapshot_;
    out << "\nSummary:\n"
        << "- Total visitors: " << s.getTotalVisitors() << '\n'
        << "- Average queue time: " << fixed2(s.getAverageQueueWait()) << " minutes\n"
        << "- Average ride utilization: " << fixed2(s.getUtilization() * 100.0) << "%\n";
    for(uint32_t i = 0; i < s.getResourceCount(); ++i){
        out << "- Ride " << i << " was used " << s.getUsageCounts()[i]
            << " times and failed " << s.getFailureCounts()[i] << " times\n";
    }
}

void Text::writeDistributions_(std::ostream& out) const
{
    const StatisticsSnapshot& s = *snapshot_;

    const auto qhist = s.getQueueWaitHistogram();
    const uint64_t qmax = *std::max_element(qhist.getCounts().begin(), qhist.getCounts().end());
    out << "\nQueue time distribution (minutes):\n";
    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Range", "Visitors", ""});
    for(size_t i = 0; i < qhist.getCounts().size(); ++i){
        // The last bin holds the longest wait
        const char* close = (i + 1 == qhist.getCounts().size()) ? "]" : ")";
        rows.push_back({"[" + fixed2(qhist.getBuckets()[i]) + ", " + fixed2(qhist.getUpperBound(i)) + close,
                        std::to_string(qhist.getCounts()[i]),
                        bar_(qhist.getCounts()[i], qmax)});
    }
    writeTable(out, rows);

    out << "\nRide usage share:\n";
    const auto shares = s.getUsageShares();
    rows.clear();
    rows.push_back({"Ride", "Share"});
    for(uint32_t i = 0; i < s.getResourceCount(); ++i){
        rows.push_back({std::to_string(i), fixed2(shares[i]) + "%"});
    }
    writeTable(out, rows);

    const auto ahist = s.getArrivalHistogram();
    const uint64_t amax = *std::max_element(ahist.getCounts().begin(), ahist.getCounts().end());
    out << "\nVisitor arrivals over time:\n";
    rows.clear();
    rows.push_back({"Minutes", "Arrivals", ""});
    for(size_t i = 0; i < ahist.getCounts().size(); ++i){
        std::stringstream range;
        range << '[' << ahist.getBuckets()[i] << ", " << ahist.getUpperBound(i) << ')';
        rows.push_back({range.str(),
                        std::to_string(ahist.getCounts()[i]),
                        bar_(ahist.getCounts()[i], amax)});
    }
    writeTable(out, rows);
}

std::string Text::bar_(uint64_t count, uint64_t largest) const
{
    if(largest == 0 || count == 0){
        return "";
    }
    uint64_t len = (count * bar_width_ + largest - 1) / largest;
    return std::string(static_cast<size_t>(len), '#');
}

        } // namespace format
    } // namespace report
} // namespace parksim
