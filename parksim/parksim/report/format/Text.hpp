// <Text> -*- C++ -*-

/*!
 * \file Text.hpp
 * \brief Plaintext report output formatter
 */

#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "parksim/report/format/BaseOstreamFormatter.hpp"

namespace parksim
{
    namespace report
    {
        namespace format
        {

/*!
 * \brief Report formatter for plaintext output
 *
 * Writes a boxed per-ride table followed by the summary lines:
 * \code
 * Simulation Results
 * +------+-------------+----------+
 * | Ride | Usage Count | Failures |
 * +------+-------------+----------+
 * |  0   |     140     |    3     |
 * +------+-------------+----------+
 *
 * Summary:
 * - Total visitors: 412
 * - Average queue time: 3.17 minutes
 * \endcode
 * Distribution tables (queue times, usage shares, arrivals) follow when
 * enabled with setShowDistributions.
 * \note Non-Copyable
 */
class Text : public BaseOstreamFormatter
{
public:

    //! Width of the longest bar in distribution tables
    static constexpr uint32_t DEFAULT_BAR_WIDTH = 40;

    /*!
     * \brief Constructor
     * \param snap Snapshot to provide output formatting for
     * \param output ostream to write to when write() is called
     */
    Text(const StatisticsSnapshot* snap, std::ostream& output) :
        BaseOstreamFormatter(snap, output)
    { }

    /*!
     * \brief Constructor
     * \param snap Snapshot to provide output formatting for
     * \param filename File which will be opened and written when write() is
     * called
     * \param mode Optional open mode. Should be std::ios::out or
     * std::ios::app
     */
    Text(const StatisticsSnapshot* snap,
         const std::string& filename,
         std::ios::openmode mode=std::ios::out) :
        BaseOstreamFormatter(snap, filename, mode)
    { }

    virtual ~Text()
    {
    }

    /*!
     * \brief Enable writing of the queue time, usage share and arrival
     * distribution tables after the summary
     */
    void setShowDistributions(bool show) { show_distributions_ = show; }

    bool getShowDistributions() const { return show_distributions_; }

    /*!
     * \brief Sets the width in characters of the longest histogram bar
     */
    void setBarWidth(uint32_t width) { bar_width_ = width; }

    uint32_t getBarWidth() const { return bar_width_; }

    /*!
     * \brief Renders rows as a boxed table with centered cells. The first
     * row is the heading and is separated from the rest by a rule.
     */
    static void writeTable(std::ostream& out,
                           const std::vector<std::vector<std::string>>& rows);

protected:

    void writeHeaderToStream_(std::ostream& out) const override;

    void writeContentToStream_(std::ostream& out) const override;

private:

    void writeSummary_(std::ostream& out) const;

    void writeDistributions_(std::ostream& out) const;

    std::string bar_(uint64_t count, uint64_t largest) const;

    bool show_distributions_ = false;
    uint32_t bar_width_ = DEFAULT_BAR_WIDTH;
};

        } // namespace format
    } // namespace report
} // namespace parksim
