// <CSV> -*- C++ -*-

/*!
 * \file CSV.hpp
 * \brief CSV report output formatter
 */

#pragma once

#include <iostream>
#include <string>

#include "parksim/report/format/BaseOstreamFormatter.hpp"

namespace parksim
{
    namespace report
    {
        namespace format
        {

/*!
 * \brief Report formatter for CSV output.
 *
 * Writes one row per value, in three columns:
 * \code
 * section,name,value
 * summary,total_visitors,412
 * ride.0,usage_count,140
 * queue_time_bin.0,[0.00;1.23),87
 * queue_time_bin.19,[23.37;24.60],2
 * arrivals_bin.0,[0;10),9
 * \endcode
 * \note Non-Copyable
 */
class CSV : public BaseOstreamFormatter
{
public:

    /*!
     * \brief Constructor
     * \param snap Snapshot to provide output formatting for
     * \param output Ostream to write to when write() is called
     */
    CSV(const StatisticsSnapshot* snap, std::ostream& output) :
        BaseOstreamFormatter(snap, output)
    {
    }

    /*!
     * \brief Constructor
     * \param snap Snapshot to provide output formatting for
     * \param filename File which will be opened and written when write() is
     * called
     * \param mode Optional open mode. Should be std::ios::out or
     * std::ios::app
     */
    CSV(const StatisticsSnapshot* snap,
        const std::string& filename,
        std::ios::openmode mode=std::ios::out) :
        BaseOstreamFormatter(snap, filename, mode)
    {
    }

    virtual ~CSV()
    {
    }

protected:

    void writeHeaderToStream_(std::ostream& out) const override;

    void writeContentToStream_(std::ostream& out) const override;
};

        } // namespace format
    } // namespace report
} // namespace parksim
