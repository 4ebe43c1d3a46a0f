// <BaseOstreamFormatter> -*- C++ -*-

/*!
 * \file BaseOstreamFormatter.hpp
 * \brief Base of run report formatters writing to ostreams
 */

#ifndef __PARKSIM_REPORT_FORMAT_BASE_OSTREAM_FORMATTER_H__
#define __PARKSIM_REPORT_FORMAT_BASE_OSTREAM_FORMATTER_H__

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <ios>

#include "parksim/statistics/StatisticsSnapshot.hpp"
#include "parksim/utils/ParksimException.hpp"

namespace parksim
{
    namespace report
    {
        namespace format
        {

/*!
 * \brief Pure virtual formatter of a StatisticsSnapshot that writes to an
 * ostream or a file
 * \note Non-Copyable
 */
class BaseOstreamFormatter
{
public:

    //! \brief Reserved name for ostream targets
    static constexpr char OSTREAM_TARGET_NAME[] = "<ostream>";

    /*!
     * \brief Constructor with existing ostream. Has append semantics
     * \param snap Snapshot to format. Must outlive this formatter
     * \param output ostream to write to when write() is called
     */
    BaseOstreamFormatter(const StatisticsSnapshot* snap, std::ostream& output) :
        snapshot_(snap),
        output_(&output),
        filename_(OSTREAM_TARGET_NAME)
    { }

    /*!
     * \brief Constructor which opens a file. Truncates by default, but
     * \a mode can be used to specify how the file is opened.
     * \throw ParksimException if the file cannot be opened
     */
    BaseOstreamFormatter(const StatisticsSnapshot* snap,
                         const std::string& filename,
                         std::ios::openmode mode=std::ios::out) :
        snapshot_(snap),
        outfile_(new std::ofstream(filename, mode)),
        output_(outfile_.get()),
        filename_(filename)
    {
        if(!(*outfile_)){
            throw ParksimException("Failed to open file \"") << filename << "\" for storing report";
        }
        // Throw on write failure
        outfile_->exceptions(std::ostream::badbit | std::ostream::failbit);
    }

    BaseOstreamFormatter(const BaseOstreamFormatter&) = delete;
    BaseOstreamFormatter& operator=(const BaseOstreamFormatter&) = delete;

    virtual ~BaseOstreamFormatter()
    { }

    //! File written to, or OSTREAM_TARGET_NAME
    std::string getTarget() const {
        return filename_;
    }

    //! Write header and content to the output given at construction
    void write() const {
        writeToStream(*output_);
    }

    /*!
     * \brief Writes the report to a specific ostream
     * \post \a out will be flushed after writing
     */
    void writeToStream(std::ostream& out) const {
        if(nullptr == snapshot_){
            throw ParksimException("Attempting to write a report without a snapshot");
        }
        writeHeaderToStream_(out);
        writeContentToStream_(out);
        out.flush();
    }

protected:

    //! Writes what precedes the content. Subclasses must override
    virtual void writeHeaderToStream_(std::ostream& out) const = 0;

    //! Writes the content. Subclasses must override
    virtual void writeContentToStream_(std::ostream& out) const = 0;

    const StatisticsSnapshot* snapshot_;

private:

    std::unique_ptr<std::ofstream> outfile_;
    std::ostream* output_;
    std::string filename_;
};

        } // namespace format
    } // namespace report
} // namespace parksim

// __PARKSIM_REPORT_FORMAT_BASE_OSTREAM_FORMATTER_H__
#endif
