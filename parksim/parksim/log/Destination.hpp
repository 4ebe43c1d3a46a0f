// <Destination> -*- C++ -*-

#pragma once

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "parksim/log/MessageInfo.hpp"
#include "parksim/utils/ParksimException.hpp"

namespace parksim
{
    namespace log
    {
        /*!
         * \brief Generic logging destination which writes parksim::log::Message
         * structures to some output [file]stream. Subclasses are the
         * DestinationInstance specializations for ostreams and filenames.
         *
         * Several taps may share one destination. A message observed through
         * more than one of them is written only once (messages are filtered
         * by sequence number).
         */
        class Destination
        {
        public:

            Destination(const Destination&) = delete;
            Destination& operator=(const Destination&) = delete;

            Destination() = default;

            virtual ~Destination() {}

            //! Handle Destination::compare on filenames
            bool compare(const std::string& filename) const {
                return compareStrings(filename);
            }

            //! Handle Destination::compare on c-strings (filenames)
            bool compare(const char* filename) const {
                return compareStrings(filename);
            }

            //! Handle Destination::compare on ostreams
            bool compare(const std::ostream& o) const {
                return compareOstreams(o);
            }

            virtual bool compareStrings(const std::string&) const {
                return false;
            }

            virtual bool compareOstreams(const std::ostream&) const {
                return false;
            }

            //! Representation of this destination for debugging
            virtual std::string stringize() const = 0;

            void write(const Message& msg) {
                ++num_msgs_received_;

                if(msg.info.seq_num <= last_seq_){
                    // Same message arriving through a second tap
                    ++num_msg_duplicates_;
                    return;
                }

                ++num_msgs_written_;
                write_(msg);
                last_seq_ = msg.info.seq_num;
            }

            uint64_t getNumMessagesReceived() const { return num_msgs_received_; }

            uint64_t getNumMessagesWritten() const { return num_msgs_written_; }

            uint64_t getNumMessageDuplicates() const { return num_msg_duplicates_; }

        private:

            //! Write handler. Destinations end each message with a newline
            virtual void write_(const Message& msg) = 0;

            uint64_t num_msgs_received_ = 0;
            uint64_t num_msgs_written_ = 0;
            uint64_t num_msg_duplicates_ = 0;
            seq_num_type last_seq_ = -1;
        };

        /*!
         * \brief Writes the message header (time, sequence, origin,
         * category) followed by the content.
         */
        inline void writeDefault(std::ostream& o, const Message& msg) {
            o << msg.info << msg.content << std::endl;
        }

        /*!
         * \brief Destination, parameterized by its identifier type
         */
        template <typename DestType>
        class DestinationInstance;

        /*!
         * \brief Logging Destination for an already-open ostream
         */
        template <>
        class DestinationInstance<std::ostream> : public Destination
        {
            std::ostream& stream_;

        public:

            DestinationInstance(std::ostream& stream) :
                stream_(stream)
            {
                if(!stream.good()){
                    throw ParksimException("stream must be a good() ostream");
                }
            }

            bool compareOstreams(const std::ostream& o) const override {
                return &o == &stream_;
            }

            std::string stringize() const override {
                std::stringstream ss;
                ss << "<destination ostream=" << &stream_
                   << " rcv=" << getNumMessagesReceived()
                   << " wrote=" << getNumMessagesWritten()
                   << " dups=" << getNumMessageDuplicates() << ">";
                return ss.str();
            }

        private:

            void write_(const Message& msg) override {
                writeDefault(stream_, msg);
            }
        };

        /*!
         * \brief Destination that opens and writes to a file. The file is
         * truncated when the destination is created.
         */
        template <>
        class DestinationInstance<std::string> : public Destination
        {
            std::ofstream stream_;
            const std::string filename_;

        public:

            DestinationInstance(const std::string& filename) :
                stream_(filename, std::ofstream::out),
                filename_(filename)
            {
                if(stream_.good() == false){
                    throw ParksimException("Failed to open logging destination file \"")
                        << filename << "\"";
                }
            }

            bool compareStrings(const std::string& filename) const override {
                return filename == filename_;
            }

            std::string stringize() const override {
                std::stringstream ss;
                ss << "<destination file=\"" << filename_ << "\""
                   << " rcv=" << getNumMessagesReceived()
                   << " wrote=" << getNumMessagesWritten()
                   << " dups=" << getNumMessageDuplicates() << ">";
                return ss.str();
            }

        private:

            void write_(const Message& msg) override {
                writeDefault(stream_, msg);
            }
        };

        /*!
         * \brief Manages the set of destinations representing files or
         * streams. Destinations are never removed once constructed, so a
         * file is opened (and truncated) at most once per process.
         */
        class DestinationManager
        {
        public:

            typedef std::vector<std::unique_ptr<Destination>> DestinationVector;

            /*!
             * \brief Returns the existing destination matching \a arg, or
             * allocates a new one.
             * \throw ParksimException if a file cannot be opened
             */
            static Destination* getDestination(std::ostream& arg) {
                return findOrCreate_(arg, [&arg]() { return new DestinationInstance<std::ostream>(arg); });
            }

            static Destination* getDestination(const std::string& arg) {
                return findOrCreate_(arg, [&arg]() { return new DestinationInstance<std::string>(arg); });
            }

            static Destination* getDestination(const char* arg) {
                return getDestination(std::string(arg));
            }

            static const DestinationVector& getDestinations() {
                return dests_();
            }

            static uint32_t getNumDestinations() {
                return dests_().size();
            }

            static std::ostream& dumpDestinations(std::ostream& o) {
                for(auto& d : dests_()){
                    o << "  " << d->stringize() << std::endl;
                }
                return o;
            }

        private:

            template <class DestT, class CreateFunc>
            static Destination* findOrCreate_(const DestT& arg, CreateFunc create) {
                for(std::unique_ptr<Destination>& d : dests_()){
                    if(d->compare(arg)){
                        return d.get();
                    }
                }
                dests_().emplace_back(create());
                return dests_().back().get();
            }

            static DestinationVector& dests_() {
                static DestinationVector dests;
                return dests;
            }
        };

    } // namespace log
} // namespace parksim
