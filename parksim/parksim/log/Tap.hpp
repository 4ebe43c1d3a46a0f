// <Tap> -*- C++ -*-

#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "parksim/log/categories/CategoryManager.hpp"
#include "parksim/log/Destination.hpp"
#include "parksim/log/MessageInfo.hpp"
#include "parksim/utils/ParksimAssert.hpp"

namespace parksim
{
    namespace log
    {
        /*!
         * \brief Logging tap. Observes every MessageSource whose category
         * and origin match, writing messages to a Destination.
         *
         * A tap registers itself on construction and deregisters on
         * destruction, so the lifetime of the tap object is the window
         * during which it observes messages.
         *
         * \code
         * log::Tap t(log::categories::INFO_STR, std::cout);          // all info messages
         * log::Tap d("debug", "sched.log", "scheduler");             // scheduler debug to a file
         * log::Tap r("*", std::cerr, "ride");                        // everything under "ride."
         * \endcode
         */
        class Tap
        {
        public:

            //! Disallow copy construction
            Tap(const Tap&) = delete;

            //! Disallow copy assignment
            Tap& operator=(const Tap&) = delete;

            /*!
             * \brief Construct a tap
             * \param category Category to observe. "" or "*" observe any
             * category
             * \param dest Destination. An ostream, or a filename
             * \param origin Origin to observe. Matches the origin itself and
             * every origin nested below it ("ride" matches "ride.0"). Empty
             * observes every origin.
             * \throw ParksimException if the destination cannot be opened
             */
            template <typename DestT>
            Tap(const std::string& category, DestT& dest, const std::string& origin = "") :
                category_(category),
                origin_(origin)
            {
                Destination* d = DestinationManager::getDestination(dest); // Can instantiate new
                parksim_assert(d != nullptr);
                dest_ = d;
                attach_();
            }

            ~Tap() {
                detach_();
            }

            const std::string& getCategoryName() const {
                return category_;
            }

            const std::string& getOrigin() const {
                return origin_;
            }

            const Destination* getDestination() const {
                return dest_;
            }

            uint64_t getNumMessages() const {
                return num_msgs_;
            }

            //! Does this tap observe messages of \a category from \a origin
            bool observes(const std::string& origin, const std::string& category) const;

            //! Writes a message to the destination of this tap
            void send(const Message& msg) {
                ++num_msgs_;
                dest_->write(msg);
            }

            //! All taps currently attached
            static const std::vector<Tap*>& getTaps();

            /*!
             * \brief Incremented whenever a tap is attached or detached.
             * Message sources use this to cache whether they are observed.
             */
            static uint64_t getRegistryVersion();

        private:

            void attach_();
            void detach_();

            const std::string category_;
            const std::string origin_;
            Destination* dest_ = nullptr;
            uint64_t num_msgs_ = 0;
        };

    } // namespace log
} // namespace parksim
