// <MessageSource> -*- C++ -*-

#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <sstream>
#include <utility>

#include "parksim/log/MessageInfo.hpp"
#include "parksim/log/Tap.hpp"
#include "parksim/log/categories/CategoryManager.hpp"

namespace parksim
{
    class Scheduler;

    /*!
     * \brief Diagnostic logging framework. Components own message sources of
     * a specific category; taps observe them.
     */
    namespace log
    {
        /*!
         * \brief Message source object owned by a simulation component through
         * which messages can be sent.
         *
         * Messages are stamped with the current simulation time of the
         * scheduler given at construction (0 when there is none).
         *
         * \code
         * if(PARKSIM_EXPECT_FALSE(info_)) {
         *     info_ << "Visitor " << id << " arrived";
         * }
         * \endcode
         */
        class MessageSource
        {
        public:

            MessageSource(const MessageSource&) = delete;
            MessageSource& operator=(const MessageSource&) = delete;

            /*!
             * \brief Construct a message source
             * \param scheduler Scheduler providing message time stamps. May
             * be nullptr
             * \param origin Dotted name of the emitting component
             * (e.g. "ride.2")
             * \param category Category of messages from this source
             * \param desc Description of the messages
             */
            MessageSource(const Scheduler* scheduler,
                          const std::string& origin,
                          const std::string& category,
                          const std::string& desc) :
                scheduler_(scheduler),
                origin_(origin),
                category_(category),
                desc_(desc)
            { }

            //! \note No action on destruction
            ~MessageSource() {
            }

            uint64_t getNumEmitted() const {
                return num_emitted_;
            }

            const std::string& getCategoryName() const {
                return category_;
            }

            const std::string& getOrigin() const {
                return origin_;
            }

            const std::string& getDescription() const {
                return desc_;
            }

            //! Is any tap observing this source
            bool observed() const;

            operator bool() const {
                return observed();
            }

            /*!
             * \brief Gets the global warning logger. These messages are
             * observed by a Tap on the "warning" category with origin
             * "global" (or no origin)
             * \warning Do not use from within static initialization or
             * destruction
             */
            static MessageSource& getGlobalWarn();

            //! \name Message Generation
            //! @{
            ////////////////////////////////////////////////////////////////////////

            /*!
             * \brief Temporary object for constructing a log message with a
             * ostream-like interface. Emits a message to the message source
             * upon destruction.
             */
            class LogObject
            {
                //! Message source to through which the message will be emitted
                const MessageSource* src_;

                //! Temporary string buffer
                std::ostringstream s_;

            public:

                //! \brief Not default-constructable
                LogObject() = delete;

                //! Move constructor
                LogObject(LogObject&& rhp) :
                    src_(rhp.src_),
                    s_(std::move(rhp.s_.str())) // May unfortunately involve a copy
                {
                    rhp.src_ = nullptr;
                }

                //! \brief Not Copy-constructable
                LogObject(const LogObject& rhp) = delete;

                LogObject(const MessageSource& src) :
                    src_(&src)
                { }

                template <class T>
                LogObject(const MessageSource& src, const T& init) :
                    src_(&src)
                {
                    s_ << init;
                }

                /*!
                 * \brief Sends the message constructed within this object
                 * through MessageSource::emit_
                 */
                ~LogObject() {
                    if(src_){
                        src_->emit_(s_.str());
                    }
                }

                //! Cancel the message
                void cancel() {
                    src_ = nullptr;
                }

                template <class T>
                LogObject& operator<<(const T& t) {
                    s_ << t;
                    return *this;
                }

                //! Handler for stream modifiers (e.g. std::setw)
                LogObject& operator<<(std::ostream& (*f)(std::ostream&)) {
                    f(s_);
                    return *this;
                }

                //! Handler for format flags (e.g. std::fixed)
                LogObject& operator<<(std::ios_base& (*f)(std::ios_base&)) {
                    f(s_);
                    return *this;
                }
            };

            template <class T>
            LogObject operator<<(const T& t) const {
                return LogObject(*this, t);
            }

            LogObject emit(const std::string& msg) const {
                return LogObject(*this, msg);
            }

            ////////////////////////////////////////////////////////////////////////
            //! @}

        private:

            /*!
             * \brief Sends a message to every observing tap immediately.
             * \post Increments seq_num_
             */
            void emit_(const std::string& content) const;

            const Scheduler* scheduler_;
            const std::string origin_;
            const std::string category_;
            const std::string desc_;

            mutable uint64_t num_emitted_ = 0;

            //! Tap registry version when observed_ was computed
            mutable uint64_t cached_version_ = UINT64_MAX;
            mutable bool observed_ = false;

            static seq_num_type seq_num_;
        };

    } // namespace log
} // namespace parksim
