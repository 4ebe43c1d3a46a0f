// <ParksimException> -*- C++ -*-

/**
 * \file   ParksimException.hpp
 *
 * \brief  Exception classes for all of PARKSIM.
 */

#ifndef __PARKSIM_EXCEPTION_H__
#define __PARKSIM_EXCEPTION_H__

#include <exception>
#include <sstream>
#include <string>

namespace parksim
{
    /**
     * \class ParksimException
     *
     * Used to construct and throw a standard C++ exception. Inherits from
     * std::exception.
     *
     * Usage:
     * \code
     * uint32_t capacity = 0;
     * throw parksim::ParksimException("Bad capacity: ") << capacity;
     * \endcode
     */
    class ParksimException : public std::exception
    {
    public:

        /**
         * \brief Construct a ParksimException object with empty reason
         * \note All other non-copy constructors delegate to this one so
         * that breakpoints can easily be placed on one symbol to catch
         * parksim exceptions
         */
        ParksimException();

        /**
         * \brief Construct a ParksimException object
         * \param reason The reason for the exception
         */
        ParksimException(const std::string & reason);

        /**
         * \brief Copy construct a ParksimException object
         */
        ParksimException(const ParksimException & orig);

        /// Destroy!
        virtual ~ParksimException() noexcept;

        /**
         * \brief Overload from std::exception
         * \return Const char * of the exception reason
         */
        const char* what() const noexcept override {
            reason_str_ = reason_.str();
            return reason_str_.c_str();
        }

        /**
         * \brief Return the raw reason without file, line information
         * \return The raw reason, no file information
         */
        std::string rawReason() const {
            return raw_reason_;
        }

        /**
         * \brief Append additional information to the message.
         * \param msg The addition info
         * \return This exception object
         */
        template<class T>
        ParksimException & operator<<(const T & msg) {
            reason_ << msg;
            return *this;
        }

    private:
        // The raw reason without file/line information
        std::string raw_reason_;

        // The reason/explanation for the exception
        std::stringstream reason_;

        // Local copy of the string formed in the string stream for the
        // 'what' call
        mutable std::string reason_str_;
    };

    /**
     * \brief A simulation was configured with values it cannot run with
     * (non-positive capacity or rate, negative horizon, malformed
     * distribution parameters, unknown parameter names).
     *
     * Detected before the run starts and fatal to that run.
     */
    class InvalidConfiguration : public ParksimException
    {
    public:
        InvalidConfiguration() :
            ParksimException()
        { }

        InvalidConfiguration(const std::string & reason) :
            ParksimException(reason)
        { }

        template<class T>
        InvalidConfiguration & operator<<(const T & msg) {
            ParksimException::operator<<(msg);
            return *this;
        }
    };

    /**
     * \brief An attempt was made to schedule a wake-up with a negative or
     * non-finite delay. Indicates a broken caller, never a runtime
     * condition of the model.
     */
    class InvalidDelay : public ParksimException
    {
    public:
        InvalidDelay() :
            ParksimException()
        { }

        InvalidDelay(const std::string & reason) :
            ParksimException(reason)
        { }

        template<class T>
        InvalidDelay & operator<<(const T & msg) {
            ParksimException::operator<<(msg);
            return *this;
        }
    };

} // namespace parksim

// __PARKSIM_EXCEPTION_H__
#endif
