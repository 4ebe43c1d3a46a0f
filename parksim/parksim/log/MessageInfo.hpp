// <MessageInfo> -*- C++ -*-

#ifndef __PARKSIM_MESSAGE_INFO_H__
#define __PARKSIM_MESSAGE_INFO_H__

#include <cstdint>
#include <ostream>
#include <string>

namespace parksim
{
    namespace log
    {
        typedef double sim_time_type;   //!< Simulator timestamp type (minutes)
        typedef int64_t seq_num_type;   //!< Sequence number of a message. Signed so that initial state can be -1.

        /*!
         * \brief Logging Message information excluding actual message content
         */
        struct MessageInfo
        {
            const std::string & origin;   //!< Name of the component from which the message originated
            sim_time_type sim_time;       //!< Simulator timestamp
            const std::string & category; //!< Category with which this message was created
            seq_num_type seq_num;         //!< Sequence number of message
        };

        /*!
         * \brief Contains a logging message header and content
         */
        struct Message
        {
            MessageInfo info;
            const std::string & content;
        };

        static constexpr const char* INFO_DELIMITER = " ";

        /*!
         * \brief ostream insertion operator for serializing MessageInfo.
         *
         * The result of this operation ends up directly in log files or on the screen
         */
        std::ostream& operator<<(std::ostream& o, const MessageInfo& info);

    } // namespace log
} // namespace parksim

// __PARKSIM_MESSAGE_INFO_H__
#endif
