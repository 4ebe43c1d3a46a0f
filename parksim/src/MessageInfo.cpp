// <MessageInfo> -*- C++ -*-


/*!
 * \file MessageInfo.cpp
 * \brief Prints Log message information
 */

#include "parksim/log/MessageInfo.hpp"

#include <iomanip>
#include <ostream>

namespace parksim {
    namespace log {

std::ostream& operator<<(std::ostream& o, const MessageInfo& info) {
    std::ios::fmtflags f = o.flags();

    o << '{';

    // sim time in minutes
    o << std::setfill('0') << std::setw(10) << std::right << std::fixed
      << std::setprecision(3) << info.sim_time << INFO_DELIMITER;
    o.flags(f); // drop precision and fixed specifiers

    // sequence id
    o << std::setfill('0') << std::right << std::hex
      << "0x" << std::setw(8) << info.seq_num << INFO_DELIMITER;
    o.flags(f);

    // origin
    o << info.origin << INFO_DELIMITER;

    // category
    o << info.category << "} ";

    // restore ostream flags
    o.flags(f);

    return o;
}

    } // namespace log
} // namespace parksim
