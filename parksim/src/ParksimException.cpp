// <ParksimException> -*- C++ -*-

/**
 * \file   ParksimException.cpp
 * \brief  Implements exception class for all of PARKSIM.
 */

#include <sstream>
#include <string>

#include "parksim/utils/ParksimException.hpp"

namespace parksim {

ParksimException::ParksimException()
{
}

ParksimException::ParksimException(const ParksimException & orig) :
    std::exception(orig)
{
    raw_reason_ = orig.raw_reason_;
    reason_ << orig.reason_.str();
}

ParksimException::ParksimException(const std::string & reason) :
    ParksimException() // Delegate so that breakpoints can be set on ParksimException
{
    raw_reason_ = reason;
    reason_ << reason;
}

ParksimException::~ParksimException() noexcept {}

} // namespace parksim
