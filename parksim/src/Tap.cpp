// <Tap> -*- C++ -*-

#include "parksim/log/Tap.hpp"

#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>

namespace parksim {
    namespace log {

namespace {
    std::vector<Tap*>& tapRegistry() {
        static std::vector<Tap*> taps;
        return taps;
    }

    uint64_t registry_version = 0;
}

bool Tap::observes(const std::string& origin, const std::string& category) const
{
    if(!category_.empty() && category_ != categories::ANY_STR && category_ != category){
        return false;
    }
    if(origin_.empty() || origin_ == origin){
        return true;
    }
    return boost::algorithm::starts_with(origin, origin_ + ".");
}

const std::vector<Tap*>& Tap::getTaps()
{
    return tapRegistry();
}

uint64_t Tap::getRegistryVersion()
{
    return registry_version;
}

void Tap::attach_()
{
    tapRegistry().push_back(this);
    ++registry_version;
}

void Tap::detach_()
{
    auto& taps = tapRegistry();
    taps.erase(std::remove(taps.begin(), taps.end(), this), taps.end());
    ++registry_version;
}

    } // namespace log
} // namespace parksim
