// <MessageSource> -*- C++ -*-


/*!
 * \file MessageSource.cpp
 * \brief Parksim MessageSource implementation.
 */

#include "parksim/log/MessageSource.hpp"

#include "parksim/kernel/Scheduler.hpp"
#include "parksim/log/categories/CategoryManager.hpp"

namespace parksim {
    namespace log {

seq_num_type MessageSource::seq_num_ = 0;

bool MessageSource::observed() const
{
    const uint64_t version = Tap::getRegistryVersion();
    if(cached_version_ != version){
        observed_ = false;
        for(const Tap* t : Tap::getTaps()){
            if(t->observes(origin_, category_)){
                observed_ = true;
                break;
            }
        }
        cached_version_ = version;
    }
    return observed_;
}

// Implemented here to prevent circular dependency on scheduler
void MessageSource::emit_(const std::string& content) const
{
    sim_time_type now = 0;
    if(scheduler_){
        now = scheduler_->getCurrentTime();
    }
    Message msg =
        {
            {
                origin_,    // Origin component
                now,        // Simulation time
                category_,  // Category
                seq_num_    // Global sequence
            },
            content
        };
    ++seq_num_;
    ++num_emitted_;

    // Copy: a destination write must not be disturbed by taps going away
    const std::vector<Tap*> taps = Tap::getTaps();
    for(Tap* t : taps){
        if(t->observes(origin_, category_)){
            t->send(msg);
        }
    }
}

MessageSource& MessageSource::getGlobalWarn()
{
    static MessageSource warn(nullptr,
                              "global",
                              categories::WARN_STR,
                              "Global warning messages");
    return warn;
}

    } // namespace log
} // namespace parksim
