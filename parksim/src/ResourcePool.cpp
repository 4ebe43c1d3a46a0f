// <ResourcePool.cpp> -*- C++ -*-

#include "parksim/resources/ResourcePool.hpp"

#include <algorithm>

#include "parksim/kernel/Process.hpp"
#include "parksim/kernel/Scheduler.hpp"
#include "parksim/log/categories/CategoryManager.hpp"
#include "parksim/utils/ParksimAssert.hpp"
#include "parksim/utils/ParksimException.hpp"

namespace parksim
{

ResourcePool::ResourcePool(Scheduler * scheduler, const std::string & name, size_type capacity) :
    scheduler_(scheduler),
    name_(name),
    capacity_(capacity),
    debug_(scheduler, name, log::categories::DEBUG_STR, "Resource pool grants and releases")
{
    if(capacity == 0) {
        throw InvalidConfiguration("Resource pool '") << name << "' must have a positive capacity";
    }
    parksim_assert(scheduler != nullptr, "Resource pool '" << name << "' needs a scheduler");
}

bool ResourcePool::request(Process * proc)
{
    parksim_assert(proc != nullptr);

    if(occupancy_ < capacity_ && operational_ && waiters_.empty()) {
        ++occupancy_;
        ++num_grants_;
        if(PARKSIM_EXPECT_FALSE(debug_)) {
            debug_ << "Granted '" << proc->getName() << "' immediately, occupancy "
                   << occupancy_ << "/" << capacity_;
        }
        return true;
    }

    waiters_.push_back(proc);
    max_waiting_ = std::max(max_waiting_, getNumWaiting());
    if(PARKSIM_EXPECT_FALSE(debug_)) {
        debug_ << "Queued '" << proc->getName() << "' at position " << waiters_.size()
               << (operational_ ? "" : " (out of service)");
    }
    return false;
}

void ResourcePool::release()
{
    parksim_assert(occupancy_ > 0, "Release on '" << name_ << "' with no slot occupied");
    --occupancy_;
    if(PARKSIM_EXPECT_FALSE(debug_)) {
        debug_ << "Released a slot, occupancy " << occupancy_ << "/" << capacity_;
    }
    grantWaiters_();
}

void ResourcePool::setOperational(bool operational)
{
    operational_ = operational;
    if(operational_) {
        grantWaiters_();
    }
}

void ResourcePool::grantWaiters_()
{
    while(operational_ && occupancy_ < capacity_ && !waiters_.empty()) {
        Process * head = waiters_.front();
        waiters_.pop_front();
        ++occupancy_;
        ++num_grants_;
        ++num_queued_grants_;
        if(PARKSIM_EXPECT_FALSE(debug_)) {
            debug_ << "Granted '" << head->getName() << "' from the queue, occupancy "
                   << occupancy_ << "/" << capacity_;
        }
        scheduler_->scheduleAfter(0, head);
    }
    parksim_assert(occupancy_ <= capacity_);
}

} // namespace parksim
