// <Process.cpp> -*- C++ -*-

#include "parksim/kernel/Process.hpp"

#include "parksim/kernel/Scheduler.hpp"
#include "parksim/resources/ResourcePool.hpp"
#include "parksim/utils/ParksimAssert.hpp"

namespace parksim
{

Process::Process(const std::string & name) :
    name_(name)
{
}

void Process::bind_(Scheduler * scheduler, uint64_t id)
{
    parksim_assert(scheduler_ == nullptr,
                   "Process '" << name_ << "' was already spawned");
    scheduler_ = scheduler;
    id_ = id;
}

void Process::resume()
{
    parksim_assert(state_ != State::COMPLETED,
                   "Process '" << name_ << "' (" << id_ << ") resumed after completion");

    state_ = State::RUNNABLE;
    if(!started_) {
        started_ = true;
        start_();
    }
    else {
        parksim_assert(continuation_, "Process '" << name_ << "' resumed without a continuation");
        const ParksimHandler next = continuation_;
        continuation_ = ParksimHandler();
        next();
    }

    // Returned without suspending
    if(state_ == State::RUNNABLE) {
        state_ = State::COMPLETED;
    }
}

void Process::hold_(Time delay, const ParksimHandler & next)
{
    parksim_assert(state_ == State::RUNNABLE,
                   "Process '" << name_ << "' suspended twice (" << state_ << ")");
    getScheduler_().scheduleAfter(delay, this);
    continuation_ = next;
    state_ = State::SUSPENDED_ON_TIMER;
}

void Process::acquire_(ResourcePool & pool, const ParksimHandler & next)
{
    parksim_assert(state_ == State::RUNNABLE,
                   "Process '" << name_ << "' suspended twice (" << state_ << ")");
    if(pool.request(this)) {
        next();
        return;
    }
    continuation_ = next;
    state_ = State::SUSPENDED_ON_RESOURCE;
}

void Process::release_(ResourcePool & pool)
{
    pool.release();
}

Time Process::now_() const
{
    return getScheduler_().getCurrentTime();
}

Scheduler & Process::getScheduler_() const
{
    parksim_assert(scheduler_ != nullptr,
                   "Process '" << name_ << "' is not attached to a scheduler");
    return *scheduler_;
}

std::ostream & operator<<(std::ostream & o, Process::State s)
{
    switch(s) {
    case Process::State::RUNNABLE:
        o << "runnable";
        break;
    case Process::State::SUSPENDED_ON_TIMER:
        o << "suspended-on-timer";
        break;
    case Process::State::SUSPENDED_ON_RESOURCE:
        o << "suspended-on-resource";
        break;
    case Process::State::COMPLETED:
        o << "completed";
        break;
    }
    return o;
}

} // namespace parksim
