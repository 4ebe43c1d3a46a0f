// <EventQueue.cpp> -*- C++ -*-

#include "parksim/kernel/EventQueue.hpp"

#include <cmath>

#include "parksim/kernel/Process.hpp"
#include "parksim/utils/ParksimAssert.hpp"
#include "parksim/utils/ParksimException.hpp"

namespace parksim
{

EventHandle EventQueue::scheduleAfter(Time delay, Process * process)
{
    if(PARKSIM_EXPECT_FALSE(!std::isfinite(delay) || delay < 0)) {
        throw InvalidDelay("Cannot schedule with delay ") << delay
            << ": delays must be finite and non-negative";
    }
    parksim_assert(process != nullptr, "Cannot schedule a null process");

    const EventHandle seq = next_seq_++;
    events_.push(Event{current_time_ + delay, seq, process});
    return seq;
}

EventQueue::Event EventQueue::advance()
{
    parksim_assert(!events_.empty(), "advance() called on an empty event queue");

    const Event ev = events_.top();
    events_.pop();

    parksim_assert(ev.due >= current_time_,
                   "Event " << ev.seq << " due at " << ev.due
                   << " is in the past (now " << current_time_ << ")");
    current_time_ = ev.due;

    ev.process->resume();
    return ev;
}

Time EventQueue::nextDueTime() const
{
    parksim_assert(!events_.empty(), "nextDueTime() called on an empty event queue");
    return events_.top().due;
}

void EventQueue::advanceClockTo(Time t)
{
    parksim_assert(t >= current_time_,
                   "Cannot move the clock back from " << current_time_ << " to " << t);
    parksim_assert(events_.empty() || t <= events_.top().due,
                   "Cannot move the clock past pending event due at " << events_.top().due);
    current_time_ = t;
}

} // namespace parksim
