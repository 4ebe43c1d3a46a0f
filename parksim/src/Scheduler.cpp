// <Scheduler.cpp> -*- C++ -*-

#include "parksim/kernel/Scheduler.hpp"

#include <cmath>

#include "parksim/log/categories/CategoryManager.hpp"
#include "parksim/utils/ParksimAssert.hpp"
#include "parksim/utils/ParksimException.hpp"

namespace parksim
{

Scheduler::Scheduler(const std::string & name) :
    name_(name),
    debug_(this, name, log::categories::DEBUG_STR, "Scheduler event debug messages"),
    info_(this, name, log::categories::INFO_STR, "Scheduler run information")
{
    timer_.stop();
}

Scheduler::~Scheduler()
{
    if(PARKSIM_EXPECT_FALSE(debug_) && !processes_.empty()) {
        debug_ << "Destroying " << processes_.size() << " abandoned processes";
    }
}

Process * Scheduler::spawn(std::unique_ptr<Process> proc)
{
    parksim_assert(proc != nullptr, "Cannot spawn a null process");

    const uint64_t id = ++next_pid_;
    Process * p = proc.get();
    p->bind_(this, id);
    processes_.emplace(id, std::move(proc));

    if(PARKSIM_EXPECT_FALSE(debug_)) {
        debug_ << "Spawned process " << id << " '" << p->getName() << "'";
    }

    scheduleAfter(0, p);
    return p;
}

EventHandle Scheduler::scheduleAfter(Time delay, Process * proc)
{
    const EventHandle h = event_queue_.scheduleAfter(delay, proc);
    if(PARKSIM_EXPECT_FALSE(debug_)) {
        debug_ << "Scheduled event " << h << " for '" << proc->getName()
               << "' at " << (getCurrentTime() + delay);
    }
    return h;
}

void Scheduler::run(Time horizon)
{
    if(std::isnan(horizon) || horizon < 0) {
        throw InvalidConfiguration("Cannot run to horizon ") << horizon
            << ": the horizon must be a non-negative number of minutes";
    }
    parksim_assert(!running_, "Scheduler::run is not reentrant");

    running_ = true;
    timer_.resume();

    const uint64_t fired_before = num_events_fired_;
    try {
        while(!event_queue_.empty() && event_queue_.nextDueTime() < horizon) {
            const EventQueue::Event ev = event_queue_.advance();
            ++num_events_fired_;
            if(PARKSIM_EXPECT_FALSE(debug_)) {
                debug_ << "Fired event " << ev.seq << " for '" << ev.process->getName()
                       << "' -> " << ev.process->getState();
            }
            reap_(ev.process);
        }
    }
    catch(...) {
        timer_.stop();
        running_ = false;
        throw;
    }

    if(horizon > getCurrentTime()) {
        event_queue_.advanceClockTo(horizon);
    }

    timer_.stop();
    running_ = false;

    if(PARKSIM_EXPECT_FALSE(info_)) {
        info_ << "Ran to " << getCurrentTime() << " min: "
              << (num_events_fired_ - fired_before) << " events, "
              << next_pid_ << " processes spawned, "
              << processes_.size() << " abandoned at the horizon "
              << "(host" << timer_.format(3, " %ws wall, %us user + %ss system") << ")";
    }
}

void Scheduler::reap_(Process * proc)
{
    if(proc->isCompleted()) {
        processes_.erase(proc->getId());
    }
}

} // namespace parksim
