// <Scheduler> -*- C++ -*-

/**
 * \file Scheduler.hpp
 * \brief Runs cooperative processes against the simulation clock
 *
 */

#pragma once

#include <boost/timer/timer.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "parksim/kernel/EventQueue.hpp"
#include "parksim/kernel/Process.hpp"
#include "parksim/log/MessageSource.hpp"

namespace parksim
{

/**
 * \class Scheduler
 * \brief Owns the clock and event queue, and every spawned process.
 *
 * The scheduler repeatedly fires the earliest pending event and resumes
 * its process until the next event is due at or after the horizon given
 * to run(). Processes still suspended at that point are abandoned in
 * place: they are not completed and run no further code. A later call to
 * run() with a larger horizon continues from where the previous one
 * stopped.
 *
 * Example:
 * \code
 * Scheduler sched;
 * sched.spawn(std::unique_ptr<Process>(new ArrivalGenerator(...)));
 * sched.run(480.0); // fires every event due before 480
 * \endcode
 *
 * Completed processes are destroyed right after the resume in which they
 * complete.
 */
class Scheduler
{
public:

    explicit Scheduler(const std::string & name = "scheduler");

    ~Scheduler();

    Scheduler(const Scheduler &) = delete;
    Scheduler & operator=(const Scheduler &) = delete;

    /**
     * \brief Take ownership of \a proc, give it an id and schedule its
     * first resume at the current time
     * \return The spawned process, owned by this scheduler
     */
    Process * spawn(std::unique_ptr<Process> proc);

    /**
     * \brief Schedule a resume of \a proc \a delay minutes from now
     * \throw InvalidDelay if \a delay is negative or not finite
     */
    EventHandle scheduleAfter(Time delay, Process * proc);

    /**
     * \brief Fire every event due before \a horizon, then set the clock
     * to \a horizon
     * \throw InvalidConfiguration if \a horizon is negative or NaN
     */
    void run(Time horizon);

    Time getCurrentTime() const {
        return event_queue_.getCurrentTime();
    }

    //! Is the scheduler inside run()
    bool isRunning() const {
        return running_;
    }

    uint64_t getNumEventsFired() const {
        return num_events_fired_;
    }

    size_t getNumPendingEvents() const {
        return event_queue_.size();
    }

    //! Spawned processes not yet completed, including abandoned ones
    size_t getNumLiveProcesses() const {
        return processes_.size();
    }

    //! Total processes ever spawned
    uint64_t getNumSpawned() const {
        return next_pid_;
    }

    //! Host time spent in run(), in seconds
    double getRunWallSeconds() const {
        return timer_.elapsed().wall / 1E9;
    }

    const std::string & getName() const {
        return name_;
    }

private:

    //! Destroy \a proc if it completed
    void reap_(Process * proc);

    const std::string name_;

    EventQueue event_queue_;

    //! Live processes by id
    std::map<uint64_t, std::unique_ptr<Process>> processes_;

    uint64_t next_pid_ = 0;

    uint64_t num_events_fired_ = 0;

    bool running_ = false;

    boost::timer::cpu_timer timer_;

    log::MessageSource debug_;
    log::MessageSource info_;
};

} // namespace parksim
