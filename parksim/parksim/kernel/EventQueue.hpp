// <EventQueue> -*- C++ -*-

/**
 * \file EventQueue.hpp
 * \brief The simulation clock and its time-ordered set of pending wake-ups
 */

#pragma once

#include <cstdint>
#include <functional>
#include <queue>
#include <vector>

namespace parksim
{
    class Process;

    //! Simulation time, in minutes
    typedef double Time;

    //! Identifies a scheduled wake-up. Handles are unique and increasing.
    typedef uint64_t EventHandle;

    /**
     * \class EventQueue
     * \brief Holds the current simulation time and the pending wake-ups of
     * processes.
     *
     * Events are ordered by due time. Events due at the same time fire in
     * the order in which they were scheduled, which together with a fixed
     * random stream makes a run reproducible.
     *
     * Delays are relative to the current time and must be non-negative, so
     * the queue can never hold an event in the simulated past.
     *
     * \code
     * EventQueue eq;
     * eq.scheduleAfter(5.0, &proc);
     * eq.advance();        // now == 5.0, proc resumed
     * \endcode
     */
    class EventQueue
    {
    public:

        //! A pending wake-up
        struct Event
        {
            Time        due;      //!< Time at which to resume
            EventHandle seq;      //!< Insertion order, breaks ties on due
            Process *   process;  //!< What to resume
        };

        EventQueue() = default;

        EventQueue(const EventQueue &) = delete;
        EventQueue & operator=(const EventQueue &) = delete;

        /**
         * \brief Schedule \a process to be resumed \a delay minutes from now
         * \param delay Non-negative, finite delay
         * \param process The process to resume. Not owned
         * \return Handle of the new event
         * \throw InvalidDelay if \a delay is negative or not finite
         */
        EventHandle scheduleAfter(Time delay, Process * process);

        /**
         * \brief Fire the earliest pending event: set the clock to its due
         * time and resume its process
         * \return The event that fired
         * \pre !empty()
         */
        Event advance();

        //! Is there no pending event
        bool empty() const {
            return events_.empty();
        }

        //! Number of pending events
        size_t size() const {
            return events_.size();
        }

        //! Due time of the earliest pending event
        //! \pre !empty()
        Time nextDueTime() const;

        //! The current simulation time
        Time getCurrentTime() const {
            return current_time_;
        }

        /**
         * \brief Move the clock forward without firing anything
         * \pre \a t is not earlier than the current time nor later than
         * the earliest pending event
         */
        void advanceClockTo(Time t);

    private:

        // Min-heap on (due, seq)
        struct Later {
            bool operator()(const Event & a, const Event & b) const {
                if(a.due != b.due) {
                    return a.due > b.due;
                }
                return a.seq > b.seq;
            }
        };

        std::priority_queue<Event, std::vector<Event>, Later> events_;
        Time current_time_ = 0;
        EventHandle next_seq_ = 0;
    };

} // namespace parksim
