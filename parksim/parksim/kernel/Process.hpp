// <Process> -*- C++ -*-

/**
 * \file   Process.hpp
 * \brief  Cooperative unit of simulated behavior
 */

#ifndef __PARKSIM_PROCESS_H__
#define __PARKSIM_PROCESS_H__

#include <cstdint>
#include <ostream>
#include <string>

#include "parksim/kernel/EventQueue.hpp"
#include "parksim/kernel/ParksimHandler.hpp"

namespace parksim
{
    class Scheduler;
    class ResourcePool;

    /**
     * \class Process
     * \brief A unit of cooperative work that suspends on a timer or on a
     * resource and is resumed by the Scheduler.
     *
     * A process is an explicit state machine. Its body is split into
     * methods; each suspension names the method to continue at with a
     * ParksimHandler (see CREATE_PARKSIM_HANDLER). A process suspends by
     * calling hold_() or acquire_() and then returning. A process that
     * returns from a resume without suspending is completed and is
     * destroyed by the Scheduler.
     *
     * \code
     * class Walker : public Process {
     *     void start_() override { hold_(5.0, CREATE_PARKSIM_HANDLER(Walker, arrive_)); }
     *     void arrive_() { ... } // completes on return
     * };
     * \endcode
     *
     * At most one process runs at a time.
     */
    class Process
    {
    public:

        //! Life cycle of a process
        enum class State {
            RUNNABLE,               //!< Created or currently running
            SUSPENDED_ON_TIMER,     //!< Waiting for a scheduled wake-up
            SUSPENDED_ON_RESOURCE,  //!< Queued on a ResourcePool
            COMPLETED               //!< Returned without suspending
        };

        Process(const Process &) = delete;
        Process & operator=(const Process &) = delete;

        explicit Process(const std::string & name);

        virtual ~Process() {}

        //! Id assigned by the Scheduler on spawn. 0 until spawned
        uint64_t getId() const {
            return id_;
        }

        const std::string & getName() const {
            return name_;
        }

        State getState() const {
            return state_;
        }

        bool isCompleted() const {
            return state_ == State::COMPLETED;
        }

        /**
         * \brief Run the process until its next suspension or completion.
         * The first resume runs start_(), later resumes run the stored
         * continuation.
         * \throw ParksimException if the process already completed
         */
        void resume();

    protected:

        //! Body of the process up to its first suspension
        virtual void start_() = 0;

        /**
         * \brief Suspend for \a delay minutes and continue at \a next
         * \throw InvalidDelay if \a delay is negative or not finite
         */
        void hold_(Time delay, const ParksimHandler & next);

        /**
         * \brief Request a slot of \a pool and continue at \a next once it
         * is granted. When granted immediately \a next runs before this
         * call returns; otherwise the process is queued on the pool.
         */
        void acquire_(ResourcePool & pool, const ParksimHandler & next);

        //! Give back the slot held on \a pool
        void release_(ResourcePool & pool);

        //! Current simulation time
        Time now_() const;

        Scheduler & getScheduler_() const;

    private:

        friend class Scheduler;

        //! Attach to a scheduler. Called on spawn
        void bind_(Scheduler * scheduler, uint64_t id);

        const std::string name_;
        uint64_t id_ = 0;
        Scheduler * scheduler_ = nullptr;
        State state_ = State::RUNNABLE;
        bool started_ = false;
        ParksimHandler continuation_;
    };

    std::ostream & operator<<(std::ostream & o, Process::State s);

} // namespace parksim

// __PARKSIM_PROCESS_H__
#endif
