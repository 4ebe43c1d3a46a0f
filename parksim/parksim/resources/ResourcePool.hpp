// <ResourcePool.hpp> -*- C++ -*-


/**
 * \file   ResourcePool.hpp
 * \brief  Defines the ResourcePool class, a capacity-limited station
 *         with a FIFO wait queue
 *
 */

#pragma once

#include <cinttypes>
#include <deque>
#include <string>

#include "parksim/log/MessageSource.hpp"

namespace parksim
{
    class Process;
    class Scheduler;

    /**
     * \class ResourcePool
     * \brief A server with a fixed number of slots, a FIFO queue of
     * waiting processes, and an operational flag.
     *
     * A request is granted only when a slot is free, the pool is
     * operational, and nobody is queued ahead of the requester. Otherwise
     * the requester joins the tail of the wait queue. Waiters are granted
     * strictly in arrival order, either when a slot is released or when
     * the pool becomes operational again. A granted waiter is resumed
     * through a zero-delay event.
     *
     * Taking a pool out of service never evicts its current occupants.
     *
     * Example usage
     * \code
     * ResourcePool ride(&sched, "ride.0", 10);
     * ride.setOperational(false); // new requests queue up
     * ride.setOperational(true);  // queued requests are granted
     * \endcode
     *
     * The pool is only touched by the single running process, so it needs
     * no locking.
     */
    class ResourcePool
    {
    public:

        // Typedef for size_type
        using size_type = uint32_t;

        /**
         * \brief Construct a pool
         * \param scheduler Scheduler used to resume granted waiters
         * \param name Name of the pool, also its log origin
         * \param capacity Number of slots
         * \throw InvalidConfiguration if \a capacity is 0
         */
        ResourcePool(Scheduler * scheduler, const std::string & name, size_type capacity);

        ResourcePool(const ResourcePool &) = delete;
        ResourcePool & operator=(const ResourcePool &) = delete;

        /**
         * \brief Request a slot for \a proc
         * \return true if the slot was granted immediately, false if
         * \a proc was queued. A queued process is resumed when granted.
         */
        bool request(Process * proc);

        /**
         * \brief Give back one occupied slot. If a process is waiting and
         * the pool is operational, the slot goes to the head of the queue.
         * \throw ParksimException if no slot is occupied
         */
        void release();

        /**
         * \brief Put the pool in or out of service. Going back into service
         * grants waiters while slots are free.
         */
        void setOperational(bool operational);

        bool isOperational() const {
            return operational_;
        }

        size_type getCapacity() const {
            return capacity_;
        }

        size_type getOccupancy() const {
            return occupancy_;
        }

        size_type getNumWaiting() const {
            return static_cast<size_type>(waiters_.size());
        }

        //! Total slots granted, immediately or from the queue
        uint64_t getNumGrants() const {
            return num_grants_;
        }

        //! Slots granted to processes that had to queue
        uint64_t getNumQueuedGrants() const {
            return num_queued_grants_;
        }

        //! Largest wait queue length seen
        size_type getMaxWaiting() const {
            return max_waiting_;
        }

        const std::string & getName() const {
            return name_;
        }

    private:

        //! Grant waiters from the head while slots are free and the pool
        //! is operational
        void grantWaiters_();

        Scheduler * scheduler_;
        const std::string name_;
        const size_type capacity_;
        size_type occupancy_ = 0;
        bool operational_ = true;
        std::deque<Process *> waiters_;

        uint64_t num_grants_ = 0;
        uint64_t num_queued_grants_ = 0;
        size_type max_waiting_ = 0;

        log::MessageSource debug_;
    };

} // namespace parksim
