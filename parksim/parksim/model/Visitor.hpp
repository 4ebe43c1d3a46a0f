// <Visitor> -*- C++ -*-

#pragma once

#include <cstdint>

#include "parksim/kernel/Process.hpp"

namespace parksim
{
    class ThemePark;
    class StatisticsCollector;

    /**
     * \class Visitor
     * \brief One park visitor: picks a ride, queues, rides, leaves.
     *
     * Under the bounded-retry policy a visitor who cannot find a working
     * ride within the retry bound leaves without queueing and without
     * being counted as served. Under the unconditional policy the visitor
     * queues for the first pick even while it is down.
     *
     * Every visitor who is granted a ride records one queue-wait sample
     * (zero when granted on request) and one use of the ride.
     */
    class Visitor : public Process
    {
    public:

        Visitor(ThemePark & park, StatisticsCollector & stats, uint64_t visitor_id);

        uint64_t getVisitorId() const {
            return visitor_id_;
        }

        //! Ride picked. Meaningful once the visitor started
        uint32_t getRide() const {
            return ride_;
        }

        Time getArrivalTime() const {
            return arrival_;
        }

    private:

        void start_() override;

        //! Continuation once the ride slot is granted
        void boarded_();

        //! Continuation at the end of the ride
        void finished_();

        //! Choose a ride following the selection policy
        //! \return false if the visitor gives up
        bool pickRide_();

        ThemePark & park_;
        StatisticsCollector & stats_;
        const uint64_t visitor_id_;
        uint32_t ride_ = 0;
        Time arrival_ = 0;
        Time queue_start_ = 0;
    };

} // namespace parksim
