// <ArrivalGenerator> -*- C++ -*-

#pragma once

#include <cstdint>

#include "parksim/kernel/Process.hpp"
#include "parksim/log/MessageSource.hpp"

namespace parksim
{
    class ThemePark;
    class StatisticsCollector;

    /**
     * \class ArrivalGenerator
     * \brief Spawns visitors with exponential gaps whose rate follows the
     * arrival band in effect when each gap is drawn.
     *
     * Never completes on its own. The horizon cutoff leaves it suspended.
     */
    class ArrivalGenerator : public Process
    {
    public:

        ArrivalGenerator(ThemePark & park, StatisticsCollector & stats);

        //! Visitors spawned so far. Also the id of the latest one
        uint64_t getNumSpawned() const {
            return num_spawned_;
        }

    private:

        void start_() override;

        //! Draw the next gap and suspend for it
        void scheduleNext_();

        //! Continuation at the end of a gap
        void arrive_();

        ThemePark & park_;
        StatisticsCollector & stats_;
        uint64_t num_spawned_ = 0;

        log::MessageSource debug_;
    };

} // namespace parksim
