// <FailureRepairCycle> -*- C++ -*-

#pragma once

#include <cstdint>

#include "parksim/kernel/Process.hpp"
#include "parksim/log/MessageSource.hpp"

namespace parksim
{
    class ThemePark;
    class StatisticsCollector;

    /**
     * \class FailureRepairCycle
     * \brief Alternately takes one ride out of service and repairs it,
     * after exponentially distributed up and down times.
     *
     * Taking a ride out of service leaves its riders aboard. Visitors
     * queued on it wait for the repair.
     */
    class FailureRepairCycle : public Process
    {
    public:

        FailureRepairCycle(ThemePark & park, StatisticsCollector & stats, uint32_t ride);

        uint32_t getRideIndex() const {
            return ride_;
        }

        uint64_t getNumFailures() const {
            return num_failures_;
        }

    private:

        void start_() override;

        //! Suspend until the next failure
        void scheduleFailure_();

        //! Continuation at a failure
        void fail_();

        //! Continuation at the end of a repair
        void repaired_();

        ThemePark & park_;
        StatisticsCollector & stats_;
        const uint32_t ride_;
        uint64_t num_failures_ = 0;

        log::MessageSource info_;
    };

} // namespace parksim
