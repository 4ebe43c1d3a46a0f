// <ArrivalGenerator.cpp> -*- C++ -*-

#include "parksim/model/ArrivalGenerator.hpp"

#include <memory>

#include "parksim/kernel/Scheduler.hpp"
#include "parksim/log/categories/CategoryManager.hpp"
#include "parksim/model/ThemePark.hpp"
#include "parksim/model/Visitor.hpp"

namespace parksim
{

ArrivalGenerator::ArrivalGenerator(ThemePark & park, StatisticsCollector & stats) :
    Process("arrivals"),
    park_(park),
    stats_(stats),
    debug_(&park.getScheduler(), "arrivals", log::categories::DEBUG_STR, "Arrival gap draws")
{
}

void ArrivalGenerator::start_()
{
    scheduleNext_();
}

void ArrivalGenerator::scheduleNext_()
{
    const double rate = park_.getConfig().getArrivalRate(now_());
    const Time gap = park_.getRandom().exponential(rate / 60.0);
    if(PARKSIM_EXPECT_FALSE(debug_)) {
        debug_ << "Rate " << rate << "/h, next visitor in " << gap << " min";
    }
    hold_(gap, CREATE_PARKSIM_HANDLER(ArrivalGenerator, arrive_));
}

void ArrivalGenerator::arrive_()
{
    ++num_spawned_;
    getScheduler_().spawn(std::unique_ptr<Process>(new Visitor(park_, stats_, num_spawned_)));
    scheduleNext_();
}

} // namespace parksim
