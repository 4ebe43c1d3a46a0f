// <parksim.hpp> -*- C++ -*-

#pragma once

/*!
 * \file parksim.hpp
 * \brief This is _not_ a global include file. Brings in the headers most
 * models and tests need: the scheduler, processes, resource pools and the
 * theme park model.
 */

/*!
 * \brief Parksim namespace containing most Parksim classes
 */
#include "parksim/kernel/Scheduler.hpp"
#include "parksim/kernel/Process.hpp"
#include "parksim/resources/ResourcePool.hpp"
#include "parksim/model/ThemePark.hpp"
#include "parksim/statistics/StatisticsSnapshot.hpp"
