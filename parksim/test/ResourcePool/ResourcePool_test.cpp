// <ResourcePool_test> -*- C++ -*-

/**
 * \file ResourcePool_test
 * \brief Grant, queueing and out-of-service behavior of ResourcePool
 */

#include <memory>
#include <string>
#include <vector>

#include "parksim/kernel/Scheduler.hpp"
#include "parksim/kernel/Process.hpp"
#include "parksim/resources/ResourcePool.hpp"
#include "parksim/utils/ParksimException.hpp"
#include "parksim/utils/ParksimTester.hpp"

TEST_INIT

//! What one rider saw. Kept outside the process, which is destroyed on
//! completion
struct RideRecord
{
    std::string name;
    parksim::Time requested = -1;
    parksim::Time boarded = -1;
    parksim::Time left = -1;

    parksim::Time wait() const { return boarded - requested; }
};

//! Arrives after a delay, takes a slot, rides, releases
class Rider : public parksim::Process
{
public:
    Rider(parksim::ResourcePool & pool, parksim::Time arrive, parksim::Time service,
          RideRecord & rec, std::vector<std::string> * boarding_order = nullptr) :
        parksim::Process(rec.name),
        pool_(pool),
        arrive_(arrive),
        service_(service),
        rec_(rec),
        boarding_order_(boarding_order)
    {}

private:
    void start_() override {
        hold_(arrive_, CREATE_PARKSIM_HANDLER(Rider, arrived_));
    }

    void arrived_() {
        rec_.requested = now_();
        acquire_(pool_, CREATE_PARKSIM_HANDLER(Rider, boarded_));
    }

    void boarded_() {
        rec_.boarded = now_();
        if(boarding_order_) {
            boarding_order_->push_back(getName());
        }
        hold_(service_, CREATE_PARKSIM_HANDLER(Rider, left_));
    }

    void left_() {
        rec_.left = now_();
        release_(pool_);
    }

    parksim::ResourcePool & pool_;
    const parksim::Time arrive_;
    const parksim::Time service_;
    RideRecord & rec_;
    std::vector<std::string> * boarding_order_;
};

//! Takes the pool out of service at \a down and back in at \a up
class Outage : public parksim::Process
{
public:
    Outage(parksim::ResourcePool & pool, parksim::Time down, parksim::Time up) :
        parksim::Process("outage"),
        pool_(pool),
        down_(down),
        up_(up)
    {}

private:
    void start_() override {
        hold_(down_, CREATE_PARKSIM_HANDLER(Outage, fail_));
    }

    void fail_() {
        pool_.setOperational(false);
        hold_(up_ - down_, CREATE_PARKSIM_HANDLER(Outage, repair_));
    }

    void repair_() {
        pool_.setOperational(true);
    }

    parksim::ResourcePool & pool_;
    const parksim::Time down_;
    const parksim::Time up_;
};

//! Records the pool state at a given time
class Probe : public parksim::Process
{
public:
    Probe(parksim::ResourcePool & pool, parksim::Time at,
          uint32_t & occupancy, uint32_t & waiting) :
        parksim::Process("probe"),
        pool_(pool), at_(at), occupancy_(occupancy), waiting_(waiting)
    {}

private:
    void start_() override {
        hold_(at_, CREATE_PARKSIM_HANDLER(Probe, look_));
    }

    void look_() {
        occupancy_ = pool_.getOccupancy();
        waiting_ = pool_.getNumWaiting();
    }

    parksim::ResourcePool & pool_;
    const parksim::Time at_;
    uint32_t & occupancy_;
    uint32_t & waiting_;
};

template<typename ProcT, typename... Args>
void spawn(parksim::Scheduler & sched, Args&&... args)
{
    sched.spawn(std::unique_ptr<parksim::Process>(new ProcT(std::forward<Args>(args)...)));
}

void testConstruction()
{
    parksim::Scheduler sched;
    EXPECT_THROW_TYPE(parksim::ResourcePool(&sched, "empty", 0), parksim::InvalidConfiguration);

    parksim::ResourcePool pool(&sched, "ride.0", 3);
    EXPECT_EQUAL(pool.getName(), std::string("ride.0"));
    EXPECT_EQUAL(pool.getCapacity(), 3);
    EXPECT_EQUAL(pool.getOccupancy(), 0);
    EXPECT_EQUAL(pool.getNumWaiting(), 0);
    EXPECT_TRUE(pool.isOperational());
    EXPECT_THROW(pool.release()); // nothing occupied
}

// Second rider waits for the first to finish: requested at 1, boards at 5
void testQueueWaitBehindBusySlot()
{
    parksim::Scheduler sched;
    parksim::ResourcePool pool(&sched, "ride.0", 1);
    RideRecord first{"first"}, second{"second"};

    spawn<Rider>(sched, pool, 0.0, 5.0, first);
    spawn<Rider>(sched, pool, 1.0, 5.0, second);
    sched.run(100);

    EXPECT_EQUAL(first.wait(), 0.0);
    EXPECT_EQUAL(first.left, 5.0);
    EXPECT_EQUAL(second.requested, 1.0);
    EXPECT_EQUAL(second.boarded, 5.0);
    EXPECT_EQUAL(second.wait(), 4.0);
    EXPECT_EQUAL(second.left, 10.0);

    EXPECT_EQUAL(pool.getOccupancy(), 0);
    EXPECT_EQUAL(pool.getNumGrants(), 2);
    EXPECT_EQUAL(pool.getNumQueuedGrants(), 1);
    EXPECT_EQUAL(pool.getMaxWaiting(), 1);
}

// While out of service an idle pool queues requests, and repair grants
// them in arrival order
void testOutOfServiceQueuesInOrder()
{
    parksim::Scheduler sched;
    parksim::ResourcePool pool(&sched, "ride.0", 1);
    RideRecord early{"early"}, late{"late"};
    std::vector<std::string> order;
    uint32_t occ_at_3 = 99, waiting_at_3 = 99;

    spawn<Outage>(sched, pool, 0.0, 10.0);
    spawn<Rider>(sched, pool, 2.0, 5.0, early, &order);
    spawn<Probe>(sched, pool, 3.0, occ_at_3, waiting_at_3);
    spawn<Rider>(sched, pool, 4.0, 5.0, late, &order);
    sched.run(100);

    // Slot was free and nobody was queued, but the pool was down
    EXPECT_EQUAL(occ_at_3, 0);
    EXPECT_EQUAL(waiting_at_3, 1);

    EXPECT_EQUAL(early.boarded, 10.0);
    EXPECT_EQUAL(early.wait(), 8.0);
    EXPECT_EQUAL(late.boarded, 15.0);
    EXPECT_EQUAL(late.wait(), 11.0);

    const std::vector<std::string> expected{"early", "late"};
    EXPECT_TRUE(order == expected);
}

// A waiter that arrived before a newcomer is served first even when the
// newcomer finds a slot free
void testNoOvertaking()
{
    parksim::Scheduler sched;
    parksim::ResourcePool pool(&sched, "ride.0", 2);
    RideRecord a{"a"}, b{"b"}, c{"c"};
    std::vector<std::string> order;

    spawn<Outage>(sched, pool, 0.0, 6.0);
    spawn<Rider>(sched, pool, 1.0, 3.0, a, &order);
    spawn<Rider>(sched, pool, 2.0, 3.0, b, &order);
    spawn<Rider>(sched, pool, 6.0, 3.0, c, &order);
    sched.run(100);

    // c requests at the repair time and queues behind a and b, which take
    // both slots
    EXPECT_EQUAL(a.boarded, 6.0);
    EXPECT_EQUAL(b.boarded, 6.0);
    EXPECT_EQUAL(c.boarded, 9.0);
    const std::vector<std::string> expected{"a", "b", "c"};
    EXPECT_TRUE(order == expected);
}

// Occupancy never exceeds capacity however many riders pile up
void testOccupancyBound()
{
    parksim::Scheduler sched;
    parksim::ResourcePool pool(&sched, "ride.0", 3);
    std::vector<RideRecord> recs(12);
    for(uint32_t i = 0; i < recs.size(); ++i) {
        recs[i].name = "r" + std::to_string(i);
        spawn<Rider>(sched, pool, 0.5 * i, 4.0, recs[i]);
    }

    std::vector<uint32_t> occ(40), waiting(40);
    for(uint32_t t = 0; t < occ.size(); ++t) {
        spawn<Probe>(sched, pool, static_cast<parksim::Time>(t) + 0.25, occ[t], waiting[t]);
    }
    sched.run(200);

    for(uint32_t t = 0; t < occ.size(); ++t) {
        EXPECT_TRUE(occ[t] <= pool.getCapacity());
    }
    for(const RideRecord & r : recs) {
        EXPECT_TRUE(r.wait() >= 0.0);
        EXPECT_EQUAL(r.left - r.boarded, 4.0);
    }
    EXPECT_EQUAL(pool.getNumGrants(), 12);
    EXPECT_EQUAL(pool.getOccupancy(), 0);
}

// Taking an occupied pool down does not evict its riders
void testOutageKeepsOccupants()
{
    parksim::Scheduler sched;
    parksim::ResourcePool pool(&sched, "ride.0", 1);
    RideRecord a{"a"}, b{"b"};

    spawn<Rider>(sched, pool, 0.0, 10.0, a);
    spawn<Outage>(sched, pool, 2.0, 20.0);
    spawn<Rider>(sched, pool, 11.0, 1.0, b);
    sched.run(100);

    EXPECT_EQUAL(a.left, 10.0);
    // b found the slot free at 11 but the pool was down until 20
    EXPECT_EQUAL(b.boarded, 20.0);
}

int main()
{
    testConstruction();
    testQueueWaitBehindBusySlot();
    testOutOfServiceQueuesInOrder();
    testNoOvertaking();
    testOccupancyBound();
    testOutageKeepsOccupants();

    REPORT_ERROR;
    return ERROR_CODE;
}
