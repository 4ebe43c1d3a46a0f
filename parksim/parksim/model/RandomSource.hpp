// <RandomSource> -*- C++ -*-

/**
 * \file RandomSource.hpp
 * \brief The single seeded random stream of a simulation run
 */

#pragma once

#include <cstdint>

#include <boost/random/exponential_distribution.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/seed_seq.hpp>
#include <boost/random/triangle_distribution.hpp>
#include <boost/random/uniform_int_distribution.hpp>

#include "parksim/utils/ParksimAssert.hpp"

namespace parksim
{
    /**
     * \class RandomSource
     * \brief Draws every random quantity of a run from one Mersenne Twister
     * stream, so a run is reproduced exactly by its seed.
     *
     * Draw order matters: two runs agree only if they draw the same
     * quantities in the same order.
     */
    class RandomSource
    {
    public:

        //! Both halves of \a seed feed the generator state
        explicit RandomSource(uint64_t seed)
        {
            const uint32_t words[] = {static_cast<uint32_t>(seed),
                                      static_cast<uint32_t>(seed >> 32)};
            boost::random::seed_seq seq(words, words + 2);
            gen_.seed(seq);
        }

        RandomSource(const RandomSource &) = delete;
        RandomSource & operator=(const RandomSource &) = delete;

        /**
         * \brief Exponential variate with the given rate (mean 1/rate)
         * \pre rate > 0
         */
        double exponential(double rate) {
            parksim_assert(rate > 0, "Exponential rate must be positive, got " << rate);
            boost::random::exponential_distribution<double> dist(rate);
            return dist(gen_);
        }

        /**
         * \brief Triangular variate on [min, max] peaking at mode
         * \pre min <= mode <= max
         */
        double triangular(double min, double mode, double max) {
            parksim_assert(min <= mode && mode <= max,
                           "Triangular parameters out of order: " << min << ", " << mode << ", " << max);
            if(min == max) {
                return min;
            }
            boost::random::triangle_distribution<double> dist(min, mode, max);
            return dist(gen_);
        }

        //! Uniform index in [0, n)
        uint32_t uniformIndex(uint32_t n) {
            parksim_assert(n > 0);
            boost::random::uniform_int_distribution<uint32_t> dist(0, n - 1);
            return dist(gen_);
        }

    private:

        boost::random::mt19937 gen_;
    };

} // namespace parksim
