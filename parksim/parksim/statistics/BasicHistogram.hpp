// <BasicHistogram.h> -*- C++ -*-

/**
 * \file BasicHistogram.hpp
 * \brief A simple histogram with programmable bucket boundaries
 */
#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>
#include <sstream>
#include "parksim/utils/ParksimAssert.hpp"

namespace parksim
{
/**
 * \class BasicHistogram
 * \tparam BucketT Type of the bucket boundaries
 * \tparam ASSERT_ON_UNDERFLOW (default false) true will assert if an underflow is detected
 *
 * Each bucket is given by its lower boundary and holds the values from
 * that boundary up to (not including) the next one. The last bucket also
 * takes every value at or above its boundary:
 *
 * \code
 *    parksim::BasicHistogram<int> example_bh("example_bh", {0,10,20});
 *    example_bh.addValue(-1);  // Will add a charge to the  0 -> 10 bucket
 *    example_bh.addValue( 1);  // Will add a charge to the  0 -> 10 bucket
 *    example_bh.addValue(10);  // Will add a charge to the 10 -> 20 bucket
 *    example_bh.addValue(20);  // Will add a charge to the 20 -> bucket
 *    example_bh.addValue(21);  // Will add a charge to the 20 -> bucket
 * \endcode
 */
template<typename BucketT, bool ASSERT_ON_UNDERFLOW=false>
class BasicHistogram
{
public:
    /**
     * \brief Construct a BasicHistogram
     * \param name The name of this BasicHistogram
     * \param buckets lower boundary of each bucket - values must be sorted
     */
    BasicHistogram(const std::string &name,
                   const std::vector<BucketT> &buckets) :
        name_(name),
        bucket_vals_(buckets),
        counts_(buckets.size(), 0)
    {
        parksim_assert(!buckets.empty(), "Histogram '" << name << "' needs at least one bucket");
        parksim_assert(std::is_sorted(buckets.begin(), buckets.end()), "Buckets must be sorted");
    }

    /**
     * \brief Create a histogram of \a num_buckets equal-width buckets
     * spanning [lo, hi]. The last bucket includes \a hi.
     */
    static BasicHistogram equalWidth(const std::string &name, BucketT lo, BucketT hi, uint32_t num_buckets)
    {
        parksim_assert(num_buckets > 0);
        parksim_assert(lo <= hi, "Histogram range [" << lo << ", " << hi << "] is reversed");
        std::vector<BucketT> edges;
        edges.reserve(num_buckets);
        const BucketT width = (hi - lo) / static_cast<BucketT>(num_buckets);
        for (uint32_t i = 0; i < num_buckets; ++i)
        {
            edges.push_back(lo + width * static_cast<BucketT>(i));
        }
        BasicHistogram h(name, edges);
        h.setUpperBound(hi);
        return h;
    }

    /**
     * \brief Charge the bucket where the given val falls
     * \param val The value to charge
     *
     * Overflows go into the last bucket. Underflows will either assert or
     * charge to the smallest bucket (depending on class template parameter
     * ASSERT_ON_UNDERFLOW)
     */
    void addValue(const BucketT &val)
    {
        // upper_bound will yield the bucket beyond the one we want
        auto bucket = std::upper_bound(bucket_vals_.begin(), bucket_vals_.end(), val);

        // check for underflow (value below first bucket)
        if (bucket == bucket_vals_.begin())
        {
            parksim_assert(!ASSERT_ON_UNDERFLOW, "Value below first bucket");
            ++counts_[0]; // put underflow in first bucket
            return;
        }
        //else calculate offset into counter array
        auto off = bucket - bucket_vals_.begin() - 1;
        ++counts_[off];
    }

    const std::string & getName() const { return name_; }

    //! Lower boundary of every bucket
    const std::vector<BucketT> & getBuckets() const { return bucket_vals_; }

    //! Upper boundary of bucket \a idx. For the last bucket this is the
    //! upper bound if one was set, else the bucket's lower boundary
    BucketT getUpperBound(size_t idx) const
    {
        parksim_assert(idx < bucket_vals_.size());
        if (idx + 1 < bucket_vals_.size()) {
            return bucket_vals_[idx + 1];
        }
        return has_upper_ ? upper_ : bucket_vals_[idx];
    }

    const std::vector<uint64_t> & getCounts() const { return counts_; }

    //! Set the nominal end of the last bucket, used for display
    void setUpperBound(BucketT u)
    {
        parksim_assert(!(u < bucket_vals_.back()), "Upper bound below the last bucket");
        has_upper_ = true;
        upper_ = u;
    }

    uint64_t getTotal() const
    {
        uint64_t total = 0;
        for (auto c : counts_) { total += c; }
        return total;
    }

private: // data
    std::string name_;
    std::vector<BucketT> bucket_vals_; ///< user-specified buckets
    std::vector<uint64_t> counts_;     ///< one count per bucket
    bool has_upper_ = false;
    BucketT upper_ = BucketT();
};
} // namespace parksim
