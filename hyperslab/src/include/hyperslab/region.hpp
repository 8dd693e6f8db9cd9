#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace hyperslab {

// A sub-region request against an n-dimensional array stored linearly with
// axis 0 varying fastest. All four sequences have the array dimension as
// length; upper bounds are exclusive.
struct RegionRequest {
    std::vector<int64_t> size;   // extent of each axis, > 0
    std::vector<int64_t> lower;  // first index to read, >= 0
    std::vector<int64_t> upper;  // one past the last index, <= size
    std::vector<int64_t> step;   // subsampling, >= 1
};

class Region;

// Adjustment phase of a region descriptor.
//
// The constructor validates the request and computes the geometry; the
// only mutation allowed afterwards is increase_stride(), for storage
// layouts reserving more space per step along an axis than the logical
// shape implies (e.g. records of a growable trailing axis padded on disk).
// freeze() then produces the immutable Region handed to readers.
class RegionBuilder {
public:
    // Throws InvalidRegion for a malformed request and ArithmeticOverflow
    // when a position, stride or skip does not fit in 64 bits, or when one
    // axis keeps more than INT32_MAX samples.
    explicit RegionBuilder(const RegionRequest& request);

    RegionBuilder(const std::vector<int64_t>& size,
                  const std::vector<int64_t>& lower,
                  const std::vector<int64_t>& upper,
                  const std::vector<int64_t>& step);

    // Adds extra_skip values to skips()[axis]. In a 10x10x10 cube the
    // distance between planes is 100 values; increase_stride(2, 4) makes
    // the reader skip 4 more values when moving from one plane to the next
    // while still reading 100 values per plane.
    // Throws std::out_of_range when axis > dimension().
    RegionBuilder& increase_stride(size_t axis, int64_t extra_skip);

    size_t dimension() const { return target_size_.size(); }

    Region freeze() const;

private:
    std::vector<int32_t> target_size_;
    int64_t start_offset_ = 0;
    std::vector<int64_t> skips_;
};

// Immutable geometry of a strided hyper-rectangular sub-region: where the
// first kept element lies, how many elements are kept along each axis, and
// how many values a sequential reader skips between them.
//
// Safe to share read-only between readers once built.
class Region {
public:
    // Builds and freezes in one step, without stride adjustment.
    static Region create(const std::vector<int64_t>& size,
                         const std::vector<int64_t>& lower,
                         const std::vector<int64_t>& upper,
                         const std::vector<int64_t>& step);

    size_t dimension() const { return target_size_.size(); }

    // Number of values kept along each axis after subsampling.
    const std::vector<int32_t>& target_size() const { return target_size_; }
    int32_t target_size(size_t axis) const { return target_size_.at(axis); }

    // Linear address, in elements, of the first value to read.
    int64_t start_offset() const { return start_offset_; }

    // Values to skip after reading, dimension() + 1 entries:
    //   skips[0]  after each value of a line (non-zero only when subsampling),
    //   skips[1]  after the last value of a line,
    //   skips[2]  after the last value of a plane, etc.
    // skips[dimension()] is the number of values of the whole array lying
    // outside the span covered by the region.
    const std::vector<int64_t>& skips() const { return skips_; }
    int64_t skip(size_t axis) const { return skips_.at(axis); }

    // Number of leading axes whose values are contiguous and can be read in
    // a single bulk transfer: index of the first non-zero skip, or
    // dimension() when there is none.
    size_t contiguous_prefix_length() const;

    // Product of target_size()[0..k). Throws std::out_of_range when
    // k > dimension() and ArithmeticOverflow when the product exceeds
    // INT32_MAX, the largest count a single transfer may carry.
    int32_t target_length(size_t k) const;

    int32_t total_length() const { return target_length(dimension()); }

    // Two-column table of target size and skip per axis.
    std::string describe() const;

private:
    friend class RegionBuilder;

    Region(std::vector<int32_t> target_size, int64_t start_offset,
           std::vector<int64_t> skips);

    std::vector<int32_t> target_size_;
    int64_t start_offset_;
    std::vector<int64_t> skips_;
};

std::ostream& operator<<(std::ostream& os, const Region& region);

}  // namespace hyperslab
