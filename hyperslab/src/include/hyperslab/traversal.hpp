#pragma once

#include <cstdint>
#include <vector>

#include "hyperslab/checked_math.hpp"
#include "hyperslab/region.hpp"

namespace hyperslab {

// Drives the read loop described by a region without doing any I/O.
//
// The leading contiguous_prefix_length() axes are flattened into runs of
// target_length(k) consecutive values; fn(offset, length) is called once
// per run, in axis-0-fastest order, with the linear element address of the
// first value of the run. Between runs the remaining axes count like an
// odometer: the innermost one that does not wrap advances the cursor by its
// skip.
template <typename Fn>
void for_each_run(const Region& region, Fn&& fn) {
    const size_t ndim = region.dimension();
    const size_t k = region.contiguous_prefix_length();
    const int64_t run = region.target_length(k);
    const auto& target_size = region.target_size();
    const auto& skips = region.skips();

    std::vector<int32_t> counters(ndim, 0);
    int64_t position = region.start_offset();
    for (;;) {
        fn(position, run);
        position = checked_add(position, run);

        size_t axis = k;
        for (; axis < ndim; ++axis) {
            if (++counters[axis] < target_size[axis]) {
                position = checked_add(position, skips[axis]);
                break;
            }
            counters[axis] = 0;
        }
        if (axis >= ndim) {
            return;
        }
    }
}

// Number of runs for_each_run() produces.
int64_t run_count(const Region& region);

// Linear address of every value kept by the region, in traversal order.
std::vector<uint64_t> element_indices(const Region& region);

}  // namespace hyperslab
