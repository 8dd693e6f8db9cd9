#pragma once

#include <cstdint>
#include <vector>

#include "hyperslab/region.hpp"

namespace hyperslab {

// One axis of a Python-style selection. Shapes and selections are given
// fastest axis first, like RegionRequest.
struct AxisSelection {
    bool is_integer;            // true = single index (collapsed dim)
    int64_t start, stop, step;  // range params (for is_integer: start=index)
};

struct SelectionRegion {
    RegionRequest request;
    std::vector<int64_t> output_shape;  // integer axes squeezed out
};

struct SelectionResult {
    std::vector<uint64_t> flat_indices;
    std::vector<int64_t> output_shape;
};

// Resolve a selection into a region request. Negative integer indices and
// negative slice bounds count from the end, as in Python; slice bounds are
// then clamped to the extent. Slices must have a positive step and select
// at least one value.
SelectionRegion region_from_selection(
    const std::vector<int64_t>& shape,
    const std::vector<AxisSelection>& selections
);

// Linear addresses of the selected elements, axis 0 fastest.
SelectionResult compute_selection_indices(
    const std::vector<int64_t>& shape,
    const std::vector<AxisSelection>& selections
);

}  // namespace hyperslab
