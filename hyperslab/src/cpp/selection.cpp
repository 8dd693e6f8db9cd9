#include "hyperslab/selection.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "hyperslab/checked_math.hpp"
#include "hyperslab/common.hpp"
#include "hyperslab/traversal.hpp"

namespace hyperslab {

SelectionRegion region_from_selection(
    const std::vector<int64_t>& shape,
    const std::vector<AxisSelection>& selections
) {
    const size_t ndim = shape.size();
    if (selections.size() != ndim) {
        throw std::invalid_argument(fmt::format(
            "selections length {} must match shape length {}",
            selections.size(), ndim));
    }

    SelectionRegion result;
    RegionRequest& req = result.request;
    req.size = shape;
    req.lower.resize(ndim);
    req.upper.resize(ndim);
    req.step.resize(ndim);

    for (size_t i = 0; i < ndim; ++i) {
        const auto& sel = selections[i];
        const int64_t size = shape[i];

        if (sel.is_integer) {
            int64_t idx = sel.start;
            if (idx < 0) idx += size;
            if (idx < 0 || idx >= size) {
                throw std::out_of_range(fmt::format(
                    "index {} out of range for axis {} with size {}",
                    sel.start, i, size));
            }
            req.lower[i] = idx;
            req.upper[i] = idx + 1;
            req.step[i] = 1;
            continue;
        }

        if (sel.step == 0) {
            throw std::invalid_argument("slice step cannot be zero");
        }
        if (sel.step < 0) {
            throw InvalidRegion(fmt::format(
                "axis {}: negative slice step {} is not supported",
                i, sel.step));
        }
        // Negative bounds count from the end, then clamp to [0, size].
        int64_t start = sel.start < 0 ? sel.start + size : sel.start;
        int64_t stop = sel.stop < 0 ? sel.stop + size : sel.stop;
        start = std::max<int64_t>(start, 0);
        stop = std::min(stop, size);
        if (start >= stop) {
            throw std::invalid_argument(
                fmt::format("empty selection for axis {}", i));
        }
        req.lower[i] = start;
        req.upper[i] = stop;
        req.step[i] = sel.step;
        result.output_shape.push_back(ceil_div(stop - start, sel.step));
    }
    return result;
}

SelectionResult compute_selection_indices(
    const std::vector<int64_t>& shape,
    const std::vector<AxisSelection>& selections
) {
    SelectionRegion sel = region_from_selection(shape, selections);
    const Region region = RegionBuilder(sel.request).freeze();
    return {element_indices(region), std::move(sel.output_shape)};
}

}  // namespace hyperslab
