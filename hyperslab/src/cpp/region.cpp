#include "hyperslab/region.hpp"

#include <algorithm>
#include <ostream>
#include <utility>

#include <fmt/format.h>

#include "hyperslab/checked_math.hpp"
#include "hyperslab/common.hpp"

namespace hyperslab {

namespace {

void validate(const RegionRequest& r) {
    const size_t ndim = r.size.size();
    if (r.lower.size() != ndim || r.upper.size() != ndim ||
        r.step.size() != ndim) {
        throw InvalidRegion(fmt::format(
            "size, lower, upper and step must have the same length "
            "(got {}, {}, {}, {})",
            ndim, r.lower.size(), r.upper.size(), r.step.size()));
    }
    for (size_t i = 0; i < ndim; ++i) {
        if (r.lower[i] < 0) {
            throw InvalidRegion(fmt::format(
                "axis {}: lower bound {} is negative", i, r.lower[i]));
        }
        if (r.lower[i] >= r.upper[i]) {
            throw InvalidRegion(fmt::format(
                "axis {}: lower bound {} must be less than upper bound {}",
                i, r.lower[i], r.upper[i]));
        }
        if (r.upper[i] > r.size[i]) {
            throw InvalidRegion(fmt::format(
                "axis {}: upper bound {} exceeds size {}",
                i, r.upper[i], r.size[i]));
        }
        if (r.step[i] <= 0) {
            throw InvalidRegion(fmt::format(
                "axis {}: step {} must be positive", i, r.step[i]));
        }
    }
}

}  // namespace

// ---- RegionBuilder ----

RegionBuilder::RegionBuilder(const RegionRequest& request) {
    validate(request);

    const size_t ndim = request.size.size();
    std::vector<int32_t> target_size(ndim);
    std::vector<int64_t> skips(ndim + 1, 0);

    // Axes are visited fastest first. `stride` is the number of values
    // between two consecutive indices of axis i; `skip` accumulates the
    // values of inner axes lying outside the covered span, to be skipped
    // once axis i advances.
    int64_t position = 0;
    int64_t stride = 1;
    int64_t skip = 0;
    for (size_t i = 0; i < ndim; ++i) {
        const int64_t step = request.step[i];
        const int64_t lower = request.lower[i];
        const int64_t span = request.size[i];
        const int64_t count = ceil_div(request.upper[i] - lower, step);
        const int64_t covered = (count - 1) * step + 1;
        target_size[i] = checked_cast<int32_t>(count);

        position = checked_add(position, checked_mul(stride, lower));
        skip = checked_add(skip, checked_mul(stride, span - covered));
        skips[i] = checked_add(skips[i], checked_mul(stride, step - 1));
        stride = checked_mul(stride, span);
        skips[i + 1] = skip;
    }

    target_size_ = std::move(target_size);
    start_offset_ = position;
    skips_ = std::move(skips);
}

RegionBuilder::RegionBuilder(const std::vector<int64_t>& size,
                             const std::vector<int64_t>& lower,
                             const std::vector<int64_t>& upper,
                             const std::vector<int64_t>& step)
    : RegionBuilder(RegionRequest{size, lower, upper, step}) {}

RegionBuilder& RegionBuilder::increase_stride(size_t axis,
                                              int64_t extra_skip) {
    if (axis >= skips_.size()) {
        throw std::out_of_range(fmt::format(
            "axis {} out of range for a {}-dimensional region",
            axis, dimension()));
    }
    skips_[axis] = checked_add(skips_[axis], extra_skip);
    return *this;
}

Region RegionBuilder::freeze() const {
    return Region(target_size_, start_offset_, skips_);
}

// ---- Region ----

Region::Region(std::vector<int32_t> target_size, int64_t start_offset,
               std::vector<int64_t> skips)
    : target_size_(std::move(target_size)),
      start_offset_(start_offset),
      skips_(std::move(skips)) {}

Region Region::create(const std::vector<int64_t>& size,
                      const std::vector<int64_t>& lower,
                      const std::vector<int64_t>& upper,
                      const std::vector<int64_t>& step) {
    return RegionBuilder(size, lower, upper, step).freeze();
}

size_t Region::contiguous_prefix_length() const {
    const size_t ndim = dimension();
    size_t i = 0;
    while (i < ndim && skips_[i] == 0) {
        ++i;
    }
    return i;
}

int32_t Region::target_length(size_t k) const {
    if (k > dimension()) {
        throw std::out_of_range(fmt::format(
            "{} axes requested from a {}-dimensional region",
            k, dimension()));
    }
    int64_t length = 1;
    for (size_t i = 0; i < k; ++i) {
        length = checked_mul(length, static_cast<int64_t>(target_size_[i]));
    }
    return checked_cast<int32_t>(length);
}

std::string Region::describe() const {
    const size_t ndim = dimension();
    std::vector<std::string> sizes;
    std::vector<std::string> skips;
    sizes.reserve(ndim + 1);
    skips.reserve(ndim + 1);
    sizes.emplace_back("size");
    skips.emplace_back("skip");
    for (size_t i = 0; i < ndim; ++i) {
        sizes.push_back(fmt::format("{}", target_size_[i]));
        skips.push_back(fmt::format("{}", skips_[i]));
    }

    size_t w0 = 0;
    size_t w1 = 0;
    for (size_t r = 0; r < sizes.size(); ++r) {
        w0 = std::max(w0, sizes[r].size());
        w1 = std::max(w1, skips[r].size());
    }

    std::string out;
    for (size_t r = 0; r < sizes.size(); ++r) {
        out += fmt::format("{:>{}} {:>{}}\n", sizes[r], w0, skips[r], w1);
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const Region& region) {
    return os << region.describe();
}

}  // namespace hyperslab
