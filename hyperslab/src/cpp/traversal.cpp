#include "hyperslab/traversal.hpp"

namespace hyperslab {

int64_t run_count(const Region& region) {
    int64_t count = 1;
    const auto& target_size = region.target_size();
    for (size_t i = region.contiguous_prefix_length(); i < target_size.size();
         ++i) {
        count = checked_mul(count, static_cast<int64_t>(target_size[i]));
    }
    return count;
}

std::vector<uint64_t> element_indices(const Region& region) {
    std::vector<uint64_t> indices;
    indices.reserve(static_cast<size_t>(region.total_length()));
    for_each_run(region, [&](int64_t offset, int64_t length) {
        for (int64_t i = 0; i < length; ++i) {
            indices.push_back(static_cast<uint64_t>(offset + i));
        }
    });
    return indices;
}

}  // namespace hyperslab
