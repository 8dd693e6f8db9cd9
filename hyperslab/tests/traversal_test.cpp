#include "hyperslab/traversal.hpp"

#include <cstdint>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "hyperslab/region.hpp"

namespace {

using ::testing::ElementsAre;
using hyperslab::element_indices;
using hyperslab::for_each_run;
using hyperslab::Region;
using hyperslab::RegionBuilder;
using hyperslab::run_count;

struct Axis {
    int64_t lower, upper, step;
};

// Linear addresses selected by nested loops over the kept indices of each
// axis, axis 0 fastest.
std::vector<uint64_t> brute_force(const std::vector<int64_t>& size,
                                  const std::vector<Axis>& axes) {
    const size_t ndim = size.size();
    std::vector<std::vector<int64_t>> kept(ndim);
    std::vector<int64_t> strides(ndim);
    int64_t stride = 1;
    for (size_t i = 0; i < ndim; ++i) {
        for (int64_t v = axes[i].lower; v < axes[i].upper; v += axes[i].step) {
            kept[i].push_back(v);
        }
        strides[i] = stride;
        stride *= size[i];
    }

    std::vector<uint64_t> out;
    std::vector<size_t> counters(ndim, 0);
    for (;;) {
        int64_t flat = 0;
        for (size_t d = 0; d < ndim; ++d) {
            flat += kept[d][counters[d]] * strides[d];
        }
        out.push_back(static_cast<uint64_t>(flat));

        size_t d = 0;
        for (; d < ndim; ++d) {
            if (++counters[d] < kept[d].size()) break;
            counters[d] = 0;
        }
        if (d == ndim) return out;
    }
}

// All (lower, upper, step) triples valid for an axis of the given extent.
std::vector<Axis> all_axes(int64_t size) {
    std::vector<Axis> out;
    for (int64_t l = 0; l < size; ++l)
        for (int64_t u = l + 1; u <= size; ++u)
            for (int64_t s = 1; s <= size; ++s)
                out.push_back({l, u, s});
    return out;
}

// Checks traversal against brute_force() for every request on `size`.
void check_exhaustively(const std::vector<int64_t>& size) {
    const size_t ndim = size.size();
    int64_t total = 1;
    std::vector<std::vector<Axis>> choices;
    for (int64_t s : size) {
        choices.push_back(all_axes(s));
        total *= s;
    }

    std::vector<size_t> pick(ndim, 0);
    size_t checked = 0;
    for (;;) {
        std::vector<Axis> axes(ndim);
        std::vector<int64_t> lower(ndim), upper(ndim), step(ndim);
        for (size_t i = 0; i < ndim; ++i) {
            axes[i] = choices[i][pick[i]];
            lower[i] = axes[i].lower;
            upper[i] = axes[i].upper;
            step[i] = axes[i].step;
        }

        Region r = Region::create(size, lower, upper, step);
        const std::vector<uint64_t> expected = brute_force(size, axes);
        ASSERT_EQ(expected, element_indices(r))
            << "request lower/upper/step on axis 0: " << lower[0] << "/"
            << upper[0] << "/" << step[0] << "\n" << r.describe();
        ASSERT_EQ(static_cast<int64_t>(expected.size()), r.total_length());

        // Runs have the contiguous length and end where the reconciliation
        // with the whole array requires.
        const int64_t run = r.target_length(r.contiguous_prefix_length());
        int64_t runs = 0;
        int64_t end = r.start_offset();
        for_each_run(r, [&](int64_t offset, int64_t length) {
            EXPECT_EQ(run, length);
            end = offset + length;
            ++runs;
        });
        ASSERT_EQ(run_count(r), runs);
        ASSERT_EQ(total, end - r.start_offset() + r.skip(ndim));
        ++checked;

        size_t d = 0;
        for (; d < ndim; ++d) {
            if (++pick[d] < choices[d].size()) break;
            pick[d] = 0;
        }
        if (d == ndim) break;
    }

    size_t combinations = 1;
    for (const auto& c : choices) combinations *= c.size();
    EXPECT_EQ(combinations, checked);
}

TEST(TraversalTest, SubsampledLine) {
    Region r = Region::create({10}, {2}, {8}, {2});
    EXPECT_THAT(element_indices(r), ElementsAre(2, 4, 6));
    EXPECT_EQ(3, run_count(r));
}

TEST(TraversalTest, FullArrayIsOneRun) {
    Region r = Region::create({4, 4}, {0, 0}, {4, 4}, {1, 1});
    std::vector<std::pair<int64_t, int64_t>> runs;
    for_each_run(r, [&](int64_t offset, int64_t length) {
        runs.emplace_back(offset, length);
    });
    EXPECT_THAT(runs, ElementsAre(std::make_pair(int64_t{0}, int64_t{16})));
}

TEST(TraversalTest, SubBlock) {
    Region r = Region::create({4, 4}, {1, 1}, {3, 3}, {1, 1});
    std::vector<std::pair<int64_t, int64_t>> runs;
    for_each_run(r, [&](int64_t offset, int64_t length) {
        runs.emplace_back(offset, length);
    });
    EXPECT_THAT(runs, ElementsAre(std::make_pair(int64_t{5}, int64_t{2}),
                                  std::make_pair(int64_t{9}, int64_t{2})));
    EXPECT_THAT(element_indices(r), ElementsAre(5, 6, 9, 10));
}

TEST(TraversalTest, SubBlockOfCube) {
    Region r = Region::create({4, 4, 4}, {1, 1, 1}, {3, 3, 3}, {1, 1, 1});
    EXPECT_THAT(element_indices(r),
                ElementsAre(21, 22, 25, 26, 37, 38, 41, 42));
}

TEST(TraversalTest, ZeroDimensional) {
    Region r = Region::create({}, {}, {}, {});
    EXPECT_THAT(element_indices(r), ElementsAre(0));
    EXPECT_EQ(1, run_count(r));
}

TEST(TraversalTest, PaddedRecords) {
    // 4x3 array whose rows are stored 6 values apart.
    RegionBuilder b({4, 3}, {0, 0}, {4, 3}, {1, 1});
    b.increase_stride(1, 2);
    EXPECT_THAT(element_indices(b.freeze()),
                ElementsAre(0, 1, 2, 3, 6, 7, 8, 9, 12, 13, 14, 15));

    RegionBuilder sub({4, 3}, {1, 1}, {3, 3}, {1, 1});
    sub.increase_stride(1, 2);
    Region r = sub.freeze();
    // Row 1 starts at 6 on disk; start_offset is the logical 5 and the
    // caller accounts for padding before the first row it reads.
    EXPECT_THAT(element_indices(r), ElementsAre(5, 6, 11, 12));
}

TEST(TraversalTest, Exhaustive3x3x3) {
    check_exhaustively({3, 3, 3});
}

TEST(TraversalTest, Exhaustive4x4x4) {
    check_exhaustively({4, 4, 4});
}

TEST(TraversalTest, ExhaustiveMixedExtents) {
    check_exhaustively({3, 2, 4, 2});
    check_exhaustively({5, 1, 3});
}

}  // namespace
