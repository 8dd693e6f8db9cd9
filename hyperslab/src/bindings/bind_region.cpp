#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <string>

#include "hyperslab/region.hpp"

namespace nb = nanobind;
using namespace hyperslab;

void bind_region(nb::module_& m) {
    nb::class_<Region>(m, "Region")
        .def(nb::new_(&Region::create),
             nb::arg("size"), nb::arg("lower"),
             nb::arg("upper"), nb::arg("step"),
             "Compute the geometry of a strided sub-region, axis 0 fastest.")
        .def_static("create", &Region::create,
             nb::arg("size"), nb::arg("lower"),
             nb::arg("upper"), nb::arg("step"))
        .def_prop_ro("dimension", &Region::dimension)
        .def_prop_ro("target_size",
             [](const Region& r) { return r.target_size(); })
        .def_prop_ro("start_offset", &Region::start_offset)
        .def_prop_ro("skips", &Region::skips)
        .def_prop_ro("contiguous_prefix_length",
             &Region::contiguous_prefix_length)
        .def("target_length", &Region::target_length, nb::arg("k"),
             "Number of values in the leading k axes after subsampling.")
        .def("describe", &Region::describe)
        .def("__str__", &Region::describe)
        .def("__repr__", [](const Region& r) {
            std::string sizes;
            for (size_t i = 0; i < r.dimension(); ++i) {
                if (i) sizes += "x";
                sizes += std::to_string(r.target_size(i));
            }
            return "<Region dimension=" + std::to_string(r.dimension()) +
                   " target_size=" + (sizes.empty() ? "()" : sizes) +
                   " start_offset=" + std::to_string(r.start_offset()) +
                   " contiguous=" +
                   std::to_string(r.contiguous_prefix_length()) + ">";
        });

    // The builder is the only mutable stage; freeze() copies its state into
    // an immutable Region and leaves the builder usable.
    nb::class_<RegionBuilder>(m, "RegionBuilder")
        .def(nb::init<const std::vector<int64_t>&,
                      const std::vector<int64_t>&,
                      const std::vector<int64_t>&,
                      const std::vector<int64_t>&>(),
             nb::arg("size"), nb::arg("lower"),
             nb::arg("upper"), nb::arg("step"))
        .def_prop_ro("dimension", &RegionBuilder::dimension)
        .def("increase_stride",
             [](RegionBuilder& b, size_t axis, int64_t extra_skip) {
                 b.increase_stride(axis, extra_skip);
             },
             nb::arg("axis"), nb::arg("extra_skip"),
             "Skip extra_skip more values whenever the given axis advances.")
        .def("freeze", &RegionBuilder::freeze);
}
