#include <nanobind/nanobind.h>
#include <nanobind/ndarray.h>
#include <nanobind/stl/vector.h>

#include <string>

#include "hyperslab/region.hpp"
#include "hyperslab/selection.hpp"

namespace nb = nanobind;
using namespace hyperslab;

// Resolve Python ints and slices against `shape`, both fastest axis first.
static std::vector<AxisSelection> parse_selections(
    const std::vector<int64_t>& shape, nb::sequence selections_py) {
    const size_t ndim = shape.size();
    if (nb::len(selections_py) != ndim) {
        throw nb::value_error("selections length must match shape length");
    }

    std::vector<AxisSelection> selections(ndim);
    for (size_t i = 0; i < ndim; ++i) {
        nb::object sel = selections_py[i];

        if (sel.is_none()) {
            selections[i] = {false, 0, shape[i], 1};
        } else if (nb::isinstance<nb::int_>(sel) ||
                   nb::hasattr(sel, "__index__")) {
            selections[i] = {true, nb::cast<int64_t>(sel), 0, 1};
        } else if (nb::isinstance<nb::slice>(sel)) {
            Py_ssize_t start, stop, step, slicelength;
            int rc = PySlice_GetIndicesEx(
                sel.ptr(), static_cast<Py_ssize_t>(shape[i]),
                &start, &stop, &step, &slicelength);
            if (rc != 0) {
                throw nb::python_error();
            }
            if (slicelength == 0) {
                throw nb::value_error(
                    ("empty selection for axis " + std::to_string(i)).c_str());
            }
            selections[i] = {false, static_cast<int64_t>(start),
                             static_cast<int64_t>(stop),
                             static_cast<int64_t>(step)};
        } else {
            throw nb::type_error(
                ("axis " + std::to_string(i) +
                 ": selection must be an int, a slice or None").c_str());
        }
    }
    return selections;
}

void bind_selection(nb::module_& m) {

    // Receives (shape: sequence, selections: sequence of int/slice/None)
    // Returns (flat_indices: ndarray[uint64], output_shape: tuple)
    m.def("selection_to_indices",
        [](const std::vector<int64_t>& shape,
           nb::sequence selections_py) -> nb::tuple {
            std::vector<AxisSelection> selections =
                parse_selections(shape, selections_py);

            SelectionResult result;
            {
                nb::gil_scoped_release release;
                result = compute_selection_indices(shape, selections);
            }

            auto* vec = new std::vector<uint64_t>(
                std::move(result.flat_indices));
            size_t n = vec->size();
            nb::capsule owner(vec, [](void* p) noexcept {
                delete static_cast<std::vector<uint64_t>*>(p);
            });
            nb::ndarray<nb::numpy, uint64_t, nb::ndim<1>> arr(
                vec->data(), {n}, owner);

            nb::tuple out_shape = nb::steal<nb::tuple>(
                PyTuple_New(
                    static_cast<Py_ssize_t>(result.output_shape.size())));
            for (size_t i = 0; i < result.output_shape.size(); ++i) {
                PyTuple_SET_ITEM(
                    out_shape.ptr(),
                    static_cast<Py_ssize_t>(i),
                    PyLong_FromLongLong(result.output_shape[i]));
            }

            return nb::make_tuple(arr, out_shape);
        },
        nb::arg("shape"), nb::arg("selections"),
        "Linear element indices selected by ints and slices, axis 0 fastest."
    );

    m.def("selection_to_region",
        [](const std::vector<int64_t>& shape,
           nb::sequence selections_py) -> Region {
            SelectionRegion sel = region_from_selection(
                shape, parse_selections(shape, selections_py));
            return RegionBuilder(sel.request).freeze();
        },
        nb::arg("shape"), nb::arg("selections"),
        "Region covering the values selected by ints and slices."
    );
}
