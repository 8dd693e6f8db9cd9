#include <nanobind/nanobind.h>
#include "hyperslab/common.hpp"

namespace nb = nanobind;

void bind_enums(nb::module_& m);
void bind_region(nb::module_& m);
void bind_file_reader(nb::module_& m);
void bind_selection(nb::module_& m);

NB_MODULE(_hyperslab_ext, m) {
    m.doc() = "Strided hyper-rectangular sub-region addressing and reading";
    m.attr("__version__") = "0.3.0";

    nb::exception<hyperslab::HyperslabError>(m, "HyperslabError");
    nb::exception<hyperslab::InvalidRegion>(m, "InvalidRegion",
                                            PyExc_ValueError);
    nb::exception<hyperslab::ArithmeticOverflow>(m, "ArithmeticOverflow",
                                                 PyExc_OverflowError);

    bind_enums(m);
    bind_region(m);
    bind_file_reader(m);
    bind_selection(m);
}
