#include <nanobind/nanobind.h>
#include "hyperslab/common.hpp"
#include "hyperslab/enums.hpp"

namespace nb = nanobind;
using namespace hyperslab;

void bind_enums(nb::module_& m) {
    nb::enum_<DataType>(m, "DataType", nb::is_arithmetic())
        .value("UINT8", DataType::UINT8)
        .value("INT8", DataType::INT8)
        .value("UINT16", DataType::UINT16)
        .value("INT16", DataType::INT16)
        .value("UINT32", DataType::UINT32)
        .value("INT32", DataType::INT32)
        .value("UINT64", DataType::UINT64)
        .value("INT64", DataType::INT64)
        .value("FLOAT32", DataType::FLOAT32)
        .value("FLOAT64", DataType::FLOAT64)
        .export_values();

    nb::enum_<ByteOrder>(m, "ByteOrder")
        .value("LITTLE_ENDIAN", ByteOrder::LittleEndian)
        .value("BIG_ENDIAN", ByteOrder::BigEndian);

    m.def("datatype_size", &datatype_size, nb::arg("dtype"),
          "Size in bytes of one element of the given data type.");
}
