#include <nanobind/nanobind.h>
#include <nanobind/ndarray.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <string>
#include <vector>

#include "hyperslab/enums.hpp"
#include "hyperslab/file_reader.hpp"
#include "hyperslab/hyperrect_reader.hpp"
#include "hyperslab/region.hpp"

namespace nb = nanobind;
using namespace hyperslab;

// Read the region into a capsule-owned numpy array shaped in C order
// (slowest axis first).
template <typename T>
static nb::object read_as_array(const HyperRectangleReader& reader,
                                const Region& region) {
    std::vector<T>* vec;
    {
        nb::gil_scoped_release release;
        vec = new std::vector<T>(reader.read<T>(region));
    }
    nb::capsule owner(vec, [](void* p) noexcept {
        delete static_cast<std::vector<T>*>(p);
    });

    std::vector<size_t> shape(region.dimension());
    for (size_t i = 0; i < region.dimension(); ++i) {
        shape[region.dimension() - 1 - i] =
            static_cast<size_t>(region.target_size(i));
    }
    nb::ndarray<nb::numpy, T> arr(vec->data(), shape.size(), shape.data(),
                                  owner);
    return nb::cast(arr);
}

void bind_file_reader(nb::module_& m) {
    nb::class_<FileReader>(m, "FileReader")
        .def(nb::init<const std::string&>(),
             nb::arg("path"),
             "Open and memory-map a file by path.")
        .def_prop_ro("size", &FileReader::size,
             "Size of file in bytes.")
        .def_prop_ro("is_mmap", &FileReader::is_mmap,
             "Whether file is memory-mapped.")
        .def_prop_ro("path", &FileReader::path)
        .def("read", [](const FileReader& self, uint64_t offset, size_t count) {
                auto data = self.read(offset, count);
                return nb::bytes(
                    reinterpret_cast<const char*>(data.data()),
                    data.size()
                );
             },
             nb::arg("offset"), nb::arg("count"),
             "Read bytes from file (returns a copy).")
        .def("__repr__", [](const FileReader& self) {
                return "<FileReader size=" + std::to_string(self.size()) +
                       (self.is_mmap() ? " mmap" : " buffer") + ">";
             });

    m.def("read_region",
        [](const FileReader& source, const Region& region, DataType dtype,
           ByteOrder byteorder, uint64_t origin) -> nb::object {
            HyperRectangleReader reader(source,
                                        ReaderOptions{dtype, byteorder, origin});
            switch (dtype) {
                case DataType::UINT8:   return read_as_array<uint8_t>(reader, region);
                case DataType::INT8:    return read_as_array<int8_t>(reader, region);
                case DataType::UINT16:  return read_as_array<uint16_t>(reader, region);
                case DataType::INT16:   return read_as_array<int16_t>(reader, region);
                case DataType::UINT32:  return read_as_array<uint32_t>(reader, region);
                case DataType::INT32:   return read_as_array<int32_t>(reader, region);
                case DataType::UINT64:  return read_as_array<uint64_t>(reader, region);
                case DataType::INT64:   return read_as_array<int64_t>(reader, region);
                case DataType::FLOAT32: return read_as_array<float>(reader, region);
                case DataType::FLOAT64: return read_as_array<double>(reader, region);
            }
            throw nb::value_error("unsupported data type");
        },
        nb::arg("reader"), nb::arg("region"), nb::arg("dtype"),
        nb::arg("byteorder") = ByteOrder::LittleEndian,
        nb::arg("origin") = uint64_t(0),
        "Read the values of a region from an uncompressed array (GIL-free)."
    );
}
