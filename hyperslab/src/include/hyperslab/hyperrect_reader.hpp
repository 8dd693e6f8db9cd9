#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "hyperslab/common.hpp"
#include "hyperslab/enums.hpp"
#include "hyperslab/file_reader.hpp"
#include "hyperslab/region.hpp"

namespace hyperslab {

struct ReaderOptions {
    DataType dtype = DataType::UINT8;
    ByteOrder byte_order = ByteOrder::LittleEndian;
    uint64_t origin = 0;  // byte offset of element 0 of the variable
};

// Reads the values of a Region from an uncompressed array stored in a
// FileReader, one bulk copy per contiguous run, and converts them to
// native byte order.
//
// The reader does not own the FileReader, which must outlive it.
class HyperRectangleReader {
public:
    HyperRectangleReader(const FileReader& source, ReaderOptions options);

    const ReaderOptions& options() const { return options_; }
    size_t element_size() const { return element_size_; }

    // Fills dst with region.total_length() elements. Throws
    // std::invalid_argument when dst_bytes is too small, HyperslabError
    // when a run lies beyond the end of the source and ArithmeticOverflow
    // when a byte offset does not fit in 64 bits.
    void read_into(const Region& region, void* dst, size_t dst_bytes) const;

    std::vector<uint8_t> read_bytes(const Region& region) const;

    template <typename T>
    std::vector<T> read(const Region& region) const {
        static_assert(std::is_arithmetic<T>::value, "arithmetic type required");
        if (datatype_of<T>::value != options_.dtype) {
            throw std::invalid_argument(
                std::string("cannot read ") + datatype_name(options_.dtype) +
                " values as " + datatype_name(datatype_of<T>::value));
        }
        std::vector<T> out(static_cast<size_t>(region.total_length()));
        read_into(region, out.data(), out.size() * sizeof(T));
        return out;
    }

private:
    const FileReader& source_;
    ReaderOptions options_;
    size_t element_size_;
};

}  // namespace hyperslab
