#include "hyperslab/hyperrect_reader.hpp"

#include <fmt/format.h>

#include "hyperslab/checked_math.hpp"
#include "hyperslab/traversal.hpp"

namespace hyperslab {

HyperRectangleReader::HyperRectangleReader(const FileReader& source,
                                           ReaderOptions options)
    : source_(source),
      options_(options),
      element_size_(datatype_size(options.dtype)) {
    if (element_size_ == 0) {
        throw std::invalid_argument(fmt::format(
            "unsupported data type {}", static_cast<int>(options.dtype)));
    }
}

void HyperRectangleReader::read_into(const Region& region, void* dst,
                                     size_t dst_bytes) const {
    const int64_t esize = static_cast<int64_t>(element_size_);
    const size_t total = static_cast<size_t>(region.total_length());
    if (dst_bytes / element_size_ < total) {
        throw std::invalid_argument(fmt::format(
            "destination holds {} bytes, region needs {} elements of {} bytes",
            dst_bytes, total, element_size_));
    }

    const int64_t origin = checked_cast<int64_t>(options_.origin);
    auto* out = static_cast<uint8_t*>(dst);
    for_each_run(region, [&](int64_t offset, int64_t length) {
        const int64_t byte_offset =
            checked_add(origin, checked_mul(offset, esize));
        const size_t nbytes = static_cast<size_t>(length * esize);
        source_.copy_to(static_cast<uint64_t>(byte_offset), nbytes, out);
        to_native_order(out, static_cast<size_t>(length), element_size_,
                        options_.byte_order);
        out += nbytes;
    });
}

std::vector<uint8_t> HyperRectangleReader::read_bytes(
    const Region& region) const {
    std::vector<uint8_t> out(
        static_cast<size_t>(region.total_length()) * element_size_);
    read_into(region, out.data(), out.size());
    return out;
}

}  // namespace hyperslab
