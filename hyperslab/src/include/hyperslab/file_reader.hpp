#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "hyperslab/common.hpp"

namespace hyperslab {

// Read-only byte source for a HyperRectangleReader: either a memory-mapped
// file (POSIX) or a caller-owned buffer.
class FileReader {
public:
    // Open and memory-map a file by path
    explicit FileReader(const std::string& path);

    // Wrap an existing buffer (does not own the data)
    FileReader(const uint8_t* data, size_t size);

    ~FileReader();

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    FileReader(FileReader&& other) noexcept;
    FileReader& operator=(FileReader&& other) noexcept;

    const uint8_t* data() const { return data_; }
    size_t size() const { return size_; }
    bool is_mmap() const { return owns_mmap_; }

    // Path given at construction, empty for wrapped buffers
    const std::string& path() const { return path_; }

    // True when [offset, offset + count) lies inside the source
    bool contains(uint64_t offset, uint64_t count) const;

    // Read a range, clamped to the end of the source (returns a copy)
    std::vector<uint8_t> read(uint64_t offset, size_t count) const;

    // Zero-copy access, only valid while the FileReader is alive.
    // Throws HyperslabError when the range is not fully inside the source.
    const uint8_t* ptr_at(uint64_t offset, size_t count) const;

    // Copy exactly `count` bytes at `offset` into dst; same bounds rule
    // as ptr_at().
    void copy_to(uint64_t offset, size_t count, uint8_t* dst) const;

private:
    // Unmaps and closes whatever this reader owns, leaving it empty.
    void release() noexcept;

    std::string path_;
    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
    bool owns_mmap_ = false;
    int fd_ = -1;
};

}  // namespace hyperslab
