#include "hyperslab/file_reader.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

namespace hyperslab {

FileReader::FileReader(const std::string& path) : path_(path) {
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw HyperslabError("cannot open file: " + path);
    }

    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        release();
        throw HyperslabError("cannot stat file: " + path);
    }
    // An empty file maps nothing; every non-empty read of it fails later.
    if (st.st_size == 0) {
        return;
    }

    const size_t length = static_cast<size_t>(st.st_size);
    void* mapped = ::mmap(nullptr, length, PROT_READ, MAP_PRIVATE, fd_, 0);
    if (mapped == MAP_FAILED) {
        release();
        throw HyperslabError("cannot mmap file: " + path);
    }
    data_ = static_cast<const uint8_t*>(mapped);
    size_ = length;
    owns_mmap_ = true;
}

FileReader::FileReader(const uint8_t* data, size_t size)
    : data_(data), size_(size) {}

FileReader::~FileReader() {
    release();
}

FileReader::FileReader(FileReader&& other) noexcept
    : path_(std::move(other.path_)),
      data_(std::exchange(other.data_, nullptr)),
      size_(std::exchange(other.size_, 0)),
      owns_mmap_(std::exchange(other.owns_mmap_, false)),
      fd_(std::exchange(other.fd_, -1)) {}

FileReader& FileReader::operator=(FileReader&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        data_ = std::exchange(other.data_, nullptr);
        size_ = std::exchange(other.size_, 0);
        owns_mmap_ = std::exchange(other.owns_mmap_, false);
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void FileReader::release() noexcept {
    if (owns_mmap_) {
        ::munmap(const_cast<uint8_t*>(data_), size_);
        owns_mmap_ = false;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    data_ = nullptr;
    size_ = 0;
}

bool FileReader::contains(uint64_t offset, uint64_t count) const {
    // Written without offset + count, which may wrap.
    return offset <= size_ && count <= size_ - offset;
}

std::vector<uint8_t> FileReader::read(uint64_t offset, size_t count) const {
    if (data_ == nullptr || offset >= size_) {
        return {};
    }
    const size_t n = std::min<uint64_t>(count, size_ - offset);
    return std::vector<uint8_t>(data_ + offset, data_ + offset + n);
}

const uint8_t* FileReader::ptr_at(uint64_t offset, size_t count) const {
    if (count == 0 && offset <= size_) {
        return data_ == nullptr ? nullptr : data_ + offset;
    }
    if (data_ == nullptr || !contains(offset, count)) {
        throw HyperslabError(fmt::format(
            "read of {} bytes at offset {} beyond end of {} ({} bytes)",
            count, offset, path_.empty() ? "buffer" : path_, size_));
    }
    return data_ + offset;
}

void FileReader::copy_to(uint64_t offset, size_t count, uint8_t* dst) const {
    const uint8_t* src = ptr_at(offset, count);
    if (count != 0) {
        std::memcpy(dst, src, count);
    }
}

}  // namespace hyperslab
