/**
 * @file blob_file.hpp
 * @brief Persist serialized blobs to disk and map them back read-only
 *
 * The core containers only produce and consume byte spans; this header is
 * the thin file layer used by the command-line tool.
 */

#pragma once

#include "core.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <span>
#include <utility>

namespace perfdict {

namespace detail {

// RAII wrapper for file descriptor
class file_descriptor {
    int fd_{-1};
public:
    explicit file_descriptor(int fd) noexcept : fd_(fd) {}
    ~file_descriptor() { if (fd_ >= 0) ::close(fd_); }

    file_descriptor(file_descriptor&& other) noexcept
        : fd_(std::exchange(other.fd_, -1)) {}

    file_descriptor& operator=(file_descriptor&& other) noexcept {
        if (this != &other) {
            if (fd_ >= 0) ::close(fd_);
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }

    // Close now and report failure, instead of silently in the destructor
    [[nodiscard]] bool close() noexcept {
        return ::close(std::exchange(fd_, -1)) == 0;
    }
};

// RAII wrapper for a read-only memory mapping
class memory_map {
    void* addr_{nullptr};
    size_t size_{0};

public:
    memory_map() = default;
    memory_map(void* addr, size_t size) noexcept
        : addr_(addr), size_(size) {}

    ~memory_map() {
        if (addr_) ::munmap(addr_, size_);
    }

    memory_map(memory_map&& other) noexcept
        : addr_(std::exchange(other.addr_, nullptr)),
          size_(std::exchange(other.size_, 0)) {}

    memory_map& operator=(memory_map&& other) noexcept {
        if (this != &other) {
            if (addr_) ::munmap(addr_, size_);
            addr_ = std::exchange(other.addr_, nullptr);
            size_ = std::exchange(other.size_, 0);
        }
        return *this;
    }

    [[nodiscard]] const void* get() const noexcept { return addr_; }
    [[nodiscard]] size_t size() const noexcept { return size_; }
};

} // namespace detail

/**
 * @class mapped_blob
 * @brief A blob file mapped into memory for the lifetime of the object
 */
class mapped_blob {
    detail::memory_map map_;

    explicit mapped_blob(detail::memory_map map) noexcept : map_(std::move(map)) {}

public:
    [[nodiscard]] static result<mapped_blob> open(const std::filesystem::path& path) {
        int fd = ::open(path.c_str(), O_RDONLY);
        if (fd < 0) {
            return std::unexpected(error::io_error);
        }
        detail::file_descriptor fd_guard{fd};

        struct stat st;
        if (::fstat(fd, &st) < 0) {
            return std::unexpected(error::io_error);
        }
        if (st.st_size == 0) {
            return mapped_blob{detail::memory_map{}};
        }

        void* addr = ::mmap(nullptr, st.st_size, PROT_READ, MAP_PRIVATE, fd, 0);
        if (addr == MAP_FAILED) {
            return std::unexpected(error::io_error);
        }

        // The mapping stays valid after the descriptor is closed
        return mapped_blob{detail::memory_map{addr, static_cast<size_t>(st.st_size)}};
    }

    [[nodiscard]] std::span<const std::byte> bytes() const noexcept {
        return {static_cast<const std::byte*>(map_.get()), map_.size()};
    }

    [[nodiscard]] size_t size() const noexcept { return map_.size(); }
};

/**
 * @brief Write a blob to path, replacing any existing file
 */
[[nodiscard]] inline status write_blob(const std::filesystem::path& path, std::span<const std::byte> blob) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0666);
    if (fd < 0) {
        return std::unexpected(error::io_error);
    }
    detail::file_descriptor fd_guard{fd};

    const std::byte* p = blob.data();
    size_t left = blob.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(error::io_error);
        }
        p += n;
        left -= static_cast<size_t>(n);
    }

    if (!fd_guard.close()) {
        return std::unexpected(error::io_error);
    }
    return {};
}

} // namespace perfdict
