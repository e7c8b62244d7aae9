/**
 * @file packed_array.hpp
 * @brief Fixed-length array of w-bit unsigned integers packed into 64-bit words
 *
 * Entries may straddle a word boundary. Width 0 stores nothing and reads
 * back 0 for every index.
 */

#pragma once

#include "core.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace perfdict {

class packed_array {
    std::vector<uint64_t> words_;
    size_t size_{0};
    unsigned width_{0};

    [[nodiscard]] static constexpr uint64_t mask_for(unsigned width) noexcept {
        return width >= 64 ? ~uint64_t{0} : (uint64_t{1} << width) - 1;
    }

    [[nodiscard]] static constexpr size_t words_for(size_t size, unsigned width) noexcept {
        return (size * width + 63) / 64;
    }

public:
    static constexpr unsigned max_width = 64;

    packed_array() = default;

    packed_array(size_t size, unsigned width)
        : words_(words_for(size, width), 0)
        , size_(size)
        , width_(width) {}

    [[nodiscard]] uint64_t get(size_t i) const noexcept {
        if (width_ == 0) return 0;
        const uint64_t bit = static_cast<uint64_t>(i) * width_;
        const size_t word = bit / 64;
        const unsigned offset = bit % 64;

        uint64_t v = words_[word] >> offset;
        if (offset + width_ > 64) {
            v |= words_[word + 1] << (64 - offset);
        }
        return v & mask_for(width_);
    }

    void set(size_t i, uint64_t v) noexcept {
        if (width_ == 0) return;
        const uint64_t mask = mask_for(width_);
        v &= mask;

        const uint64_t bit = static_cast<uint64_t>(i) * width_;
        const size_t word = bit / 64;
        const unsigned offset = bit % 64;

        words_[word] = (words_[word] & ~(mask << offset)) | (v << offset);
        if (offset + width_ > 64) {
            const unsigned spill = 64 - offset;
            words_[word + 1] = (words_[word + 1] & ~(mask >> spill)) | (v >> spill);
        }
    }

    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] unsigned width() const noexcept { return width_; }
    [[nodiscard]] std::span<const uint64_t> words() const noexcept { return words_; }
    [[nodiscard]] size_t memory_bytes() const noexcept { return words_.size() * sizeof(uint64_t); }

    /**
     * @brief Rebuild from raw words, e.g. after deserialization
     * @return error::invalid_format if the word count does not match
     */
    [[nodiscard]] static result<packed_array> from_words(size_t size, unsigned width, std::vector<uint64_t> words) {
        if (width > max_width || words.size() != words_for(size, width)) {
            return std::unexpected(error::invalid_format);
        }
        packed_array a;
        a.words_ = std::move(words);
        a.size_ = size;
        a.width_ = width;
        return a;
    }

    bool operator==(const packed_array&) const = default;
};

} // namespace perfdict
