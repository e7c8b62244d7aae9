/**
 * @file serialization.hpp
 * @brief Byte-level blob encoding shared by every persisted component
 *
 * Blobs are written in host byte order and start with a common header
 * (magic, format version, payload kind). Readers never trust lengths: every
 * read is bounds checked and a failure surfaces as error::invalid_format.
 */

#pragma once

#include "core.hpp"
#include <array>
#include <bit>
#include <cstddef>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace perfdict {

// Magic numbers for serialization format
inline constexpr uint32_t PERFDICT_MAGIC = 0x50444354;  // "PDCT"
inline constexpr uint32_t PERFDICT_FORMAT_VERSION = 1;

/**
 * @enum blob_kind
 * @brief Payload tag following the magic and version
 */
enum class blob_kind : uint32_t {
    hash_function = 1,
    fingerprints = 2,
    perfect_map = 3
};

/**
 * @class byte_writer
 * @brief Append-only encoder
 */
class byte_writer {
    std::vector<std::byte> out_;

public:
    template<typename T>
        requires std::is_trivially_copyable_v<T>
    void put(const T& v) {
        auto bytes = std::bit_cast<std::array<std::byte, sizeof(T)>>(v);
        out_.insert(out_.end(), bytes.begin(), bytes.end());
    }

    // Length-prefixed array of trivially copyable elements
    template<typename T>
        requires std::is_trivially_copyable_v<T>
    void put_array(std::span<const T> items) {
        put(static_cast<uint64_t>(items.size()));
        auto bytes = std::as_bytes(items);
        out_.insert(out_.end(), bytes.begin(), bytes.end());
    }

    void put_string(std::string_view s) {
        put(static_cast<uint64_t>(s.size()));
        auto* p = reinterpret_cast<const std::byte*>(s.data());
        out_.insert(out_.end(), p, p + s.size());
    }

    void put_header(blob_kind kind) {
        put(PERFDICT_MAGIC);
        put(PERFDICT_FORMAT_VERSION);
        put(static_cast<uint32_t>(kind));
    }

    [[nodiscard]] size_t size() const noexcept { return out_.size(); }

    [[nodiscard]] std::vector<std::byte> take() && { return std::move(out_); }
};

/**
 * @class byte_reader
 * @brief Bounds-checked decoder over a borrowed byte span
 */
class byte_reader {
    std::span<const std::byte> data_;
    size_t offset_{0};

public:
    explicit byte_reader(std::span<const std::byte> data) noexcept : data_(data) {}

    [[nodiscard]] size_t remaining() const noexcept { return data_.size() - offset_; }
    [[nodiscard]] bool exhausted() const noexcept { return offset_ == data_.size(); }

    template<typename T>
        requires std::is_trivially_copyable_v<T>
    [[nodiscard]] std::optional<T> get() noexcept {
        if (remaining() < sizeof(T)) return std::nullopt;
        std::array<std::byte, sizeof(T)> bytes;
        std::memcpy(bytes.data(), data_.data() + offset_, sizeof(T));
        offset_ += sizeof(T);
        return std::bit_cast<T>(bytes);
    }

    template<typename T>
        requires std::is_trivially_copyable_v<T> && std::is_default_constructible_v<T>
    [[nodiscard]] std::optional<std::vector<T>> get_array() {
        auto count = get<uint64_t>();
        if (!count || *count > remaining() / sizeof(T)) return std::nullopt;

        std::vector<T> items(*count);
        if (items.empty()) return items;   // data() may be null

        std::memcpy(items.data(), data_.data() + offset_, *count * sizeof(T));
        offset_ += *count * sizeof(T);
        return items;
    }

    [[nodiscard]] std::optional<std::string> get_string() {
        auto len = get<uint64_t>();
        if (!len || *len > remaining()) return std::nullopt;

        std::string s(reinterpret_cast<const char*>(data_.data() + offset_), *len);
        offset_ += *len;
        return s;
    }

    // True if the next bytes are a header of the given kind
    [[nodiscard]] bool expect_header(blob_kind kind) noexcept {
        auto magic = get<uint32_t>();
        auto version = get<uint32_t>();
        auto tag = get<uint32_t>();
        return magic && *magic == PERFDICT_MAGIC &&
               version && *version == PERFDICT_FORMAT_VERSION &&
               tag && *tag == static_cast<uint32_t>(kind);
    }
};

// ===== VALUE CODECS =====

/**
 * @struct value_codec
 * @brief Encoding of one stored value; specialize for custom value types
 */
template<typename V>
struct value_codec;

template<typename V>
    requires std::is_trivially_copyable_v<V>
struct value_codec<V> {
    static void encode(byte_writer& w, const V& v) { w.put(v); }
    static std::optional<V> decode(byte_reader& r) { return r.get<V>(); }
};

template<>
struct value_codec<std::string> {
    static void encode(byte_writer& w, const std::string& v) { w.put_string(v); }
    static std::optional<std::string> decode(byte_reader& r) { return r.get_string(); }
};

template<typename V>
concept serializable_value = requires(byte_writer& w, byte_reader& r, const V& v) {
    value_codec<V>::encode(w, v);
    { value_codec<V>::decode(r) } -> std::same_as<std::optional<V>>;
};

} // namespace perfdict
