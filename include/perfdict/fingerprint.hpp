/**
 * @file fingerprint.hpp
 * @brief Per-slot key digests that let lookups reject keys outside the build set
 *
 * At construction every build key stores a b-bit digest at its slot. A probe
 * key is accepted only if its own digest matches the one stored at the slot
 * it hashes to. The digest is drawn from the same hash family as the graph
 * endpoints but under a salted seed, so it is independent of h1 and h2.
 *
 * An absent key always lands on some genuine slot, so it is wrongly accepted
 * with probability 2^-b. With b = 0 the table is disabled and every key is
 * accepted.
 */

#pragma once

#include "core.hpp"
#include "hashers.hpp"
#include "packed_array.hpp"
#include "serialization.hpp"
#include <cmath>
#include <string_view>
#include <vector>

namespace perfdict {

template<seeded_hash_family Family = default_family>
class fingerprint_table {
    Family family_{};
    uint64_t seed_{0};
    packed_array digests_;

public:
    static constexpr unsigned max_bits = 32;
    static constexpr uint64_t digest_salt = 0xFEDCBA9876543210ULL;

    fingerprint_table() = default;

    /**
     * @param slots n, one digest per slot
     * @param bits Digest width, 0 disables the table
     * @param seed Seed of the hash function the table accompanies
     */
    fingerprint_table(size_t slots, unsigned bits, uint64_t seed, Family family = Family{})
        : family_(std::move(family))
        , seed_(seed)
        , digests_(bits > 0 ? slots : 0, bits) {}

    [[nodiscard]] bool enabled() const noexcept { return digests_.width() > 0; }
    [[nodiscard]] unsigned bits() const noexcept { return digests_.width(); }
    [[nodiscard]] size_t size() const noexcept { return digests_.size(); }

    [[nodiscard]] uint64_t digest(std::string_view key) const noexcept {
        if (!enabled()) return 0;
        auto h = family_.hash64(key, seed_ ^ digest_salt);
        return h.value & ((uint64_t{1} << bits()) - 1);
    }

    [[nodiscard]] uint64_t stored(slot_index slot) const noexcept {
        return digests_.get(slot.value);
    }

    // Construction only; the table is read-only once the container is built
    void assign(slot_index slot, std::string_view key) noexcept {
        digests_.set(slot.value, digest(key));
    }

    [[nodiscard]] bool matches(slot_index slot, std::string_view key) const noexcept {
        return !enabled() || digests_.get(slot.value) == digest(key);
    }

    /**
     * @brief Probability that a key outside the build set passes matches()
     */
    [[nodiscard]] double false_positive_rate() const noexcept {
        return enabled() ? std::ldexp(1.0, -static_cast<int>(bits())) : 1.0;
    }

    [[nodiscard]] size_t memory_bytes() const noexcept { return digests_.memory_bytes(); }

    bool operator==(const fingerprint_table& other) const noexcept {
        return seed_ == other.seed_ && digests_ == other.digests_;
    }

    // ===== SERIALIZATION =====

    void serialize_into(byte_writer& w) const {
        w.put_header(blob_kind::fingerprints);
        w.put(static_cast<uint32_t>(Family::family_id));
        w.put(seed_);
        w.put(static_cast<uint64_t>(digests_.size()));
        w.put(static_cast<uint32_t>(digests_.width()));
        w.put_array(digests_.words());
    }

    [[nodiscard]] static result<fingerprint_table> deserialize_from(byte_reader& r) {
        if (!r.expect_header(blob_kind::fingerprints)) {
            return std::unexpected(error::invalid_format);
        }

        auto family_id = r.get<uint32_t>();
        auto seed = r.get<uint64_t>();
        auto size = r.get<uint64_t>();
        auto bits = r.get<uint32_t>();
        if (!family_id || *family_id != Family::family_id || !seed || !size || !bits ||
            *bits > max_bits || *size >= max_key_count) {
            return std::unexpected(error::invalid_format);
        }

        auto words = r.get_array<uint64_t>();
        if (!words) {
            return std::unexpected(error::invalid_format);
        }

        auto digests = packed_array::from_words(*size, *bits, std::move(*words));
        if (!digests) {
            return std::unexpected(digests.error());
        }

        fingerprint_table table;
        table.seed_ = *seed;
        table.digests_ = std::move(*digests);
        return table;
    }
};

} // namespace perfdict
