/**
 * @file id_generator.hpp
 * @brief Short hexadecimal wire identifiers.
 */

#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace wires {

inline constexpr size_t kWireIdLength = 7;

/// Exactly kWireIdLength lowercase hex digits.
[[nodiscard]] bool is_valid_wire_id(std::string_view id) noexcept;

/**
 * @brief Source of candidate ids.
 *
 * Uniqueness is not the generator's job: the engine checks each candidate
 * against the store and asks again on collision.
 */
class IdGenerator {
public:
    virtual ~IdGenerator() = default;

    [[nodiscard]] virtual WireId generate(std::string_view title) = 0;
};

/**
 * @brief Hashes the title, a nanosecond clock reading and per-process
 *        entropy, then keeps the low 28 bits.
 */
class HashIdGenerator : public IdGenerator {
public:
    HashIdGenerator();
    explicit HashIdGenerator(uint64_t seed) noexcept : state_(seed) {}

    [[nodiscard]] WireId generate(std::string_view title) override;

private:
    uint64_t state_;
};

}  // namespace wires
