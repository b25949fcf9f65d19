/**
 * @file id_generator.cpp
 * @brief HashIdGenerator implementation.
 */

#include "ids/id_generator.hpp"

#include <chrono>
#include <cstdio>
#include <random>

namespace wires {

namespace {

constexpr uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

uint64_t fnv1a(uint64_t hash, const void* data, size_t size) noexcept {
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (size_t i = 0; i < size; ++i) {
        hash ^= bytes[i];
        hash *= kFnvPrime;
    }
    return hash;
}

/// Finalizer from splitmix64; spreads entropy into the low bits.
uint64_t mix(uint64_t x) noexcept {
    x ^= x >> 30;
    x *= 0xbf58476d1ce4e5b9ULL;
    x ^= x >> 27;
    x *= 0x94d049bb133111ebULL;
    x ^= x >> 31;
    return x;
}

}  // namespace

bool is_valid_wire_id(std::string_view id) noexcept {
    if (id.size() != kWireIdLength) return false;
    for (char c : id) {
        bool digit = c >= '0' && c <= '9';
        bool lower_hex = c >= 'a' && c <= 'f';
        if (!digit && !lower_hex) return false;
    }
    return true;
}

HashIdGenerator::HashIdGenerator() {
    std::random_device rd;
    state_ = (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

WireId HashIdGenerator::generate(std::string_view title) {
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    // Advancing the state keeps back-to-back calls distinct within one clock tick.
    state_ += 0x9e3779b97f4a7c15ULL;

    uint64_t hash = fnv1a(kFnvOffset, title.data(), title.size());
    hash = fnv1a(hash, &nanos, sizeof(nanos));
    hash = fnv1a(hash, &state_, sizeof(state_));
    hash = mix(hash);

    char buffer[kWireIdLength + 1];
    std::snprintf(buffer, sizeof(buffer), "%07x", static_cast<unsigned>(hash & 0x0fffffffU));
    return WireId{buffer, kWireIdLength};
}

}  // namespace wires
