#pragma once

#include <cstdint>
#include <ostream>

namespace urn {

// Weights wrap modulo 2^32 in every operation.
using weight_t = std::uint32_t;
using index_t = weight_t;

template <typename T>
struct Entry {
    weight_t weight;
    T value;

    bool operator==(const Entry &) const = default;
};

template <typename T>
inline std::ostream &operator<<(std::ostream &os, const Entry<T> &e) {
    return os << "[" << e.weight << ":" << e.value << "]";
}

constexpr inline bool test_bit(std::uint64_t input, unsigned n) {
    return (input >> n) & 1;
}

// Reverses the lowest `bits` bits of `x`; higher bits of `x` are ignored.
constexpr inline std::uint64_t reverse_bits(unsigned bits, std::uint64_t x) {
    std::uint64_t result = 0;
    for (; bits; --bits, x >>= 1)
        result = (result << 1) | (x & 1);
    return result;
}

}
