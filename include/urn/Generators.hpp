#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include <urn/Types.hpp>

namespace urn {

//! n weights drawn uniformly from [1, max_weight].
std::vector<weight_t> generate_weights(std::size_t n, weight_t max_weight, std::mt19937_64 &gen);

//! n entries with weights from generate_weights and values 0, 1, ..., n-1.
std::vector<Entry<std::uint32_t>> generate_weighted_entries(std::size_t n, weight_t max_weight,
                                                            std::mt19937_64 &gen);

}
