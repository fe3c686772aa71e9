#pragma once

#include <cassert>
#include <random>

#include <urn/Types.hpp>

namespace urn {

/**
 * Source of uniform weights for the randomized urn operations.
 *
 * Any type with a member `weight_t draw_uniform(weight_t low, weight_t high)`
 * returning a value in [low, high] (both inclusive) can be passed to
 * Urn::sample, Urn::update, Urn::replace and Urn::remove. GeneratorPort adapts
 * a standard uniform random bit generator.
 */
template <typename Gen>
class GeneratorPort {
public:
    using generator_type = Gen;

    explicit GeneratorPort(Gen &gen) : gen_(gen) {}

    weight_t draw_uniform(weight_t low, weight_t high_inclusive) {
        assert(low <= high_inclusive);
        return std::uniform_int_distribution<weight_t>{low, high_inclusive}(gen_);
    }

private:
    Gen &gen_;
};

template <typename Gen>
GeneratorPort<Gen> make_port(Gen &gen) {
    return GeneratorPort<Gen>{gen};
}

} // namespace urn
