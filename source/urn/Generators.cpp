#include <urn/Generators.hpp>

#include <algorithm>

#include <range/v3/all.hpp>
#include <tlx/die.hpp>

namespace urn {

std::vector<weight_t> generate_weights(std::size_t n, weight_t max_weight, std::mt19937_64 &gen) {
    tlx_die_verbose_unless(max_weight > 0, "weights are drawn from [1, max_weight]");

    std::uniform_int_distribution<weight_t> distr{1, max_weight};
    std::vector<weight_t> weights(n);
    std::generate(weights.begin(), weights.end(), [&] { return distr(gen); });
    return weights;
}

std::vector<Entry<std::uint32_t>> generate_weighted_entries(std::size_t n, weight_t max_weight,
                                                            std::mt19937_64 &gen) {
    const auto weights = generate_weights(n, max_weight, gen);

    return ranges::views::enumerate(weights) //
           | ranges::views::transform([](auto p) {
               auto [i, w] = p;
               return Entry<std::uint32_t>{w, static_cast<std::uint32_t>(i)};
           }) //
           | ranges::to<std::vector>;
}

}
