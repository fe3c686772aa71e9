#include <iostream>

#include <cstdint>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <tlx/cmdline_parser.hpp>

#include <urn/Generators.hpp>
#include <urn/RandomnessPort.hpp>
#include <urn/ScopedTimer.hpp>
#include <urn/Urn.hpp>

using namespace urn;

using BenchUrn = Urn<std::uint32_t>;

struct Config {
    size_t size = 1 << 20;
    unsigned max_weight = 1000;
    size_t ops = 1 << 20;
    size_t repeats = 3;
    size_t seed = 0;
    bool verbose = false;
};

BenchUrn build_urns(const std::vector<Entry<std::uint32_t>> &elems, const Config &c) {
    std::optional<BenchUrn> bulk;
    double bulk_time;
    {
        ScopedTimer timer;
        bulk = BenchUrn::from_list(elems);
        bulk_time = timer.elapsedSeconds();
    }

    std::optional<BenchUrn> naive;
    double naive_time;
    {
        ScopedTimer timer;
        naive = BenchUrn::from_list_naive(elems);
        naive_time = timer.elapsedSeconds();
    }

    if (!bulk || !naive)
        throw std::runtime_error("Cannot build an urn without elements");

    if (bulk->size() != naive->size() || bulk->weight() != naive->weight())
        throw std::runtime_error("Bulk and naive construction disagree");

    std::cout << "from_list: " << bulk_time << "s\n";
    std::cout << "from_list_naive: " << naive_time << "s\n";
    if (c.verbose) {
        std::cout << "size: " << bulk->size() << "\n"
                  << "weight: " << bulk->weight() << "\n"
                  << "depth: " << bulk->tree().min_leaf_depth() << ".." << bulk->tree().max_leaf_depth() << "\n";
    }

    return *bulk;
}

template <typename Op>
void run_ops(std::string_view label, const Config &c, Op &&op) {
    ScopedTimer timer;
    for (size_t i = 0; i < c.ops; ++i)
        op();
    const double time = timer.elapsedSeconds();

    std::cout << label << ": " << c.ops / time * 1e-6 << "M ops/s\n";
    if (c.verbose)
        std::cout << label << ": runtime " << time << "s\n";
}

void run_benchmark(const Config &c, std::mt19937_64 &gen) {
    auto port = make_port(gen);
    const auto elems = generate_weighted_entries(c.size, c.max_weight, gen);
    auto urn = build_urns(elems, c);

    std::uniform_int_distribution<weight_t> weight_distr{1, c.max_weight};

    std::uint64_t checksum = 0;
    run_ops("sample", c, [&] { checksum += urn.sample(port); });

    run_ops("replace", c, [&] {
        auto [old_entry, replaced] = urn.replace(port, weight_distr(gen), static_cast<std::uint32_t>(checksum));
        checksum += old_entry.value;
        urn = std::move(replaced);
    });

    run_ops("update", c, [&] {
        auto result = urn.update(port, [&](weight_t, std::uint32_t v) {
            return Entry<std::uint32_t>{weight_distr(gen), v};
        });
        urn = std::move(result.urn);
    });

    run_ops("insert+remove", c, [&] {
        auto [removed, rest] = urn.insert(weight_distr(gen), 0).remove(port);
        checksum += removed.value;
        urn = std::move(*rest);
    });

    if (urn.size() != c.size)
        throw std::runtime_error("Urn size changed during the benchmark");

    if (c.verbose)
        std::cout << "checksum: " << checksum << "\n";
}

int main(int argc, char *argv[]) {
    tlx::CmdlineParser cp;
    cp.set_description("Benchmark for the weighted urn");

    Config c;
    cp.add_size_t('n', "size", c.size, "Number of elements in the urn");
    cp.add_unsigned("max-weight", c.max_weight, "Weights are drawn from [1, max-weight]");
    cp.add_size_t("ops", c.ops, "Randomized operations per measurement");
    cp.add_size_t("repeats", c.repeats, "Repeats");
    cp.add_size_t("seed", c.seed, "Seed of the random generator");
    cp.add_flag('v', "verbose", c.verbose, "Report details of every phase");

    if (!cp.process(argc, argv)) {
        return -1;
    }

    if (!c.size || !c.max_weight) {
        std::cerr << "size and max-weight must be positive" << std::endl;
        return -1;
    }

    std::cout << "Starting experiment with parameters\n"
              << "n=" << c.size << "\n"
              << "max-weight=" << c.max_weight << "\n"
              << "ops=" << c.ops << "\n"
              << "repeats=" << c.repeats << "\n"
              << "seed=" << c.seed << "\n" << std::endl;

    std::mt19937_64 gen{c.seed};
    for (size_t repeat = 0; repeat < c.repeats; ++repeat) {
        ScopedTimer timer(c.verbose ? "repeat " + std::to_string(repeat) : std::string{});
        run_benchmark(c, gen);
        std::cout << std::endl;
    }

    return 0;
}
