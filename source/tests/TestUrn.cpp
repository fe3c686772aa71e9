#include <algorithm>
#include <cstdint>
#include <istream>
#include <iterator>
#include <optional>
#include <random>
#include <tuple>
#include <vector>

#include <range/v3/all.hpp>
#include <tlx/die.hpp>

#include <urn/Generators.hpp>
#include <urn/Urn.hpp>

using namespace urn;

using CharUrn = Urn<char>;
using IntUrn = Urn<std::uint32_t>;

template <typename T>
bool same_shape(const WeightedTree<T> &a, const WeightedTree<T> &b) {
    if (a.is_leaf() || b.is_leaf())
        return a.is_leaf() && b.is_leaf();
    return same_shape(a.left(), b.left()) && same_shape(a.right(), b.right());
}

template <typename T>
std::vector<Entry<T>> sorted(std::vector<Entry<T>> entries) {
    std::sort(entries.begin(), entries.end(), [](const auto &a, const auto &b) {
        return std::tie(a.weight, a.value) < std::tie(b.weight, b.value);
    });
    return entries;
}

template <typename T>
void check_well_formed(const Urn<T> &urn) {
    die_unequal(urn.tree().leaf_count(), urn.size());
    die_unless(urn.tree().weights_match());
    die_unless(urn.tree().max_leaf_depth() - urn.tree().min_leaf_depth() <= 1);
}

void test_singleton() {
    const auto urn = CharUrn::singleton(4, 'a');
    die_unequal(urn.size(), 1u);
    die_unequal(urn.weight(), 4u);
    for (index_t i = 0; i < 4; ++i)
        die_unequal(urn.sample_at(i), 'a');

    const auto [removed, lower_bound, rest] = urn.uninsert();
    die_unless(removed == (Entry<char>{4, 'a'}));
    die_unequal(lower_bound, 0u);
    die_if(rest.has_value());

    const auto [target, none] = urn.remove_at(3);
    die_unless(target == (Entry<char>{4, 'a'}));
    die_if(none.has_value());
}

void test_insert() {
    auto urn = CharUrn::singleton(2, 'a');
    const auto first = urn;

    urn = urn.insert(3, 'b');
    die_unequal(urn.size(), 2u);
    die_unequal(urn.weight(), 5u);
    check_well_formed(urn);

    urn = urn.insert(4, 'c');
    urn = urn.insert(1, 'd');
    die_unequal(urn.size(), 4u);
    die_unequal(urn.weight(), 10u);
    check_well_formed(urn);

    // c splits the leaf of a, d splits the leaf of b
    const std::vector<Entry<char>> expected{{2, 'a'}, {4, 'c'}, {3, 'b'}, {1, 'd'}};
    die_unless(urn.entries() == expected);

    // older versions stay valid
    die_unequal(first.size(), 1u);
    die_unequal(first.weight(), 2u);
}

void test_insert_uninsert_inverse() {
    std::mt19937_64 gen{2};

    for (std::size_t n = 1; n <= 100; ++n) {
        const auto elems = generate_weighted_entries(n, 50, gen);
        for (const auto &urn : {*IntUrn::from_list(elems), *IntUrn::from_list_naive(elems)}) {
            const auto inserted = urn.insert(17, 4711);
            die_unequal(inserted.size(), n + 1);
            die_unequal(inserted.weight(), urn.weight() + 17);
            check_well_formed(inserted);

            // lower bound is the weight left of the new element
            const auto entries = inserted.entries();
            const auto pos = std::find(entries.begin(), entries.end(), Entry<std::uint32_t>{17, 4711});
            die_unless(pos != entries.end());
            const auto weight_left = ranges::accumulate(
                ranges::make_subrange(entries.begin(), pos)
                    | ranges::views::transform([](const auto &e) { return e.weight; }),
                weight_t{0});

            const auto [removed, lower_bound, rest] = inserted.uninsert();
            die_unless(removed == (Entry<std::uint32_t>{17, 4711}));
            die_unequal(lower_bound, weight_left);
            die_unless(rest.has_value());
            die_unless(*rest == urn);
        }
    }
}

void test_uninsert_reverses_insertion_order() {
    std::mt19937_64 gen{3};
    const auto elems = generate_weighted_entries(77, 20, gen);

    std::optional<IntUrn> urn = IntUrn::from_list_naive(elems);
    for (auto it = elems.rbegin(); it != elems.rend(); ++it) {
        die_unless(urn.has_value());
        const auto expected_size = urn->size() - 1;

        auto [removed, lower_bound, rest] = urn->uninsert();
        die_unless(removed == *it);
        if (rest) {
            die_unequal(rest->size(), expected_size);
            check_well_formed(*rest);
        }
        urn = std::move(rest);
    }
    die_if(urn.has_value());
}

void test_remove_at_branches() {
    // entries a[0,2) c[2,6) b[6,9); c was inserted last, its bucket starts at 2
    const auto urn = *CharUrn::from_list_naive({{2, 'a'}, {3, 'b'}, {4, 'c'}});
    die_unless(urn.entries() == (std::vector<Entry<char>>{{2, 'a'}, {4, 'c'}, {3, 'b'}}));

    {   // index left of the detached bucket: c takes the target's place
        const auto [removed, rest] = urn.remove_at(1);
        die_unless(removed == (Entry<char>{2, 'a'}));
        die_unless(rest.has_value());
        die_unless(rest->entries() == (std::vector<Entry<char>>{{4, 'c'}, {3, 'b'}}));
        check_well_formed(*rest);
    }

    {   // index inside the detached bucket
        for (index_t i = 2; i < 6; ++i) {
            const auto [removed, rest] = urn.remove_at(i);
            die_unless(removed == (Entry<char>{4, 'c'}));
            die_unless(rest.has_value());
            die_unless(*rest == *CharUrn::from_list_naive({{2, 'a'}, {3, 'b'}}));
        }
    }

    {   // index right of the detached bucket is shifted by its weight
        const auto [removed, rest] = urn.remove_at(7);
        die_unless(removed == (Entry<char>{3, 'b'}));
        die_unless(rest.has_value());
        die_unless(rest->entries() == (std::vector<Entry<char>>{{2, 'a'}, {4, 'c'}}));
        check_well_formed(*rest);
    }
}

void test_remove_at_every_index() {
    std::mt19937_64 gen{4};

    for (std::size_t n = 1; n <= 40; ++n) {
        const auto elems = generate_weighted_entries(n, 8, gen);
        const auto urn = *IntUrn::from_list(elems);
        const auto before = sorted(urn.entries());

        for (index_t i = 0; i < urn.weight(); ++i) {
            const auto [removed, rest] = urn.remove_at(i);
            die_unequal(removed.value, urn.sample_at(i));
            die_unless(rest.has_value() == (n > 1));
            if (!rest)
                continue;

            die_unequal(rest->size(), n - 1);
            die_unequal(rest->weight(), urn.weight() - removed.weight);
            check_well_formed(*rest);

            auto after = rest->entries();
            after.push_back(removed);
            die_unless(sorted(after) == before);
        }
    }
}

void test_from_list_matches_naive() {
    std::mt19937_64 gen{5};

    for (std::size_t n = 1; n <= 200; ++n) {
        const auto elems = generate_weighted_entries(n, 1 + n % 17, gen);
        const auto bulk = IntUrn::from_list(elems);
        const auto naive = IntUrn::from_list_naive(elems);
        die_unless(bulk.has_value() && naive.has_value());

        die_unequal(bulk->size(), naive->size());
        die_unequal(bulk->weight(), naive->weight());
        die_unless(same_shape(bulk->tree(), naive->tree()));
        die_unless(sorted(bulk->entries()) == sorted(naive->entries()));
        check_well_formed(*bulk);
        check_well_formed(*naive);
    }

    const std::vector<Entry<char>> rgb{{2, 'R'}, {4, 'G'}, {3, 'B'}};
    const auto bulk = CharUrn::from_list(rgb);
    const auto naive = CharUrn::from_list_naive(rgb);
    die_unequal(bulk->size(), 3u);
    die_unequal(bulk->weight(), 9u);
    die_unequal(naive->size(), 3u);
    die_unequal(naive->weight(), 9u);
}

void test_empty_input() {
    const std::vector<Entry<char>> none;
    die_if(CharUrn::from_list(none).has_value());
    die_if(CharUrn::from_list_naive(none).has_value());
    die_if(CharUrn::from_list(none.begin(), none.end()).has_value());
}

template <typename Iterator>
concept BuildsFromIterators = requires(Iterator it) { CharUrn::from_list(it, it); };

void test_from_list_iterator_requirements() {
    // from_list measures the input before consuming it; single-pass input does not compile
    static_assert(BuildsFromIterators<std::vector<Entry<char>>::const_iterator>);
    static_assert(!BuildsFromIterators<std::istream_iterator<Entry<char>>>);

    const std::vector<Entry<char>> elems{{1, 'a'}, {2, 'b'}, {3, 'c'}};
    die_unequal(CharUrn::from_list(elems.cbegin(), elems.cend())->size(), 3u);
    die_unequal(CharUrn::from_list_naive(elems.cbegin(), elems.cend())->weight(), 6u);
}

void test_update_and_replace_keep_size() {
    std::mt19937_64 gen{6};
    const auto urn = *IntUrn::from_list(generate_weighted_entries(33, 9, gen));

    const auto [old_entry, new_entry, updated] = urn.update_at(10, [](weight_t w, std::uint32_t v) {
        return Entry<std::uint32_t>{w + 5, v + 1000};
    });
    die_unequal(updated.size(), urn.size());
    die_unequal(updated.weight(), urn.weight() + 5);
    die_unequal(new_entry.weight, old_entry.weight + 5);
    die_unequal(new_entry.value, old_entry.value + 1000);
    check_well_formed(updated);

    const auto [replaced, with_replacement] = urn.replace_at(urn.weight() - 1, 1, 99999);
    die_unequal(with_replacement.size(), urn.size());
    die_unequal(with_replacement.weight(), urn.weight() - replaced.weight + 1);
    die_unequal(with_replacement.sample_at(with_replacement.weight() - 1), 99999u);
    check_well_formed(with_replacement);
}

void test_preconditions() {
    tlx::set_die_with_exception(true);

    const auto urn = *CharUrn::from_list_naive({{2, 'a'}, {3, 'b'}, {4, 'c'}});
    die_unless_throws(urn.sample_at(9), tlx::DieException);
    die_unless_throws(urn.remove_at(9), tlx::DieException);
    die_unless_throws(urn.replace_at(9, 1, 'x'), tlx::DieException);
    die_unless_throws(CharUrn::singleton(0, 'z').remove_at(0), tlx::DieException);

    tlx::set_die_with_exception(false);
}

int main() {
    test_singleton();
    test_insert();
    test_insert_uninsert_inverse();
    test_uninsert_reverses_insertion_order();
    test_remove_at_branches();
    test_remove_at_every_index();
    test_from_list_matches_naive();
    test_empty_input();
    test_from_list_iterator_requirements();
    test_update_and_replace_keep_size();
    test_preconditions();

    return 0;
}
