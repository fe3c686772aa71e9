#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>

#include <tlx/die.hpp>

#include <urn/BalancedConstructor.hpp>
#include <urn/Types.hpp>
#include <urn/WeightedTree.hpp>

namespace urn {

template <typename T>
class Urn;

template <typename T>
struct UrnUpdate;

template <typename T>
struct UrnReplace;

template <typename T>
struct UrnUninsert;

template <typename T>
struct UrnRemove;

/**
 * Weighted multiset supporting sampling proportional to weight, insertion,
 * removal and replacement in time logarithmic in the number of elements.
 *
 * An urn holds at least one element; operations that remove the last element
 * return std::nullopt instead of an empty urn. Urns are values: every
 * operation is const and returns a successor that shares all untouched
 * subtrees with its input.
 *
 * The tree shape depends only on size(). insert() descends along the binary
 * representation of the current size, least significant bit first (0 = left,
 * 1 = right), and splits the leaf it reaches. Successive insertions thereby
 * alternate between the subtrees at every level, which keeps all leaf depths
 * within one of each other.
 */
template <typename T>
class Urn {
public:
    using value_type = T;
    using entry_type = Entry<T>;
    using tree_type = WeightedTree<T>;

    static Urn singleton(weight_t weight, T value) {
        return Urn{1, tree_type::leaf(weight, std::move(value))};
    }

    //! Builds an almost perfect tree in linear time; returns nullopt for empty input.
    //! The range is traversed twice, hence the forward iterator requirement.
    template <std::forward_iterator Iterator>
    static std::optional<Urn> from_list(Iterator first, Iterator last) {
        const auto size = static_cast<std::size_t>(std::distance(first, last));
        if (!size)
            return std::nullopt;

        return Urn{size, build_almost_perfect<T>(first, last, size)};
    }

    static std::optional<Urn> from_list(const std::vector<entry_type> &elems) {
        return from_list(elems.begin(), elems.end());
    }

    //! Reference construction by repeated insert(); O(n log n).
    template <typename Iterator>
    static std::optional<Urn> from_list_naive(Iterator first, Iterator last) {
        if (first == last)
            return std::nullopt;

        auto urn = singleton(first->weight, first->value);
        for (++first; first != last; ++first)
            urn = urn.insert(first->weight, first->value);

        return urn;
    }

    static std::optional<Urn> from_list_naive(const std::vector<entry_type> &elems) {
        return from_list_naive(elems.begin(), elems.end());
    }

    [[nodiscard]] std::size_t size() const { return size_; }
    [[nodiscard]] weight_t weight() const { return tree_.weight(); }
    [[nodiscard]] const tree_type &tree() const { return tree_; }

    //! Elements from left to right in the underlying tree.
    [[nodiscard]] std::vector<entry_type> entries() const {
        std::vector<entry_type> result;
        result.reserve(size_);
        tree_.for_each_leaf([&](weight_t w, const T &value) {
            result.push_back(entry_type{w, value});
        });
        return result;
    }

    // Deterministic operations; the index i must lie in [0, weight()).

    T sample_at(index_t i) const { return tree_.sample_at(i); }

    template <typename F>
    UrnUpdate<T> update_at(index_t i, F &&f) const {
        auto result = tree_.update_at(i, std::forward<F>(f));
        return {std::move(result.old_entry), std::move(result.new_entry),
                Urn{size_, std::move(result.tree)}};
    }

    UrnReplace<T> replace_at(index_t i, weight_t weight, T value) const {
        auto result = tree_.replace_at(i, weight, std::move(value));
        return {std::move(result.old_entry), Urn{size_, std::move(result.tree)}};
    }

    Urn insert(weight_t weight, T value) const {
        return Urn{size_ + 1, insert_along(tree_, size_, entry_type{weight, std::move(value)})};
    }

    /**
     * Removes the element the most recent insert() would have added, i.e. the
     * leaf reached by the path of size() - 1. Returns that element, the sum
     * of the weights to its left and the remaining urn (nullopt if this urn
     * is a singleton).
     */
    UrnUninsert<T> uninsert() const {
        auto detached = uninsert_along(tree_, size_ - 1);

        std::optional<Urn> rest;
        if (detached.rest)
            rest.emplace(Urn{size_ - 1, std::move(*detached.rest)});

        return {std::move(detached.removed), detached.lower_bound, std::move(rest)};
    }

    /**
     * Removes the element containing index i. The most recently inserted
     * element is detached with uninsert() and, unless it is the target
     * itself, written over the target's leaf, so the shape changes only
     * along the uninsert path.
     */
    UrnRemove<T> remove_at(index_t i) const {
        tlx_die_verbose_unless(i < weight(),
                               "index " << i << " outside of [0, " << weight() << ")");

        auto [last, lower_bound, rest] = uninsert();
        if (!rest)
            return {std::move(last), std::nullopt};

        if (i < lower_bound) {
            auto [target, successor] = rest->replace_at(i, last.weight, std::move(last.value));
            return {std::move(target), std::move(successor)};
        }

        if (i - lower_bound < last.weight)
            return {std::move(last), std::move(rest)};

        auto [target, successor] = rest->replace_at(i - last.weight, last.weight, std::move(last.value));
        return {std::move(target), std::move(successor)};
    }

    // Randomized operations; each draws one index from [0, weight()) via the port.

    template <typename Port>
    T sample(Port &port) const {
        return sample_at(draw_index(port));
    }

    template <typename Port, typename F>
    UrnUpdate<T> update(Port &port, F &&f) const {
        return update_at(draw_index(port), std::forward<F>(f));
    }

    template <typename Port>
    UrnReplace<T> replace(Port &port, weight_t weight, T value) const {
        return replace_at(draw_index(port), weight, std::move(value));
    }

    template <typename Port>
    UrnRemove<T> remove(Port &port) const {
        return remove_at(draw_index(port));
    }

    bool operator==(const Urn &o) const {
        return size_ == o.size_ && tree_ == o.tree_;
    }

private:
    std::size_t size_;
    tree_type tree_;

    Urn(std::size_t size, tree_type tree) : size_(size), tree_(std::move(tree)) {}

    struct Detached {
        entry_type removed;
        weight_t lower_bound;
        std::optional<tree_type> rest;
    };

    template <typename Port>
    index_t draw_index(Port &port) const {
        tlx_die_verbose_unless(weight() > 0, "cannot draw from an urn of total weight 0");
        return port.draw_uniform(0, weight() - 1);
    }

    static tree_type insert_along(const tree_type &tree, std::uint64_t path, entry_type &&entry) {
        if (tree.is_leaf())
            return tree_type::node(tree, tree_type::leaf(entry.weight, std::move(entry.value)));

        if (test_bit(path, 0))
            return tree_type::node(tree.left(), insert_along(tree.right(), path >> 1, std::move(entry)));

        return tree_type::node(insert_along(tree.left(), path >> 1, std::move(entry)), tree.right());
    }

    static Detached uninsert_along(const tree_type &tree, std::uint64_t path) {
        if (tree.is_leaf())
            return {entry_type{tree.weight(), tree.value()}, 0, std::nullopt};

        if (test_bit(path, 0)) {
            auto detached = uninsert_along(tree.right(), path >> 1);
            detached.lower_bound += tree.left().weight();
            detached.rest = detached.rest ? tree_type::node(tree.left(), std::move(*detached.rest))
                                          : tree.left();
            return detached;
        }

        auto detached = uninsert_along(tree.left(), path >> 1);
        detached.rest = detached.rest ? tree_type::node(std::move(*detached.rest), tree.right())
                                      : tree.right();
        return detached;
    }
};

template <typename T>
struct UrnUpdate {
    Entry<T> old_entry;
    Entry<T> new_entry;
    Urn<T> urn;
};

template <typename T>
struct UrnReplace {
    Entry<T> old_entry;
    Urn<T> urn;
};

template <typename T>
struct UrnUninsert {
    Entry<T> removed;
    weight_t lower_bound;
    std::optional<Urn<T>> urn;
};

template <typename T>
struct UrnRemove {
    Entry<T> removed;
    std::optional<Urn<T>> urn;
};

template <typename T>
std::ostream &operator<<(std::ostream &os, const Urn<T> &urn) {
    return os << "urn{size=" << urn.size() << ", " << urn.tree() << "}";
}

} // namespace urn
