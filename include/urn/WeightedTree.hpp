#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <memory>
#include <ostream>
#include <utility>
#include <variant>

#include <tlx/die.hpp>

#include <urn/Types.hpp>

namespace urn {

template <typename T>
class WeightedTree;

template <typename T>
struct TreeUpdate;

template <typename T>
struct TreeReplace;

namespace detail {

template <typename T>
struct LeafNode;

template <typename T>
struct InnerNode;

template <typename T>
struct TreeNode;

} // namespace detail

/**
 * Persistent binary tree whose leaves carry (weight, value) pairs and whose
 * inner nodes carry the total weight of their subtree. Nodes are immutable
 * and shared between versions; every operation that "modifies" a tree
 * returns a new one that reuses all subtrees off the modified path.
 *
 * An index i in [0, weight()) addresses the leaf whose cumulative weight
 * range contains i, counting leaves from left to right.
 */
template <typename T>
class WeightedTree {
public:
    using value_type = T;
    using entry_type = Entry<T>;

    static WeightedTree leaf(weight_t weight, T value) {
        return WeightedTree{std::make_shared<detail::TreeNode<T>>(
            detail::TreeNode<T>{detail::LeafNode<T>{weight, std::move(value)}})};
    }

    static WeightedTree node(WeightedTree left, WeightedTree right) {
        const weight_t weight = left.weight() + right.weight();
        return node_with_weight(weight, std::move(left), std::move(right));
    }

    [[nodiscard]] bool is_leaf() const {
        return std::holds_alternative<detail::LeafNode<T>>(node_->data);
    }

    [[nodiscard]] weight_t weight() const {
        return std::visit([](const auto &n) { return n.weight; }, node_->data);
    }

    const T &value() const {
        tlx_die_verbose_unless(is_leaf(), "value() requested from an inner node");
        return as_leaf().value;
    }

    const WeightedTree &left() const {
        tlx_die_verbose_unless(!is_leaf(), "left() requested from a leaf");
        return as_inner().left;
    }

    const WeightedTree &right() const {
        tlx_die_verbose_unless(!is_leaf(), "right() requested from a leaf");
        return as_inner().right;
    }

    //! Returns a copy of the value of the leaf containing index i; requires i < weight().
    T sample_at(index_t i) const {
        check_index(i);

        const WeightedTree *tree = this;
        while (!tree->is_leaf()) {
            const auto &inner = tree->as_inner();
            const auto wl = inner.left.weight();
            if (i < wl) {
                tree = &inner.left;
            } else {
                i -= wl;
                tree = &inner.right;
            }
        }

        return tree->as_leaf().value;
    }

    /**
     * Replaces the leaf (w, a) containing index i by f(w, a) and returns the
     * old entry, the new entry and the updated tree. f is invoked exactly
     * once and must return something convertible to Entry<T>.
     * Requires i < weight().
     */
    template <typename F>
    TreeUpdate<T> update_at(index_t i, F &&f) const {
        check_index(i);
        return update_unchecked(i, f);
    }

    //! Replaces the leaf containing index i by (weight, value); requires i < weight().
    TreeReplace<T> replace_at(index_t i, weight_t weight, T value) const {
        auto result = update_at(i, [&](weight_t, const T &) {
            return entry_type{weight, std::move(value)};
        });
        return {std::move(result.old_entry), std::move(result.tree)};
    }

    // Introspection used to verify the weight and shape invariants.

    [[nodiscard]] std::size_t leaf_count() const {
        if (is_leaf())
            return 1;
        return left().leaf_count() + right().leaf_count();
    }

    [[nodiscard]] weight_t sum_leaf_weights() const {
        if (is_leaf())
            return weight();
        return left().sum_leaf_weights() + right().sum_leaf_weights();
    }

    [[nodiscard]] bool weights_match() const {
        if (is_leaf())
            return true;
        return weight() == left().sum_leaf_weights() + right().sum_leaf_weights()
               && left().weights_match() && right().weights_match();
    }

    [[nodiscard]] unsigned min_leaf_depth() const {
        if (is_leaf())
            return 0;
        return 1 + std::min(left().min_leaf_depth(), right().min_leaf_depth());
    }

    [[nodiscard]] unsigned max_leaf_depth() const {
        if (is_leaf())
            return 0;
        return 1 + std::max(left().max_leaf_depth(), right().max_leaf_depth());
    }

    //! Calls cb(weight, value) for every leaf from left to right.
    template <typename Callback>
    void for_each_leaf(Callback &&cb) const {
        if (is_leaf()) {
            const auto &leaf = as_leaf();
            cb(leaf.weight, leaf.value);
            return;
        }

        left().for_each_leaf(cb);
        right().for_each_leaf(cb);
    }

    //! Structural equality: same shape, weights and values.
    bool operator==(const WeightedTree &o) const {
        if (node_ == o.node_)
            return true;

        if (is_leaf() != o.is_leaf() || weight() != o.weight())
            return false;

        if (is_leaf())
            return as_leaf().value == o.as_leaf().value;

        return left() == o.left() && right() == o.right();
    }

private:
    std::shared_ptr<const detail::TreeNode<T>> node_;

    explicit WeightedTree(std::shared_ptr<const detail::TreeNode<T>> node)
        : node_(std::move(node)) {
        assert(node_);
    }

    static WeightedTree node_with_weight(weight_t weight, WeightedTree left, WeightedTree right) {
        assert(weight == static_cast<weight_t>(left.weight() + right.weight()));
        return WeightedTree{std::make_shared<detail::TreeNode<T>>(
            detail::TreeNode<T>{detail::InnerNode<T>{weight, std::move(left), std::move(right)}})};
    }

    const detail::LeafNode<T> &as_leaf() const {
        assert(is_leaf());
        return *std::get_if<detail::LeafNode<T>>(&node_->data);
    }

    const detail::InnerNode<T> &as_inner() const {
        assert(!is_leaf());
        return *std::get_if<detail::InnerNode<T>>(&node_->data);
    }

    void check_index(index_t i) const {
        tlx_die_verbose_unless(i < weight(),
                               "index " << i << " outside of [0, " << weight() << ")");
    }

    template <typename F>
    TreeUpdate<T> update_unchecked(index_t i, F &f) const {
        if (is_leaf()) {
            const auto &leaf = as_leaf();
            entry_type old_entry{leaf.weight, leaf.value};
            entry_type new_entry = f(leaf.weight, leaf.value);
            auto tree = WeightedTree::leaf(new_entry.weight, new_entry.value);
            return {std::move(old_entry), std::move(new_entry), std::move(tree)};
        }

        const auto &inner = as_inner();
        const auto wl = inner.left.weight();
        const bool go_right = (i >= wl);

        auto result = go_right ? inner.right.update_unchecked(i - wl, f)
                               : inner.left.update_unchecked(i, f);

        const weight_t weight = inner.weight - result.old_entry.weight + result.new_entry.weight;
        if (go_right) {
            result.tree = node_with_weight(weight, inner.left, std::move(result.tree));
        } else {
            result.tree = node_with_weight(weight, std::move(result.tree), inner.right);
        }

        return result;
    }
};

template <typename T>
struct TreeUpdate {
    Entry<T> old_entry;
    Entry<T> new_entry;
    WeightedTree<T> tree;
};

template <typename T>
struct TreeReplace {
    Entry<T> old_entry;
    WeightedTree<T> tree;
};

namespace detail {

template <typename T>
struct LeafNode {
    weight_t weight;
    T value;
};

template <typename T>
struct InnerNode {
    weight_t weight;
    WeightedTree<T> left;
    WeightedTree<T> right;
};

template <typename T>
struct TreeNode {
    std::variant<LeafNode<T>, InnerNode<T>> data;
};

} // namespace detail

template <typename T>
std::ostream &operator<<(std::ostream &os, const WeightedTree<T> &tree) {
    if (tree.is_leaf())
        return os << "[" << tree.weight() << ":" << tree.value() << "]";

    return os << "(" << tree.weight() << " " << tree.left() << " " << tree.right() << ")";
}

} // namespace urn
