#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <utility>

#include <tlx/die.hpp>
#include <tlx/math.hpp>

#include <urn/Types.hpp>
#include <urn/WeightedTree.hpp>

namespace urn {

/**
 * Builds an almost perfect WeightedTree from a sequence of Entry<T> in a
 * single left-to-right pass.
 *
 * With n elements and d = floor(log2(n)), the builder lays out a perfect
 * tree of depth d and visits its 2^d bottom slots in order. Slot p receives
 * two consecutive elements (one extra level) iff reverse_bits(d, p) is
 * smaller than n - 2^d, and a single element otherwise. The bit reversal
 * places the doubled slots exactly where repeated Urn::insert would grow the
 * tree, so the result has the same shape as inserting the elements one by
 * one and all leaf depths differ by at most one.
 *
 * The leaves keep the input order from left to right.
 */
template <typename T, typename Iterator>
class BalancedConstructor {
public:
    using tree_type = WeightedTree<T>;

    BalancedConstructor(Iterator first, Iterator last, std::size_t expected_size)
        : it_(first),
          end_(last),
          expected_size_(checked_size(expected_size)),
          perfect_depth_(tlx::integer_log2_floor(expected_size_)),
          remainder_(expected_size_ - (std::size_t(1) << perfect_depth_)) {}

    //! Consumes exactly expected_size elements; dies if the input is shorter or longer.
    tree_type build() {
        auto tree = build_subtree(perfect_depth_);

        tlx_die_verbose_unless(it_ == end_,
                               "expected " << expected_size_ << " elements but input is longer");
        assert(consumed_ == expected_size_);

        return tree;
    }

private:
    Iterator it_;
    Iterator end_;

    const std::size_t expected_size_;
    const unsigned perfect_depth_;
    const std::size_t remainder_;

    std::uint64_t position_{0};
    std::size_t consumed_{0};

    static std::size_t checked_size(std::size_t size) {
        tlx_die_verbose_unless(size > 0, "cannot build a tree without elements");
        return size;
    }

    tree_type build_subtree(unsigned depth) {
        if (depth) {
            auto left = build_subtree(depth - 1);
            auto right = build_subtree(depth - 1);
            return tree_type::node(std::move(left), std::move(right));
        }

        const bool doubled = reverse_bits(perfect_depth_, position_++) < remainder_;

        auto first = next_leaf();
        if (!doubled)
            return first;

        auto second = next_leaf();
        return tree_type::node(std::move(first), std::move(second));
    }

    tree_type next_leaf() {
        tlx_die_verbose_unless(it_ != end_,
                               "expected " << expected_size_ << " elements but input ended after "
                                           << consumed_);

        auto leaf = tree_type::leaf(it_->weight, it_->value);
        ++it_;
        ++consumed_;
        return leaf;
    }
};

template <typename T, typename Iterator>
WeightedTree<T> build_almost_perfect(Iterator first, Iterator last, std::size_t expected_size) {
    return BalancedConstructor<T, Iterator>(first, last, expected_size).build();
}

template <typename T, std::forward_iterator Iterator>
WeightedTree<T> build_almost_perfect(Iterator first, Iterator last) {
    const auto size = static_cast<std::size_t>(std::distance(first, last));
    return build_almost_perfect<T>(first, last, size);
}

} // namespace urn
