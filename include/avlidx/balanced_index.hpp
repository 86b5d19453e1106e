#pragma once
#include <algorithm>  // `std::max`
#include <cstdlib>    // `std::abs`
#include <functional> // `std::less`
#include <iterator>   // `std::forward_iterator_tag`
#include <memory>     // `std::unique_ptr`
#include <new>        // `std::nothrow`
#include <optional>   // `std::optional`
#include <string>     // `std::string`
#include <utility>    // `std::exchange`
#include <vector>     // `std::vector`

#include "status.hpp"

namespace unum::avlidx {

template <typename identifier_at, typename value_at>
struct entry_gt {
    identifier_at key;
    value_at value;
};

/**
 * @brief AVL-Trees are some of the simplest yet performant Binary Search Trees.
 * This "node" class implements the primary logic, while the `balanced_index_gt`
 * owns the root and the counters.
 *
 * > Every node exclusively owns both of its subtrees, there are no parent links.
 * > Every mutating method takes the subtree by value and returns its new root,
 *   so the caller always re-attaches the result.
 * > Rotations are counted in an external counter, passed by reference.
 *
 * @tparam identifier_at    Type of the keys, unique within a tree.
 * @tparam value_at         Type of the payload attached to every key.
 * @tparam comparator_at    A comparator function object, that overloads
 *                          @code
 *                              bool operator ()(identifier_at, identifier_at) const
 *                          @endcode
 */
template <typename identifier_at, typename value_at, typename comparator_at>
class avl_node_gt {
  public:
    using identifier_t = identifier_at;
    using value_t = value_at;
    using comparator_t = comparator_at;
    using entry_t = entry_gt<identifier_t, value_t>;
    using height_t = std::int16_t;
    using node_t = avl_node_gt;
    using node_ptr_t = std::unique_ptr<node_t>;
    using rotations_t = std::size_t;

    entry_t entry;
    node_ptr_t left;
    node_ptr_t right;
    /**
     * @brief Root has the biggest `height` in the tree.
     * A freshly created leaf has the height of one, while a missing
     * child contributes zero.
     */
    height_t height = 1;

    avl_node_gt(identifier_t&& key, value_t&& value) noexcept : entry {std::move(key), std::move(value)} {}

    static height_t get_height(node_t const* node) noexcept { return node ? node->height : 0; }
    static height_t get_balance(node_t const* node) noexcept {
        return node ? get_height(node->left.get()) - get_height(node->right.get()) : 0;
    }
    static void update_height(node_t* node) noexcept {
        node->height = 1 + std::max(get_height(node->left.get()), get_height(node->right.get()));
    }

#pragma mark - Search

    template <typename callback_at>
    static void for_each_top_down(node_t const* node, callback_at&& callback) {
        if (!node)
            return;
        callback(node);
        for_each_top_down(node->left.get(), callback);
        for_each_top_down(node->right.get(), callback);
    }

    template <typename callback_at>
    static void for_each_left_right(node_t const* node, callback_at&& callback) {
        if (!node)
            return;
        for_each_left_right(node->left.get(), callback);
        callback(node);
        for_each_left_right(node->right.get(), callback);
    }

    static node_t* find_min(node_t* node) noexcept {
        while (node->left)
            node = node->left.get();
        return node;
    }

    /**
     * @brief Searches for equal entry in this subtree.
     * @param comparable Any key comparable with stored entries.
     * @return NULL if nothing was found.
     */
    template <typename comparable_at>
    static node_t const* find(node_t const* node, comparable_at const& comparable) noexcept {
        auto less = comparator_t {};
        while (node) {
            if (less(comparable, node->entry.key))
                node = node->left.get();
            else if (less(node->entry.key, comparable))
                node = node->right.get();
            else
                break;
        }
        return node;
    }

    /**
     * @brief Recomputes every invariant of the subtree bottom-up.
     * @param lower Exclusive lower bound for all keys in the subtree, or NULL.
     * @param upper Exclusive upper bound for all keys in the subtree, or NULL.
     * @return The recomputed height, or a negative value if anything is off.
     */
    static int check(node_t const* node, identifier_t const* lower, identifier_t const* upper) noexcept {
        if (!node)
            return 0;

        auto less = comparator_t {};
        if (lower && !less(*lower, node->entry.key))
            return -1;
        if (upper && !less(node->entry.key, *upper))
            return -1;

        int left_height = check(node->left.get(), lower, &node->entry.key);
        int right_height = check(node->right.get(), &node->entry.key, upper);
        if (left_height < 0 || right_height < 0)
            return -1;
        if (std::abs(left_height - right_height) > 1)
            return -1;

        int height = 1 + std::max(left_height, right_height);
        return height == node->height ? height : -1;
    }

#pragma mark - Rotations

    static node_ptr_t rotate_right(node_ptr_t z, rotations_t& rotations) noexcept {
        node_ptr_t y = std::move(z->left);

        // Perform rotation
        z->left = std::move(y->right);
        update_height(z.get());
        y->right = std::move(z);
        update_height(y.get());

        ++rotations;
        return y;
    }

    static node_ptr_t rotate_left(node_ptr_t z, rotations_t& rotations) noexcept {
        node_ptr_t y = std::move(z->right);

        // Perform rotation
        z->right = std::move(y->left);
        update_height(z.get());
        y->left = std::move(z);
        update_height(y.get());

        ++rotations;
        return y;
    }

    static node_ptr_t rotate_left_right(node_ptr_t z, rotations_t& rotations) noexcept {
        z->left = rotate_left(std::move(z->left), rotations);
        return rotate_right(std::move(z), rotations);
    }

    static node_ptr_t rotate_right_left(node_ptr_t z, rotations_t& rotations) noexcept {
        z->right = rotate_right(std::move(z->right), rotations);
        return rotate_left(std::move(z), rotations);
    }

#pragma mark - Insertions

    struct find_or_make_result_t {
        node_ptr_t root;
        bool inserted = false;
    };

    template <typename comparable_at>
    static node_ptr_t rebalance_after_insert(node_ptr_t node,
                                             comparable_at const& comparable,
                                             rotations_t& rotations) noexcept {
        // Update height and check if branches aren't balanced
        update_height(node.get());
        auto balance = get_balance(node.get());
        auto less = comparator_t {};

        // Left Left Case
        if (balance > 1 && less(comparable, node->left->entry.key))
            return rotate_right(std::move(node), rotations);

        // Left Right Case
        else if (balance > 1 && less(node->left->entry.key, comparable))
            return rotate_left_right(std::move(node), rotations);

        // Right Right Case
        else if (balance < -1 && less(node->right->entry.key, comparable))
            return rotate_left(std::move(node), rotations);

        // Right Left Case
        else if (balance < -1 && less(comparable, node->right->entry.key))
            return rotate_right_left(std::move(node), rotations);

        else
            return node;
    }

    /**
     * @brief Descends to the position of `fresh` and either attaches it as a new leaf,
     * or, if the key is already present, optionally moves the value over into the old node.
     * In the second case `fresh` stays with the caller and no heights are touched.
     */
    static find_or_make_result_t find_or_make(node_ptr_t node,
                                              node_ptr_t& fresh,
                                              bool overwrite,
                                              rotations_t& rotations) noexcept {
        if (!node)
            return {std::move(fresh), true};

        auto less = comparator_t {};
        identifier_t const& key = fresh->entry.key;
        if (less(key, node->entry.key)) {
            auto downstream = find_or_make(std::move(node->left), fresh, overwrite, rotations);
            node->left = std::move(downstream.root);
            if (downstream.inserted)
                node = rebalance_after_insert(std::move(node), key, rotations);
            return {std::move(node), downstream.inserted};
        }
        else if (less(node->entry.key, key)) {
            auto downstream = find_or_make(std::move(node->right), fresh, overwrite, rotations);
            node->right = std::move(downstream.root);
            if (downstream.inserted)
                node = rebalance_after_insert(std::move(node), key, rotations);
            return {std::move(node), downstream.inserted};
        }
        else {
            // Equal keys are not allowed in BST
            if (overwrite)
                node->entry.value = std::move(fresh->entry.value);
            return {std::move(node), false};
        }
    }

#pragma mark - Removals

    static node_ptr_t rebalance_after_extract(node_ptr_t node, rotations_t& rotations) noexcept {
        update_height(node.get());
        auto balance = get_balance(node.get());

        // Left Left Case
        if (balance > 1 && get_balance(node->left.get()) >= 0)
            return rotate_right(std::move(node), rotations);

        // Left Right Case
        else if (balance > 1 && get_balance(node->left.get()) < 0)
            return rotate_left_right(std::move(node), rotations);

        // Right Right Case
        else if (balance < -1 && get_balance(node->right.get()) <= 0)
            return rotate_left(std::move(node), rotations);

        // Right Left Case
        else if (balance < -1 && get_balance(node->right.get()) > 0)
            return rotate_right_left(std::move(node), rotations);

        else
            return node;
    }

    /**
     * @brief Drops the left-most node of a non-empty subtree.
     * @return The new root of this subtree.
     */
    static node_ptr_t erase_min(node_ptr_t node, rotations_t& rotations) noexcept {
        if (!node->left)
            return std::move(node->right);
        node->left = erase_min(std::move(node->left), rotations);
        return rebalance_after_extract(std::move(node), rotations);
    }

    /**
     * @brief Searches for a matching descendant and drops it.
     * @param comparable Any key comparable with stored entries.
     * @param erased Set to true, if the entry was found.
     * @return The new root of this subtree.
     */
    template <typename comparable_at>
    static node_ptr_t erase(node_ptr_t node,
                            comparable_at const& comparable,
                            bool& erased,
                            rotations_t& rotations) noexcept {
        if (!node)
            return node;

        auto less = comparator_t {};
        if (less(comparable, node->entry.key))
            node->left = erase(std::move(node->left), comparable, erased, rotations);

        else if (less(node->entry.key, comparable))
            node->right = erase(std::move(node->right), comparable, erased, rotations);

        // Just one child is present, so it is the natural successor.
        else if (!node->left) {
            erased = true;
            return std::move(node->right);
        }
        else if (!node->right) {
            erased = true;
            return std::move(node->left);
        }

        // If the node has two children, it takes the entry of the smallest node
        // in the right branch, and that node is dropped instead.
        // `comparable` may alias the swapped entry, so it is not used past this point.
        else {
            node_t* successor = find_min(node->right.get());
            std::swap(node->entry, successor->entry);
            node->right = erase_min(std::move(node->right), rotations);
            erased = true;
        }

        if (erased)
            node = rebalance_after_extract(std::move(node), rotations);
        return node;
    }
};

/**
 * @brief Ordered associative container built on AVL nodes.
 * Owns the root, the number of entries and the number of rotations performed
 * since construction or the last `reset_rotations`.
 *
 * Not thread-safe, wrap it into `locked_gt` if you need concurrency.
 * Any mutation invalidates all iterators.
 */
template <typename identifier_at = std::string,
          typename value_at = std::string,
          typename comparator_at = std::less<identifier_at>>
class balanced_index_gt {
  public:
    using node_t = avl_node_gt<identifier_at, value_at, comparator_at>;
    using node_ptr_t = typename node_t::node_ptr_t;
    using identifier_t = typename node_t::identifier_t;
    using value_t = typename node_t::value_t;
    using entry_t = typename node_t::entry_t;
    using comparator_t = comparator_at;
    using height_t = typename node_t::height_t;
    using rotations_t = typename node_t::rotations_t;

    struct upsert_result_t {
        status_t status;
        bool inserted = false;

        operator bool() const noexcept { return status; }
    };

    /**
     * @brief In-order walk over the entries, yielding them in ascending key order.
     * Keeps the path from the root to the current node on a stack,
     * which is ~O(logN) space.
     */
    class iterator_t {
        std::vector<node_t const*> path_;

        void descend_left(node_t const* node) {
            for (; node; node = node->left.get())
                path_.push_back(node);
        }

      public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = entry_t;
        using difference_type = std::ptrdiff_t;
        using pointer = entry_t const*;
        using reference = entry_t const&;

        iterator_t() noexcept = default;
        explicit iterator_t(node_t const* root) { descend_left(root); }

        reference operator*() const noexcept { return path_.back()->entry; }
        pointer operator->() const noexcept { return &path_.back()->entry; }

        iterator_t& operator++() {
            node_t const* node = path_.back();
            path_.pop_back();
            descend_left(node->right.get());
            return *this;
        }

        iterator_t operator++(int) {
            iterator_t copy = *this;
            ++*this;
            return copy;
        }

        bool operator==(iterator_t const& other) const noexcept {
            if (path_.empty() || other.path_.empty())
                return path_.empty() == other.path_.empty();
            return path_.back() == other.path_.back();
        }
        bool operator!=(iterator_t const& other) const noexcept { return !(*this == other); }
    };

  private:
    node_ptr_t root_;
    std::size_t size_ = 0;
    rotations_t rotations_ = 0;

    upsert_result_t emplace(identifier_t&& key, value_t&& value, bool overwrite) noexcept {
        node_ptr_t fresh {new (std::nothrow) node_t(std::move(key), std::move(value))};
        if (!fresh)
            return {status_t {out_of_memory_heap_k}, false};

        auto result = node_t::find_or_make(std::move(root_), fresh, overwrite, rotations_);
        root_ = std::move(result.root);
        size_ += result.inserted;
        return {status_t {success_k}, result.inserted};
    }

  public:
    balanced_index_gt() noexcept = default;
    balanced_index_gt(balanced_index_gt&& other) noexcept
        : root_(std::move(other.root_)), size_(std::exchange(other.size_, 0)),
          rotations_(std::exchange(other.rotations_, 0)) {}
    balanced_index_gt& operator=(balanced_index_gt&& other) noexcept {
        std::swap(root_, other.root_);
        std::swap(size_, other.size_);
        std::swap(rotations_, other.rotations_);
        return *this;
    }
    balanced_index_gt(balanced_index_gt const&) = delete;
    balanced_index_gt& operator=(balanced_index_gt const&) = delete;

    std::size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return !size_; }
    height_t height() const noexcept { return node_t::get_height(root_.get()); }
    node_t const* root() const noexcept { return root_.get(); }

    rotations_t rotations() const noexcept { return rotations_; }
    void reset_rotations() noexcept { rotations_ = 0; }

    iterator_t begin() const { return iterator_t {root_.get()}; }
    iterator_t end() const noexcept { return iterator_t {}; }

    std::size_t total_imbalance() const noexcept {
        std::size_t abs_sum = 0;
        node_t::for_each_top_down(root_.get(), [&](node_t const* node) noexcept {
            abs_sum += std::abs(node_t::get_balance(node));
        });
        return abs_sum;
    }

    /**
     * @brief Inserts a new entry or replaces the value of an existing one.
     * Replacing a value never changes the shape of the tree.
     * @return `out_of_memory_heap_k` if the node couldn't be allocated,
     *         in which case the index is left untouched.
     */
    [[nodiscard]] upsert_result_t upsert(identifier_t key, value_t value) noexcept {
        return emplace(std::move(key), std::move(value), true);
    }

    /**
     * @brief Same as `upsert`, but keeps the old value if the key is present.
     * Check `inserted` to see which one happened.
     */
    [[nodiscard]] upsert_result_t insert(identifier_t key, value_t value) noexcept {
        return emplace(std::move(key), std::move(value), false);
    }

    template <typename comparable_at = identifier_t,
              typename callback_found_at = no_op_t,
              typename callback_missing_at = no_op_t>
    [[nodiscard]] status_t find(comparable_at const& comparable,
                                callback_found_at&& callback_found,
                                callback_missing_at&& callback_missing = {}) const noexcept {
        node_t const* node = node_t::find(root_.get(), comparable);
        if (node)
            callback_found(node->entry);
        else
            callback_missing();
        return {success_k};
    }

    template <typename comparable_at = identifier_t>
    bool contains(comparable_at const& comparable) const noexcept {
        return node_t::find(root_.get(), comparable) != nullptr;
    }

    /**
     * @brief Copies out the matching entry.
     * @return `std::nullopt` if the key is missing.
     */
    template <typename comparable_at = identifier_t>
    std::optional<entry_t> search(comparable_at const& comparable) const {
        std::optional<entry_t> result;
        if (node_t const* node = node_t::find(root_.get(), comparable); node)
            result.emplace(node->entry);
        return result;
    }

    /**
     * @brief Removes the entry with the matching key, if it is present.
     * Erasing a missing key is a no-op.
     * @return True if something was removed.
     */
    template <typename comparable_at = identifier_t>
    bool erase(comparable_at const& comparable) noexcept {
        bool erased = false;
        root_ = node_t::erase(std::move(root_), comparable, erased, rotations_);
        size_ -= erased;
        return erased;
    }

    void clear() noexcept {
        root_.reset();
        size_ = 0;
    }

    /**
     * @brief Visits all entries in ascending order of keys.
     */
    template <typename callback_at>
    void for_each(callback_at&& callback) const {
        node_t::for_each_left_right(root_.get(), [&](node_t const* node) { callback(node->entry); });
    }

    /**
     * @brief Visits every node before its children, left branch first.
     * This is the order in which the entries are serialized.
     */
    template <typename callback_at>
    void for_each_top_down(callback_at&& callback) const {
        node_t::for_each_top_down(root_.get(), [&](node_t const* node) { callback(node->entry); });
    }

    /**
     * @brief Checks ordering, balance and stored heights of every node,
     * as well as the maintained size.
     */
    [[nodiscard]] status_t validate() const noexcept {
        if (node_t::check(root_.get(), nullptr, nullptr) < 0)
            return {consistency_k};

        std::size_t count = 0;
        node_t::for_each_top_down(root_.get(), [&](node_t const*) noexcept { ++count; });
        return {count == size_ ? success_k : consistency_k};
    }
};

using balanced_index_t = balanced_index_gt<>;

} // namespace unum::avlidx
