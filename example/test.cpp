#include <algorithm> // `std::shuffle`
#include <cmath>     // `std::log2`
#include <cstdlib>   // `std::abs`
#include <map>       // `std::map`
#include <random>    // `std::mt19937`
#include <string>    // `std::string`
#include <thread>    // `std::thread`
#include <utility>   // `std::pair`
#include <vector>    // `std::vector`

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <avlidx/balanced_index.hpp>
#include <avlidx/locked.hpp>

using namespace unum::avlidx;

using index_t = balanced_index_t;
using node_t = index_t::node_t;

constexpr std::size_t size = 512;

static std::string make_key(std::size_t idx) { return fmt::format("{:06}", idx); }

/**
 * @brief Walks the tree independently from `validate` and checks
 * ordering, balance and heights of every node.
 * @return The recomputed height.
 */
static int expect_invariants(node_t const* node, std::string const* lower, std::string const* upper) {
    if (!node)
        return 0;
    if (lower)
        EXPECT_LT(*lower, node->entry.key);
    if (upper)
        EXPECT_LT(node->entry.key, *upper);

    int left_height = expect_invariants(node->left.get(), lower, &node->entry.key);
    int right_height = expect_invariants(node->right.get(), &node->entry.key, upper);
    EXPECT_LE(std::abs(left_height - right_height), 1) << "at " << node->entry.key;
    EXPECT_EQ(node->height, 1 + std::max(left_height, right_height)) << "at " << node->entry.key;
    EXPECT_EQ(node_t::get_balance(node), left_height - right_height);
    return 1 + std::max(left_height, right_height);
}

static void expect_invariants(index_t const& index) {
    expect_invariants(index.root(), nullptr, nullptr);
    EXPECT_TRUE(index.validate());

    std::size_t count = 0;
    std::string const* previous = nullptr;
    for (auto const& entry : index) {
        if (previous)
            EXPECT_LT(*previous, entry.key);
        previous = &entry.key;
        ++count;
    }
    EXPECT_EQ(count, index.size());
}

static std::vector<std::pair<std::string, std::string>> collect(index_t const& index) {
    std::vector<std::pair<std::string, std::string>> entries;
    index.for_each([&](auto const& entry) { entries.emplace_back(entry.key, entry.value); });
    return entries;
}

/**
 * @brief Captures keys and heights in pre-order, which pins down the exact shape.
 */
static std::vector<std::pair<std::string, int>> shape(index_t const& index) {
    std::vector<std::pair<std::string, int>> nodes;
    node_t::for_each_top_down(index.root(), [&](node_t const* node) {
        nodes.emplace_back(node->entry.key, node->height);
    });
    return nodes;
}

TEST(upsert_and_find_avl, ascending) {
    index_t avl;

    for (std::size_t idx = 0; idx < size; ++idx) {
        EXPECT_TRUE(avl.upsert(make_key(idx), make_key(idx)));
        EXPECT_TRUE(avl.contains(make_key(idx)));
    }
    EXPECT_EQ(avl.size(), size);
    expect_invariants(avl);
}

TEST(upsert_and_find_avl, descending) {
    index_t avl;

    for (std::size_t idx = size; idx > 0; --idx) {
        EXPECT_TRUE(avl.upsert(make_key(idx), make_key(idx)));
        EXPECT_TRUE(avl.contains(make_key(idx)));
    }
    EXPECT_EQ(avl.size(), size);
    expect_invariants(avl);
}

TEST(upsert_and_find_avl, random) {
    std::mt19937 generator {7};
    std::uniform_int_distribution<std::size_t> distribution {0, 100'000};
    index_t avl;

    for (std::size_t idx = 0; idx < size; ++idx) {
        auto key = make_key(distribution(generator));
        EXPECT_TRUE(avl.upsert(key, key));
        EXPECT_TRUE(avl.contains(key));
    }
    expect_invariants(avl);
}

TEST(upsert_and_find_avl, find_callbacks) {
    index_t avl;
    EXPECT_TRUE(avl.upsert("Alice", "555-0100"));

    bool found = false, missing = false;
    EXPECT_TRUE(avl.find(std::string("Alice"), [&](auto const& entry) noexcept {
        found = true;
        EXPECT_EQ(entry.value, "555-0100");
    }));
    EXPECT_TRUE(avl.find(std::string("Bob"), [&](auto const&) noexcept { found = false; }, [&]() noexcept { missing = true; }));
    EXPECT_TRUE(found);
    EXPECT_TRUE(missing);
}

TEST(upsert_and_find_avl, search_is_a_copy) {
    index_t avl;
    EXPECT_TRUE(avl.upsert("Alice", "555-0100"));

    auto entry = avl.search(std::string("Alice"));
    ASSERT_TRUE(entry);
    entry->value = "changed";
    EXPECT_EQ(avl.search(std::string("Alice"))->value, "555-0100");
    EXPECT_FALSE(avl.search(std::string("alice")));
}

TEST(upsert_and_find_avl, overwrite) {
    index_t avl;
    for (char const* key : {"D", "B", "F", "A", "C", "E", "G"})
        EXPECT_TRUE(avl.upsert(key, "old"));

    auto rotations = avl.rotations();
    auto before = shape(avl);
    auto result = avl.upsert("C", "new");
    EXPECT_TRUE(result);
    EXPECT_FALSE(result.inserted);
    EXPECT_EQ(avl.size(), 7u);
    EXPECT_EQ(avl.rotations(), rotations);
    EXPECT_EQ(shape(avl), before);
    EXPECT_EQ(avl.search(std::string("C"))->value, "new");
}

TEST(upsert_and_find_avl, insert_keeps_existing) {
    index_t avl;
    EXPECT_TRUE(avl.insert("Alice", "555-0100").inserted);

    auto result = avl.insert("Alice", "555-9999");
    EXPECT_TRUE(result);
    EXPECT_FALSE(result.inserted);
    EXPECT_EQ(avl.search(std::string("Alice"))->value, "555-0100");
    EXPECT_EQ(avl.size(), 1u);
}

TEST(upsert_and_find_avl, keys_are_case_sensitive) {
    index_t avl;
    EXPECT_TRUE(avl.upsert("bob", "1"));
    EXPECT_TRUE(avl.upsert("Bob", "2"));
    EXPECT_EQ(avl.size(), 2u);
    EXPECT_EQ(avl.begin()->key, "Bob");
}

TEST(rotations_avl, left_left) {
    index_t avl;
    for (char const* key : {"C", "B", "A"})
        EXPECT_TRUE(avl.upsert(key, key));

    EXPECT_EQ(avl.rotations(), 1u);
    ASSERT_NE(avl.root(), nullptr);
    EXPECT_EQ(avl.root()->entry.key, "B");
    EXPECT_EQ(avl.height(), 2);

    std::vector<std::string> keys;
    for (auto const& entry : avl)
        keys.push_back(entry.key);
    EXPECT_EQ(keys, (std::vector<std::string> {"A", "B", "C"}));
}

TEST(rotations_avl, right_left) {
    index_t avl;
    for (char const* key : {"A", "C", "B"})
        EXPECT_TRUE(avl.upsert(key, key));

    EXPECT_EQ(avl.rotations(), 2u);
    EXPECT_EQ(avl.root()->entry.key, "B");
    expect_invariants(avl);
}

TEST(rotations_avl, left_right) {
    index_t avl;
    for (char const* key : {"C", "A", "B"})
        EXPECT_TRUE(avl.upsert(key, key));

    EXPECT_EQ(avl.rotations(), 2u);
    EXPECT_EQ(avl.root()->entry.key, "B");
    expect_invariants(avl);
}

TEST(rotations_avl, right_right) {
    index_t avl;
    for (char const* key : {"A", "B", "C"})
        EXPECT_TRUE(avl.upsert(key, key));

    EXPECT_EQ(avl.rotations(), 1u);
    EXPECT_EQ(avl.root()->entry.key, "B");
}

TEST(rotations_avl, reset) {
    index_t avl;
    for (char const* key : {"A", "B", "C"})
        EXPECT_TRUE(avl.upsert(key, key));

    avl.clear();
    EXPECT_EQ(avl.rotations(), 1u);
    avl.reset_rotations();
    EXPECT_EQ(avl.rotations(), 0u);
}

TEST(rotations_avl, height_bound_for_sorted_input) {
    index_t avl;
    for (std::size_t idx = 0; idx < 4096; ++idx) {
        EXPECT_TRUE(avl.upsert(make_key(idx), ""));
        double bound = 1.44 * std::log2(static_cast<double>(avl.size()) + 2);
        ASSERT_LE(avl.height(), bound) << "after " << avl.size() << " keys";
    }
    EXPECT_LE(avl.total_imbalance(), avl.size());
    expect_invariants(avl);
}

TEST(erase_avl, two_children) {
    index_t avl;
    for (char const* key : {"D", "B", "F", "A", "C", "E", "G"})
        EXPECT_TRUE(avl.upsert(key, std::string(key) + "-value"));
    EXPECT_EQ(avl.rotations(), 0u);

    EXPECT_TRUE(avl.erase(std::string("D")));
    EXPECT_EQ(avl.root()->entry.key, "E");
    EXPECT_EQ(avl.root()->entry.value, "E-value");
    EXPECT_EQ(avl.size(), 6u);
    EXPECT_FALSE(avl.contains(std::string("D")));
    expect_invariants(avl);
}

TEST(erase_avl, key_aliasing_the_tree) {
    index_t avl;
    for (char const* key : {"D", "B", "F", "A", "C", "E", "G"})
        EXPECT_TRUE(avl.upsert(key, key));

    EXPECT_TRUE(avl.erase(avl.root()->entry.key));
    EXPECT_FALSE(avl.contains(std::string("D")));
    EXPECT_EQ(avl.size(), 6u);
    expect_invariants(avl);
}

TEST(erase_avl, leaves_and_single_children) {
    index_t avl;
    for (char const* key : {"B", "A", "C", "D"})
        EXPECT_TRUE(avl.upsert(key, key));

    // "C" has only the right child "D"
    EXPECT_TRUE(avl.erase(std::string("C")));
    expect_invariants(avl);
    EXPECT_TRUE(avl.erase(std::string("A")));
    expect_invariants(avl);
    EXPECT_TRUE(avl.erase(std::string("B")));
    EXPECT_TRUE(avl.erase(std::string("D")));
    EXPECT_TRUE(avl.empty());
    EXPECT_EQ(avl.root(), nullptr);
    EXPECT_EQ(avl.height(), 0);
}

TEST(erase_avl, missing_key_is_a_no_op) {
    index_t avl;
    for (std::size_t idx = 0; idx < 100; idx += 2)
        EXPECT_TRUE(avl.upsert(make_key(idx), make_key(idx)));

    auto before_shape = shape(avl);
    auto before_entries = collect(avl);
    auto rotations = avl.rotations();
    for (std::size_t idx = 1; idx < 100; idx += 2)
        EXPECT_FALSE(avl.erase(make_key(idx)));

    EXPECT_EQ(shape(avl), before_shape);
    EXPECT_EQ(collect(avl), before_entries);
    EXPECT_EQ(avl.rotations(), rotations);

    index_t empty;
    EXPECT_FALSE(empty.erase(std::string("nothing")));
    EXPECT_TRUE(empty.empty());
}

TEST(erase_avl, rebalances_along_the_path) {
    index_t avl;
    for (std::size_t idx = 0; idx < size; ++idx)
        EXPECT_TRUE(avl.upsert(make_key(idx), ""));

    auto rotations = avl.rotations();
    for (std::size_t idx = 0; idx < size / 2; ++idx) {
        EXPECT_TRUE(avl.erase(make_key(idx)));
        ASSERT_TRUE(avl.validate());
    }
    EXPECT_GT(avl.rotations(), rotations);
    EXPECT_EQ(avl.size(), size / 2);
    expect_invariants(avl);
}

TEST(mixed_avl, random_operations_keep_invariants) {
    std::mt19937 generator {2024};
    std::uniform_int_distribution<std::size_t> keys {0, 300};
    std::bernoulli_distribution coin {0.6};
    index_t avl;
    std::map<std::string, std::string> reference;

    for (std::size_t step = 0; step != 3000; ++step) {
        auto key = make_key(keys(generator));
        if (coin(generator)) {
            auto value = fmt::format("v{}", step);
            EXPECT_TRUE(avl.upsert(key, value));
            reference[key] = value;
        }
        else
            EXPECT_EQ(avl.erase(key), reference.erase(key) == 1);

        ASSERT_TRUE(avl.validate()) << "at step " << step;
        ASSERT_EQ(avl.size(), reference.size());
    }

    expect_invariants(avl);
    auto entries = collect(avl);
    EXPECT_TRUE(std::equal(entries.begin(), entries.end(), reference.begin(), reference.end(), [](auto const& a, auto const& b) {
        return a.first == b.first && a.second == b.second;
    }));
}

TEST(iterators_avl, restartable) {
    index_t avl;
    std::vector<std::string> keys;
    for (std::size_t idx = 0; idx < 64; ++idx)
        keys.push_back(make_key(idx));
    std::shuffle(keys.begin(), keys.end(), std::mt19937 {3});
    for (auto const& key : keys)
        EXPECT_TRUE(avl.upsert(key, key));

    std::sort(keys.begin(), keys.end());
    for (std::size_t pass = 0; pass != 2; ++pass) {
        std::vector<std::string> visited;
        for (auto it = avl.begin(); it != avl.end(); ++it)
            visited.push_back(it->key);
        EXPECT_EQ(visited, keys);
    }

    index_t empty;
    EXPECT_TRUE(empty.begin() == empty.end());
}

TEST(validate_avl, detects_corruption) {
    index_t avl;
    for (char const* key : {"B", "A", "C"})
        EXPECT_TRUE(avl.upsert(key, key));
    EXPECT_TRUE(avl.validate());

    const_cast<node_t*>(avl.root())->height = 7;
    EXPECT_EQ(avl.validate(), status_t {consistency_k});

    const_cast<node_t*>(avl.root())->height = 2;
    EXPECT_TRUE(avl.validate());

    const_cast<node_t*>(avl.root())->left->entry.key = "Z";
    EXPECT_FALSE(avl.validate());
}

TEST(test_avl, clear_and_move) {
    index_t avl;
    EXPECT_EQ(avl.size(), 0u);

    for (std::size_t idx = 0; idx < size; ++idx)
        EXPECT_TRUE(avl.upsert(make_key(idx), make_key(idx)));

    index_t moved {std::move(avl)};
    EXPECT_EQ(moved.size(), size);
    EXPECT_EQ(avl.size(), 0u);
    EXPECT_GT(moved.rotations(), 0u);

    moved.clear();
    EXPECT_EQ(moved.size(), 0u);
    EXPECT_EQ(moved.height(), 0);
    EXPECT_TRUE(moved.validate());
}

TEST(locked_avl, with_threads) {
    constexpr std::size_t threads_count = 8;
    locked_gt<index_t> locked;
    std::vector<std::thread> threads;
    threads.reserve(threads_count);

    auto upsert = [&](std::size_t offset, std::size_t length) {
        for (std::size_t idx = offset; idx < offset + length; ++idx)
            EXPECT_TRUE(locked.upsert(make_key(idx), make_key(idx)));
    };

    std::size_t shift = size / threads_count;
    for (std::size_t idx = 0; idx < threads_count; ++idx)
        threads.emplace_back(upsert, idx * shift, shift);
    for (auto& thread : threads)
        thread.join();

    EXPECT_EQ(locked.size(), size);
    EXPECT_TRUE(locked.validate());
    for (std::size_t idx = 0; idx < size; ++idx)
        EXPECT_TRUE(locked.search(make_key(idx)));

    threads.clear();
    auto erase = [&](std::size_t offset, std::size_t length) {
        for (std::size_t idx = offset; idx < offset + length; idx += 2)
            EXPECT_TRUE(locked.erase(make_key(idx)));
    };
    for (std::size_t idx = 0; idx < threads_count; ++idx)
        threads.emplace_back(erase, idx * shift, shift);
    for (auto& thread : threads)
        thread.join();

    EXPECT_EQ(locked.size(), size / 2);
    EXPECT_TRUE(locked.validate());

    std::size_t visited = 0;
    locked.for_each([&](auto const&) { ++visited; });
    EXPECT_EQ(visited, size / 2);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
