#include <cerrno>     // `ENOENT`
#include <filesystem> // `std::filesystem::temp_directory_path`
#include <fstream>    // `std::ofstream`
#include <random>     // `std::mt19937`
#include <sstream>    // `std::stringstream`
#include <string>     // `std::string`
#include <utility>    // `std::pair`
#include <vector>     // `std::vector`

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <avlidx/balanced_index.hpp>
#include <avlidx/text_format.hpp>

using namespace unum::avlidx;
namespace fs = std::filesystem;

using index_t = balanced_index_t;

static std::vector<std::pair<std::string, std::string>> collect(index_t const& index) {
    std::vector<std::pair<std::string, std::string>> entries;
    index.for_each([&](auto const& entry) { entries.emplace_back(entry.key, entry.value); });
    return entries;
}

/**
 * @brief Unique file path in the temporary directory, removed on destruction.
 */
class temporary_file_t {
    fs::path path_;

  public:
    explicit temporary_file_t(std::string const& name)
        : path_(fs::temp_directory_path() / fmt::format("avlidx-{}-{}", std::random_device {}(), name)) {}
    ~temporary_file_t() {
        std::error_code error;
        fs::remove(path_, error);
    }
    fs::path const& path() const noexcept { return path_; }

    void write(std::string const& content) const {
        std::ofstream output(path_, std::ios::binary);
        output << content;
    }

    std::string read() const {
        std::ifstream input(path_, std::ios::binary);
        std::stringstream content;
        content << input.rdbuf();
        return content.str();
    }
};

TEST(parse_record, splits_on_the_separator) {
    auto record = parse_record("Alice|555-0100");
    ASSERT_TRUE(record);
    EXPECT_EQ(record->key, "Alice");
    EXPECT_EQ(record->value, "555-0100");

    auto empty_value = parse_record("Alice|");
    ASSERT_TRUE(empty_value);
    EXPECT_EQ(empty_value->value, "");

    EXPECT_FALSE(parse_record("Alice 555-0100"));
    EXPECT_FALSE(parse_record("Alice|555|0100"));
    EXPECT_EQ(trim_whitespace("  Bob|555-0200\r"), "Bob|555-0200");
    EXPECT_EQ(trim_whitespace(" \t\r\n"), "");
}

TEST(parse_record, entry_requires_both_fields) {
    auto entry = parse_entry("  Alice  |  555-0100 ");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->key, "Alice");
    EXPECT_EQ(entry->value, "555-0100");

    EXPECT_FALSE(parse_entry("Alice|"));
    EXPECT_FALSE(parse_entry("Alice|   "));
    EXPECT_FALSE(parse_entry(" |555-0100"));
    EXPECT_FALSE(parse_entry("Alice"));
    EXPECT_FALSE(parse_entry("Alice|555|0100"));
}

TEST(serialize, pre_order_lines) {
    index_t index;
    for (char const* key : {"B", "A", "C"})
        EXPECT_TRUE(index.upsert(key, std::string(key) + "1"));

    std::ostringstream output;
    EXPECT_TRUE(serialize(index, output));
    EXPECT_EQ(output.str(), "B|B1\nA|A1\nC|C1\n");

    index_t empty;
    std::ostringstream nothing;
    EXPECT_TRUE(serialize(empty, nothing));
    EXPECT_EQ(nothing.str(), "");
}

TEST(serialize, reports_failed_streams) {
    index_t index;
    EXPECT_TRUE(index.upsert("Alice", "555-0100"));

    std::ostringstream output;
    output.setstate(std::ios::badbit);
    EXPECT_EQ(serialize(index, output), status_t {io_failure_k});
}

TEST(deserialize, round_trip_keeps_contents) {
    std::mt19937 generator {11};
    std::uniform_int_distribution<int> distribution {0, 9999};
    index_t original;
    for (std::size_t idx = 0; idx != 300; ++idx) {
        auto key = fmt::format("name-{}", distribution(generator));
        EXPECT_TRUE(original.upsert(key, fmt::format("555-{:04}", idx)));
    }
    for (int idx = 0; idx != 50; ++idx)
        original.erase(fmt::format("name-{}", distribution(generator)));

    std::stringstream buffer;
    EXPECT_TRUE(serialize(original, buffer));

    index_t restored;
    auto result = deserialize(restored, buffer);
    EXPECT_TRUE(result);
    EXPECT_EQ(result.loaded, original.size());
    EXPECT_EQ(result.skipped, 0u);
    EXPECT_EQ(collect(restored), collect(original));
    EXPECT_TRUE(restored.validate());
}

TEST(deserialize, skips_blank_lines_and_trims) {
    std::istringstream input("\n  Alice|555-0100  \r\n\n\t\nBob|555-0200");
    index_t index;
    auto result = deserialize(index, input);
    EXPECT_TRUE(result);
    EXPECT_EQ(result.loaded, 2u);
    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(index.search(std::string("Alice"))->value, "555-0100");
    EXPECT_EQ(index.search(std::string("Bob"))->value, "555-0200");
}

TEST(deserialize, later_lines_overwrite) {
    std::istringstream input("Alice|1\nAlice|2\n");
    index_t index;
    auto result = deserialize(index, input);
    EXPECT_TRUE(result);
    EXPECT_EQ(result.loaded, 2u);
    EXPECT_EQ(index.size(), 1u);
    EXPECT_EQ(index.search(std::string("Alice"))->value, "2");
}

TEST(deserialize, malformed_line_aborts_everything) {
    index_t index;
    EXPECT_TRUE(index.upsert("Zed", "000"));

    std::istringstream input("Alice|555-0100\nno separator here\nBob|555-0200\n");
    auto result = deserialize(index, input);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.status, status_t {malformed_record_k});
    EXPECT_EQ(result.line, 2u);
    EXPECT_EQ(result.loaded, 0u);
    EXPECT_FALSE(result.message.empty());

    EXPECT_EQ(index.size(), 1u);
    EXPECT_FALSE(index.contains(std::string("Alice")));
}

TEST(deserialize, malformed_lines_skipped_on_request) {
    index_t index;
    std::istringstream input("Alice|555-0100\nbroken\nBob|555|0200\nCarol|555-0300\n");
    auto result = deserialize(index, input, load_options_t {malformed_policy_t::skip_k});
    EXPECT_TRUE(result);
    EXPECT_EQ(result.loaded, 2u);
    EXPECT_EQ(result.skipped, 2u);
    EXPECT_EQ(result.line, 2u);
    EXPECT_TRUE(index.contains(std::string("Alice")));
    EXPECT_TRUE(index.contains(std::string("Carol")));
    EXPECT_FALSE(index.contains(std::string("Bob")));
}

TEST(files, load_two_records) {
    temporary_file_t file {"agenda.txt"};
    file.write("Alice|555-0100\nBob|555-0200\n");

    index_t index;
    auto result = load(index, file.path());
    EXPECT_TRUE(result);
    EXPECT_EQ(index.size(), 2u);
    ASSERT_TRUE(index.search(std::string("Alice")));
    EXPECT_EQ(index.search(std::string("Alice"))->value, "555-0100");
}

TEST(files, missing_file_is_not_malformed) {
    index_t index;
    EXPECT_TRUE(index.upsert("Alice", "555-0100"));

    auto result = load(index, fs::temp_directory_path() / "avlidx-this-file-does-not-exist.txt");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.status, status_t {file_not_found_k});
    EXPECT_EQ(index.size(), 1u);
}

TEST(files, save_then_load) {
    temporary_file_t file {"saved.txt"};
    index_t original;
    for (char const* key : {"Dave", "Bob", "Frank", "Alice", "Carol", "Eve", "Grace"})
        EXPECT_TRUE(original.upsert(key, fmt::format("{}@example.com", key)));

    EXPECT_TRUE(save(original, file.path()));
    EXPECT_EQ(file.read().substr(0, 24), "Dave|Dave@example.com\nBo");

    index_t restored;
    EXPECT_TRUE(load(restored, file.path()));
    EXPECT_EQ(collect(restored), collect(original));
}

TEST(files, save_into_missing_directory) {
    index_t index;
    EXPECT_TRUE(index.upsert("Alice", "555-0100"));
    auto path = fs::temp_directory_path() / "avlidx-missing-directory" / "agenda.txt";
    EXPECT_EQ(save(index, path), status_t {io_failure_k});
    EXPECT_EQ(export_listing(index, path), status_t {io_failure_k});
}

TEST(files, status_from_errno_depends_on_direction) {
    EXPECT_EQ(status_from_errno(ENOENT), status_t {file_not_found_k});
    EXPECT_EQ(status_from_errno(ENOENT, true), status_t {io_failure_k});
    EXPECT_EQ(status_from_errno(ENOTDIR, true), status_t {io_failure_k});
    EXPECT_EQ(status_from_errno(EACCES, true), status_t {permission_denied_k});
}

TEST(files, load_directory_is_io_failure) {
    index_t index;
    EXPECT_TRUE(index.upsert("Alice", "555-0100"));

    auto result = load(index, fs::temp_directory_path());
    EXPECT_FALSE(result);
    EXPECT_EQ(result.status, status_t {io_failure_k});
    EXPECT_NE(result.status, status_t {file_not_found_k});
    EXPECT_EQ(result.loaded, 0u);
    EXPECT_EQ(index.size(), 1u);
    EXPECT_EQ(index.search(std::string("Alice"))->value, "555-0100");
}

TEST(files, unreachable_path_is_io_failure) {
    index_t index;
    auto result = load(index, fs::temp_directory_path() / std::string(300, 'x'));
    EXPECT_FALSE(result);
    EXPECT_EQ(result.status, status_t {io_failure_k});
    EXPECT_EQ(index.size(), 0u);
}

TEST(export_listing, sorted_with_title) {
    index_t index;
    for (char const* key : {"Carol", "Alice", "Bob"})
        EXPECT_TRUE(index.upsert(key, "1"));

    std::ostringstream output;
    EXPECT_TRUE(export_listing(index, output));
    EXPECT_EQ(output.str(), "=== AVL INDEX ===\n\nAlice | 1\nBob | 1\nCarol | 1\n");

    temporary_file_t file {"listing.txt"};
    EXPECT_TRUE(export_listing(index, file.path()));
    EXPECT_EQ(file.read(), output.str());
}

TEST(export_listing, refuses_empty_index) {
    index_t index;
    std::ostringstream output;
    EXPECT_EQ(export_listing(index, output), status_t {invalid_argument_k});
    EXPECT_EQ(output.str(), "");
}
