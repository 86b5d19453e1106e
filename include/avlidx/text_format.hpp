#pragma once
#include <cerrno>      // `errno`
#include <filesystem>  // `std::filesystem::path`
#include <fstream>     // `std::ifstream`
#include <istream>     // `std::istream`
#include <new>         // `std::bad_alloc`
#include <optional>    // `std::optional`
#include <ostream>     // `std::ostream`
#include <string>      // `std::getline`
#include <string_view> // `std::string_view`
#include <utility>     // `std::pair`
#include <vector>      // `std::vector`

#include <fmt/format.h>

#include "status.hpp"

namespace unum::avlidx {

/**
 * @brief Separates the key from the value on every line of the records file.
 * Keys must not contain it, values may not contain it either,
 * as every well-formed line has exactly one.
 */
constexpr char record_separator_k = '|';

enum class malformed_policy_t {
    /// The first bad line fails the whole load and nothing is applied.
    abort_k,
    /// Bad lines are counted and skipped, all the good ones are applied.
    skip_k,
};

struct load_options_t {
    malformed_policy_t on_malformed = malformed_policy_t::abort_k;
};

struct load_result_t {
    status_t status;
    /// Number of records applied to the index, overwrites included.
    std::size_t loaded = 0;
    /// Number of malformed lines, only non-zero with `malformed_policy_t::skip_k`.
    std::size_t skipped = 0;
    /// One-based number of the first malformed line, or zero.
    std::size_t line = 0;
    std::string message;

    operator bool() const noexcept { return status; }
};

struct record_view_t {
    std::string_view key;
    std::string_view value;
};

inline std::string_view trim_whitespace(std::string_view text) noexcept {
    constexpr std::string_view whitespace_k = " \t\r\n\v\f";
    auto first = text.find_first_not_of(whitespace_k);
    if (first == std::string_view::npos)
        return {};
    auto last = text.find_last_not_of(whitespace_k);
    return text.substr(first, last - first + 1);
}

/**
 * @brief Splits a trimmed line into a key and a value.
 * @return NULL-state if the separator is missing or repeated.
 */
inline std::optional<record_view_t> parse_record(std::string_view line) noexcept {
    auto separator = line.find(record_separator_k);
    if (separator == std::string_view::npos)
        return std::nullopt;
    if (line.find(record_separator_k, separator + 1) != std::string_view::npos)
        return std::nullopt;
    return record_view_t {line.substr(0, separator), line.substr(separator + 1)};
}

/**
 * @brief Parses a user-typed `key|value` pair, trimming both halves.
 * Stricter than `parse_record`: neither the key nor the value may be blank.
 */
inline std::optional<record_view_t> parse_entry(std::string_view text) noexcept {
    std::optional<record_view_t> record = parse_record(trim_whitespace(text));
    if (!record)
        return std::nullopt;
    record_view_t entry {trim_whitespace(record->key), trim_whitespace(record->value)};
    if (entry.key.empty() || entry.value.empty())
        return std::nullopt;
    return entry;
}

/**
 * @brief Maps an `errno` of a failed open into a status.
 * Only a missing input is `file_not_found_k`, a missing output location is an I/O failure.
 */
inline status_t status_from_errno(int error, bool for_writing = false) noexcept {
    switch (error) {
    case ENOENT:
    case ENOTDIR: return {for_writing ? io_failure_k : file_not_found_k};
    case EACCES:
    case EPERM:
    case EROFS: return {permission_denied_k};
    case ENOMEM: return {out_of_memory_heap_k};
    default: return {io_failure_k};
    }
}

#pragma mark - Streams

/**
 * @brief Writes every entry as `key|value` on its own line, visiting
 * the tree in pre-order: node, then left branch, then right branch.
 */
template <typename index_at>
[[nodiscard]] status_t serialize(index_at const& index, std::ostream& output) noexcept {
    try {
        index.for_each_top_down([&](auto const& entry) {
            output << entry.key << record_separator_k << entry.value << '\n';
        });
        output.flush();
    }
    catch (std::bad_alloc const&) {
        return {out_of_memory_heap_k};
    }
    catch (std::ios_base::failure const&) {
        return {io_failure_k};
    }
    return {output ? success_k : io_failure_k};
}

/**
 * @brief Reads `key|value` lines and upserts each of them.
 * The contents of a serialized index survive the round-trip, its shape doesn't,
 * as the entries are rebalanced once more while being inserted.
 *
 * Lines are trimmed, blank ones are skipped. All the records are parsed
 * before the first one is applied, so an aborted load leaves the index intact.
 */
template <typename index_at>
[[nodiscard]] load_result_t deserialize(index_at& index,
                                        std::istream& input,
                                        load_options_t const& options = {}) noexcept {
    load_result_t result;
    try {
        std::vector<std::pair<std::string, std::string>> staged;
        std::string line;
        std::size_t line_number = 0;
        while (std::getline(input, line)) {
            ++line_number;
            std::string_view trimmed = trim_whitespace(line);
            if (trimmed.empty())
                continue;

            std::optional<record_view_t> record = parse_record(trimmed);
            if (record) {
                staged.emplace_back(std::string(record->key), std::string(record->value));
                continue;
            }

            if (!result.line) {
                result.line = line_number;
                result.message =
                    fmt::format("line {}: expected exactly one '{}' separator", line_number, record_separator_k);
            }
            if (options.on_malformed == malformed_policy_t::abort_k) {
                result.status = {malformed_record_k};
                return result;
            }
            ++result.skipped;
        }

        if (input.bad()) {
            result.status = {io_failure_k};
            result.message = fmt::format("read failed after line {}", line_number);
            return result;
        }

        for (auto& [key, value] : staged) {
            auto upserted = index.upsert(std::move(key), std::move(value));
            if (!upserted) {
                result.status = upserted.status;
                result.message = fmt::format("{} after {} records", status_message(result.status), result.loaded);
                return result;
            }
            ++result.loaded;
        }
    }
    catch (std::bad_alloc const&) {
        result.status = {out_of_memory_heap_k};
    }
    catch (std::ios_base::failure const&) {
        result.status = {io_failure_k};
    }
    return result;
}

/**
 * @brief Writes a human-readable listing: a title, a blank line,
 * and then every entry as `key | value` in ascending order of keys.
 * Unlike `serialize`, the output isn't meant to be loaded back.
 * @return `invalid_argument_k` for an empty index.
 */
template <typename index_at>
[[nodiscard]] status_t export_listing(index_at const& index, std::ostream& output) noexcept {
    if (index.empty())
        return {invalid_argument_k};

    try {
        output << "=== AVL INDEX ===\n\n";
        index.for_each([&](auto const& entry) { output << entry.key << " | " << entry.value << '\n'; });
        output.flush();
    }
    catch (std::bad_alloc const&) {
        return {out_of_memory_heap_k};
    }
    catch (std::ios_base::failure const&) {
        return {io_failure_k};
    }
    return {output ? success_k : io_failure_k};
}

#pragma mark - Files

template <typename index_at>
[[nodiscard]] status_t save(index_at const& index, std::filesystem::path const& path) noexcept {
    std::ofstream output(path, std::ios::out | std::ios::trunc);
    if (!output)
        return status_from_errno(errno, true);
    return serialize(index, output);
}

/**
 * @brief Loads a records file produced by `save`.
 * A missing file is reported as `file_not_found_k` and changes nothing,
 * a directory or an unreadable file is an `io_failure_k`.
 */
template <typename index_at>
[[nodiscard]] load_result_t load(index_at& index,
                                 std::filesystem::path const& path,
                                 load_options_t const& options = {}) noexcept {
    load_result_t result;
    std::error_code error;
    if (!std::filesystem::exists(path, error)) {
        result.status = error ? status_from_errno(error.value()) : status_t {file_not_found_k};
        return result;
    }
    if (std::filesystem::is_directory(path, error) || error) {
        result.status = {io_failure_k};
        result.message = fmt::format("'{}' is not a regular file", path.string());
        return result;
    }

    std::ifstream input(path);
    if (!input) {
        result.status = status_from_errno(errno);
        return result;
    }
    return deserialize(index, input, options);
}

template <typename index_at>
[[nodiscard]] status_t export_listing(index_at const& index, std::filesystem::path const& path) noexcept {
    if (index.empty())
        return {invalid_argument_k};

    std::ofstream output(path, std::ios::out | std::ios::trunc);
    if (!output)
        return status_from_errno(errno, true);
    return export_listing(index, output);
}

} // namespace unum::avlidx
