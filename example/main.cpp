#include <cstdio>       // `stderr`
#include <filesystem>   // `std::filesystem::exists`
#include <iostream>     // `std::cin`
#include <optional>     // `std::optional`
#include <string>       // `std::getline`
#include <string_view>  // `std::string_view`
#include <system_error> // `std::error_code`
#include <utility>      // `std::forward`

#include <fmt/format.h>

#include <avlidx/balanced_index.hpp>
#include <avlidx/text_format.hpp>

using namespace unum::avlidx;

namespace {

enum class severity_t { info_k, warn_k, error_k };

struct settings_t {
    std::string file = "agenda.txt";
    load_options_t load_options;
    bool quiet = false;
};

template <typename... args_at>
void log_message(settings_t const& settings, severity_t severity, fmt::format_string<args_at...> format, args_at&&... args) {
    if (severity == severity_t::info_k && settings.quiet)
        return;
    char const* tag = severity == severity_t::info_k ? "info" : severity == severity_t::warn_k ? "warn" : "error";
    fmt::print(stderr, "[{}] {}\n", tag, fmt::format(format, std::forward<args_at>(args)...));
}

void print_usage(char const* program) {
    fmt::print("Usage: {} [--file <path>] [--skip-malformed] [--quiet] [--help]\n"
               "Reads commands from the standard input, one per line:\n"
               "  add <key>|<value>   insert or overwrite an entry\n"
               "  find <key>          print the entry\n"
               "  del <key>           remove the entry\n"
               "  list                print all entries in key order\n"
               "  stats               print count, height and rotations\n"
               "  check               verify the tree invariants\n"
               "  save [path]         write the records file\n"
               "  load [path]         merge a records file into the index\n"
               "  export <path>       write a human-readable listing\n"
               "  clear               drop all entries and reset rotations\n"
               "  quit                stop reading commands\n",
               program);
}

bool load_records(balanced_index_t& index, settings_t const& settings, std::string const& path) {
    std::size_t count_before = index.size();
    load_result_t result = load(index, path, settings.load_options);
    if (result.status.errc == file_not_found_k) {
        log_message(settings, severity_t::warn_k, "no data loaded, '{}' doesn't exist", path);
        return false;
    }
    if (!result) {
        log_message(settings, severity_t::error_k, "failed to load '{}': {} {}", path, status_message(result.status), result.message);
        return false;
    }
    if (result.skipped)
        log_message(settings, severity_t::warn_k, "skipped {} malformed lines in '{}', first at {}", result.skipped, path, result.line);
    log_message(settings, severity_t::info_k, "{} new records loaded from '{}'", index.size() - count_before, path);
    return true;
}

bool execute(balanced_index_t& index, settings_t const& settings, std::string_view command, std::string_view argument) {

    if (command == "add") {
        std::optional<record_view_t> entry = parse_entry(argument);
        if (!entry) {
            log_message(settings, severity_t::error_k, "expected '<key>|<value>' with both filled, got '{}'", argument);
            return false;
        }
        std::string key {entry->key};
        std::string value {entry->value};
        auto result = index.upsert(key, std::move(value));
        if (!result) {
            log_message(settings, severity_t::error_k, "failed to add '{}': {}", key, status_message(result.status));
            return false;
        }
        log_message(settings, severity_t::info_k, "{} '{}'", result.inserted ? "added" : "updated", key);
        return true;
    }

    if (command == "find") {
        std::string key {argument};
        if (auto entry = index.search(key); entry)
            fmt::print("{} | {}\n", entry->key, entry->value);
        else
            log_message(settings, severity_t::warn_k, "'{}' not found", key);
        return true;
    }

    if (command == "del") {
        std::string key {argument};
        if (index.erase(key))
            log_message(settings, severity_t::info_k, "removed '{}'", key);
        else
            log_message(settings, severity_t::warn_k, "'{}' not found", key);
        return true;
    }

    if (command == "list") {
        for (auto const& entry : index)
            fmt::print("{} | {}\n", entry.key, entry.value);
        return true;
    }

    if (command == "stats") {
        fmt::print("count: {}\nheight: {}\nrotations: {}\n", index.size(), index.height(), index.rotations());
        return true;
    }

    if (command == "check") {
        status_t status = index.validate();
        if (!status)
            log_message(settings, severity_t::error_k, "{}", status_message(status));
        return status;
    }

    if (command == "save") {
        std::string path = argument.empty() ? settings.file : std::string(argument);
        status_t status = save(index, path);
        if (!status) {
            log_message(settings, severity_t::error_k, "failed to save '{}': {}", path, status_message(status));
            return false;
        }
        log_message(settings, severity_t::info_k, "saved {} records to '{}'", index.size(), path);
        return true;
    }

    if (command == "load")
        return load_records(index, settings, argument.empty() ? settings.file : std::string(argument));

    if (command == "export") {
        if (argument.empty()) {
            log_message(settings, severity_t::error_k, "export needs a path");
            return false;
        }
        std::string path {argument};
        status_t status = export_listing(index, std::filesystem::path(path));
        if (status.errc == invalid_argument_k) {
            log_message(settings, severity_t::warn_k, "nothing to export");
            return false;
        }
        if (!status) {
            log_message(settings, severity_t::error_k, "failed to export '{}': {}", path, status_message(status));
            return false;
        }
        log_message(settings, severity_t::info_k, "exported listing to '{}'", path);
        return true;
    }

    if (command == "clear") {
        index.clear();
        index.reset_rotations();
        log_message(settings, severity_t::info_k, "all records removed");
        return true;
    }

    log_message(settings, severity_t::error_k, "unknown command '{}'", command);
    return false;
}

} // namespace

int main(int argc, char** argv) {

    settings_t settings;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--file" && i + 1 < argc)
            settings.file = argv[++i];
        else if (arg == "--skip-malformed")
            settings.load_options.on_malformed = malformed_policy_t::skip_k;
        else if (arg == "--quiet")
            settings.quiet = true;
        else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        else {
            print_usage(argv[0]);
            return 2;
        }
    }

    balanced_index_t index;
    bool all_succeeded = true;
    std::error_code error;
    bool file_exists = std::filesystem::exists(settings.file, error);
    if (error) {
        log_message(settings, severity_t::error_k, "can't access '{}': {}", settings.file, error.message());
        all_succeeded = false;
    }
    else if (file_exists)
        all_succeeded = load_records(index, settings, settings.file);
    else
        log_message(settings, severity_t::info_k, "starting with an empty index, '{}' doesn't exist", settings.file);

    std::string line;
    while (std::getline(std::cin, line)) {
        std::string_view trimmed = trim_whitespace(line);
        if (trimmed.empty() || trimmed.front() == '#')
            continue;

        auto split = trimmed.find_first_of(" \t");
        std::string_view command = trimmed.substr(0, split);
        std::string_view argument = split == std::string_view::npos ? std::string_view {} : trim_whitespace(trimmed.substr(split));
        if (command == "quit")
            break;
        if (command == "help") {
            print_usage(argv[0]);
            continue;
        }
        all_succeeded &= execute(index, settings, command, argument);
    }

    return all_succeeded ? 0 : 1;
}
