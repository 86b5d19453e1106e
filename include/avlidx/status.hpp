#pragma once
#include <cerrno>       // `ENOENT`
#include <cstdint>      //
#include <system_error> // `ENOMEM`

namespace unum::avlidx {

enum index_errc_t {
    success_k = 0,
    unknown_k = -1,

    consistency_k = -2,
    malformed_record_k = -3,

    file_not_found_k = ENOENT,
    permission_denied_k = EACCES,
    io_failure_k = EIO,

    out_of_memory_heap_k = ENOMEM,
    invalid_argument_k = EINVAL,
};

/**
 * @brief Wraps error-codes into bool-convertible conditions.
 * @see @c index_errc_t.
 */
struct status_t {
    index_errc_t errc = index_errc_t::success_k;
    constexpr operator bool() const noexcept { return errc == index_errc_t::success_k; }
};

constexpr bool operator==(status_t a, status_t b) noexcept { return a.errc == b.errc; }
constexpr bool operator!=(status_t a, status_t b) noexcept { return a.errc != b.errc; }

/**
 * @brief Human-readable name of an error-code, for diagnostics only.
 * Never returns NULL.
 */
constexpr char const* status_message(status_t status) noexcept {
    switch (status.errc) {
    case success_k: return "success";
    case consistency_k: return "tree invariants are violated";
    case malformed_record_k: return "malformed record";
    case file_not_found_k: return "file not found";
    case permission_denied_k: return "permission denied";
    case io_failure_k: return "input/output failure";
    case out_of_memory_heap_k: return "out of memory";
    case invalid_argument_k: return "invalid argument";
    default: return "unknown error";
    }
}

struct no_op_t {
    constexpr void operator()() const noexcept {}
    template <typename at>
    constexpr void operator()(at&&) const noexcept {}
};

} // namespace unum::avlidx
