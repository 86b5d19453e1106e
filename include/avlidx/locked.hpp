#pragma once
#include <mutex>        // `std::unique_lock`
#include <optional>     // `std::optional`
#include <shared_mutex> // `std::shared_mutex`
#include <utility>      // `std::forward`

#include "status.hpp"

namespace unum::avlidx {

/**
 * @brief
 * The index itself becomes @b thread-safe: every call holds one lock
 * for its whole duration. Reads share the lock, writes are exclusive.
 * There are no iterators, as they would outlive the lock, use `for_each`.
 */
template <typename index_at, typename shared_mutex_at = std::shared_mutex>
class locked_gt {

  public:
    using locked_t = locked_gt;
    using unlocked_t = index_at;
    using shared_mutex_t = shared_mutex_at;

    using identifier_t = typename unlocked_t::identifier_t;
    using value_t = typename unlocked_t::value_t;
    using entry_t = typename unlocked_t::entry_t;
    using height_t = typename unlocked_t::height_t;
    using rotations_t = typename unlocked_t::rotations_t;
    using upsert_result_t = typename unlocked_t::upsert_result_t;

  private:
    mutable shared_mutex_t mutex_;
    unlocked_t unlocked_;

  public:
    locked_gt() = default;
    locked_gt(unlocked_t&& unlocked) noexcept : unlocked_(std::move(unlocked)) {}
    locked_gt(locked_gt const&) = delete;
    locked_gt& operator=(locked_gt const&) = delete;

    [[nodiscard]] std::size_t size() const noexcept {
        std::shared_lock _ {mutex_};
        return unlocked_.size();
    }

    [[nodiscard]] height_t height() const noexcept {
        std::shared_lock _ {mutex_};
        return unlocked_.height();
    }

    [[nodiscard]] rotations_t rotations() const noexcept {
        std::shared_lock _ {mutex_};
        return unlocked_.rotations();
    }

    void reset_rotations() noexcept {
        std::unique_lock _ {mutex_};
        unlocked_.reset_rotations();
    }

    [[nodiscard]] upsert_result_t upsert(identifier_t key, value_t value) noexcept {
        std::unique_lock _ {mutex_};
        return unlocked_.upsert(std::move(key), std::move(value));
    }

    [[nodiscard]] upsert_result_t insert(identifier_t key, value_t value) noexcept {
        std::unique_lock _ {mutex_};
        return unlocked_.insert(std::move(key), std::move(value));
    }

    template <typename comparable_at = identifier_t,
              typename callback_found_at = no_op_t,
              typename callback_missing_at = no_op_t>
    [[nodiscard]] status_t find(comparable_at const& comparable,
                                callback_found_at&& callback_found,
                                callback_missing_at&& callback_missing = {}) const noexcept {
        std::shared_lock _ {mutex_};
        return unlocked_.find(comparable,
                              std::forward<callback_found_at>(callback_found),
                              std::forward<callback_missing_at>(callback_missing));
    }

    template <typename comparable_at = identifier_t>
    std::optional<entry_t> search(comparable_at const& comparable) const {
        std::shared_lock _ {mutex_};
        return unlocked_.search(comparable);
    }

    template <typename comparable_at = identifier_t>
    bool erase(comparable_at const& comparable) noexcept {
        std::unique_lock _ {mutex_};
        return unlocked_.erase(comparable);
    }

    template <typename callback_at>
    void for_each(callback_at&& callback) const {
        std::shared_lock _ {mutex_};
        unlocked_.for_each(std::forward<callback_at>(callback));
    }

    void clear() noexcept {
        std::unique_lock _ {mutex_};
        unlocked_.clear();
    }

    [[nodiscard]] status_t validate() const noexcept {
        std::shared_lock _ {mutex_};
        return unlocked_.validate();
    }
};

} // namespace unum::avlidx
