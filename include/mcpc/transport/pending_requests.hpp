#pragma once

#include "mcpc/error.hpp"
#include "mcpc/json/json.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace mcpc {

// ─────────────────────────────────────────────────────────────────────────────
// PendingRequests - id -> waiting caller
// ─────────────────────────────────────────────────────────────────────────────
// Used by transports whose responses arrive on a reader thread. Responses are
// delivered in whatever order the server produces them.

class PendingRequests {
public:
    /// Registers `id`; the returned future completes when the response arrives
    /// or the table is failed.
    [[nodiscard]] Result<std::future<Result<Json>>> add(std::int64_t id);

    /// Completes the waiter for the response's id. False when nobody waits
    /// (late response after a timeout, or an unknown id).
    bool resolve(const Json& response);

    /// Drops a waiter that gave up. False when the promise was already taken.
    bool remove(std::int64_t id);

    /// Fails every waiter with `error` and rejects later add() calls until reopen().
    void fail_all(const Error& error);

    void reopen();

    [[nodiscard]] std::size_t size() const;

    /// Waits on `future` for up to `timeout`, removing `id` on expiry.
    [[nodiscard]] Result<Json> await(std::int64_t id,
                                     std::future<Result<Json>>& future,
                                     std::chrono::milliseconds timeout);

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::int64_t, std::promise<Result<Json>>> waiters_;
    std::optional<Error> closed_with_;
};

}  // namespace mcpc
