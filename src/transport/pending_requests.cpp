#include "mcpc/transport/pending_requests.hpp"

#include "mcpc/protocol/json_rpc.hpp"

#include <format>
#include <vector>

namespace mcpc {

Result<std::future<Result<Json>>> PendingRequests::add(std::int64_t id) {
    std::lock_guard lock(mutex_);
    if (closed_with_.has_value()) {
        return tl::unexpected(*closed_with_);
    }
    if (waiters_.contains(id)) {
        return tl::unexpected(Error::protocol(std::format("Request id {} is already in flight", id)));
    }
    auto [it, inserted] = waiters_.emplace(id, std::promise<Result<Json>>{});
    return it->second.get_future();
}

bool PendingRequests::resolve(const Json& response) {
    const auto id = message_id(response);
    if (id.has_value() == false) {
        return false;
    }

    std::promise<Result<Json>> promise;
    {
        std::lock_guard lock(mutex_);
        auto it = waiters_.find(*id);
        if (it == waiters_.end()) {
            return false;
        }
        promise = std::move(it->second);
        waiters_.erase(it);
    }
    promise.set_value(response);
    return true;
}

bool PendingRequests::remove(std::int64_t id) {
    std::lock_guard lock(mutex_);
    return waiters_.erase(id) > 0;
}

void PendingRequests::fail_all(const Error& error) {
    std::vector<std::promise<Result<Json>>> failed;
    {
        std::lock_guard lock(mutex_);
        closed_with_ = error;
        failed.reserve(waiters_.size());
        for (auto& [id, promise] : waiters_) {
            failed.push_back(std::move(promise));
        }
        waiters_.clear();
    }
    for (auto& promise : failed) {
        promise.set_value(tl::unexpected(error));
    }
}

void PendingRequests::reopen() {
    std::lock_guard lock(mutex_);
    closed_with_.reset();
}

std::size_t PendingRequests::size() const {
    std::lock_guard lock(mutex_);
    return waiters_.size();
}

Result<Json> PendingRequests::await(std::int64_t id,
                                    std::future<Result<Json>>& future,
                                    std::chrono::milliseconds timeout) {
    if (future.wait_for(timeout) == std::future_status::ready) {
        return future.get();
    }
    if (remove(id) == false) {
        // resolve() or fail_all() already took the promise and is about to
        // complete it.
        future.wait();
        return future.get();
    }
    return tl::unexpected(Error::protocol(
        std::format("Request {} timed out after {} ms", id, timeout.count())));
}

}  // namespace mcpc
