#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>

// Reported to a caller whose own token fired before the result it was
// waiting on became available.
class CallerCancelled : public std::runtime_error {
public:
    CallerCancelled() : std::runtime_error("caller cancelled") {}
};

class CancellationToken;

namespace detail {

struct CancellationState {
    std::mutex mutex;
    std::condition_variable callback_done;
    bool cancelled = false;
    std::uint64_t next_id = 0;
    std::unordered_map<std::uint64_t, std::function<void()>> callbacks;

    // Id of the callback cancel() is running right now and the thread
    // running it, so unregister() can wait for it to return.
    std::uint64_t running_id = 0;
    std::thread::id running_thread;
};

}

class CancellationRegistration {
public:
    CancellationRegistration() = default;
    ~CancellationRegistration();

    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    // Removes the callback. If it is running on another thread, waits
    // until it returns.
    void reset();

private:
    friend class CancellationToken;

    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, std::uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::shared_ptr<detail::CancellationState> state_;
    std::uint64_t id_ = 0;
};

class CancellationToken {
public:
    // A default token is never cancelled.
    CancellationToken() = default;

    bool isCancellationRequested() const;
    bool canBeCancelled() const { return state_ != nullptr; }

    // Runs callback once when cancellation is requested, or right away on
    // this thread if it already was.
    CancellationRegistration registerCallback(std::function<void()> callback) const;

    bool operator==(const CancellationToken& other) const { return state_ == other.state_; }
    bool operator!=(const CancellationToken& other) const { return state_ != other.state_; }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource();

    // First call runs every registered callback on this thread; later
    // calls do nothing.
    void cancel();

    bool isCancellationRequested() const;
    CancellationToken getToken() const { return CancellationToken(state_); }

private:
    std::shared_ptr<detail::CancellationState> state_;
};
