#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include <spdlog/spdlog.h>

// Outcome of one coalesced computation as seen by one caller.
template <typename V>
struct Result {
    V value{};
    std::exception_ptr error;
    bool shared = false;

    bool ok() const { return !error; }

    // Returns the value or rethrows the computation's exception.
    const V& get() const {
        if (error) {
            std::rethrow_exception(error);
        }
        return value;
    }
};

// Single-slot sink that receives exactly one Result. Copies refer to the
// same slot.
template <typename V>
class ResultChannel {
public:
    using Callback = std::function<void(const Result<V>&)>;

    ResultChannel() : state_(std::make_shared<State>()) {}

    // Stores the result and wakes every waiter. Returns false if a result
    // was already delivered; the slot keeps the first one.
    bool deliver(Result<V> result) const {
        std::vector<Callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->result) {
                return false;
            }
            state_->result = std::move(result);
            callbacks.swap(state_->callbacks);
        }
        state_->ready.notify_all();

        for (auto& callback : callbacks) {
            try {
                callback(*state_->result);
            } catch (const std::exception& e) {
                spdlog::error("[ResultChannel] Callback error: {}", e.what());
            } catch (...) {
                spdlog::error("[ResultChannel] Callback error: unknown exception");
            }
        }
        return true;
    }

    Result<V> get() const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->ready.wait(lock, [this] { return state_->result.has_value(); });
        return *state_->result;
    }

    template <typename Rep, typename Period>
    std::optional<Result<V>> waitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (!state_->ready.wait_for(lock, timeout, [this] { return state_->result.has_value(); })) {
            return std::nullopt;
        }
        return state_->result;
    }

    std::optional<Result<V>> tryGet() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->result;
    }

    bool ready() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->result.has_value();
    }

    // Runs callback once with the result: on the delivering thread, or
    // immediately here if the result is already in.
    void onReady(Callback callback) const {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->result) {
                state_->callbacks.push_back(std::move(callback));
                return;
            }
        }
        callback(*state_->result);
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable ready;
        std::optional<Result<V>> result;
        std::vector<Callback> callbacks;
    };

    std::shared_ptr<State> state_;
};
