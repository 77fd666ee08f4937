#pragma once

#include "Cancellation.hpp"
#include "ResultChannel.hpp"

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

// Duplicate call suppression: for a given key at most one computation is in
// flight, and every caller that asks for the key while it runs gets that
// computation's result. Nothing is cached once the computation completes.
template <typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
class SingleFlight {
public:
    using Function = std::function<V(const CancellationToken&)>;

    struct Stats {
        std::size_t executions = 0;
        std::size_t joins = 0;
        std::size_t forgotten = 0;
        std::size_t in_flight = 0;
    };

    SingleFlight() : SingleFlight(std::max(2u, std::thread::hardware_concurrency())) {}

    // doAsync computations run on an internal pool of worker_threads threads.
    explicit SingleFlight(std::size_t worker_threads)
        : pool_(std::make_unique<boost::asio::thread_pool>(std::max<std::size_t>(1, worker_threads))),
          executor_(pool_->get_executor()) {}

    // doAsync computations are posted to executor, which must outlive the group.
    explicit SingleFlight(boost::asio::any_io_executor executor)
        : executor_(std::move(executor)) {}

    // Waits for computations started by doAsync.
    ~SingleFlight() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            idle_.wait(lock, [this] { return async_pending_ == 0; });
        }
        if (pool_) {
            pool_->join();
        }
    }

    SingleFlight(const SingleFlight&) = delete;
    SingleFlight& operator=(const SingleFlight&) = delete;

    SingleFlight(SingleFlight&&) = delete;
    SingleFlight& operator=(SingleFlight&&) = delete;

    // Runs fn on this thread unless a call for key is already in flight, in
    // which case blocks until that call completes and returns its result.
    // The token is handed to fn as is; the group never interrupts fn.
    Result<V> doCall(const CancellationToken& token, const K& key, Function fn) {
        return execute(token, key, fn, false);
    }

    // Like doCall, but a caller that joined an in-flight call stops waiting
    // when its own token is cancelled and gets CallerCancelled. The
    // computation keeps running for everyone else.
    Result<V> doCallCancellable(const CancellationToken& token, const K& key, Function fn) {
        return execute(token, key, fn, true);
    }

    // Non-blocking form. The returned channel receives the result once. A new
    // computation runs on the group's executor.
    ResultChannel<V> doAsync(const CancellationToken& token, const K& key, Function fn) {
        ResultChannel<V> channel;
        std::shared_ptr<Call> call;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = calls_.find(key);
            if (it != calls_.end()) {
                it->second->dups++;
                it->second->channels.push_back(channel);
                stats_.joins++;
                spdlog::debug("[SingleFlight] Subscribed to in-flight call ({} duplicates)",
                              it->second->dups);
                return channel;
            }

            call = std::make_shared<Call>();
            call->channels.push_back(channel);
            calls_.emplace(key, call);
            stats_.executions++;
            async_pending_++;
        }

        spdlog::debug("[SingleFlight] Scheduling new async call");
        boost::asio::post(executor_, [this, token, call, key, fn = std::move(fn)]() mutable {
            runCall(token, call, key, fn);

            std::lock_guard<std::mutex> lock(mutex_);
            async_pending_--;
            idle_.notify_all();
        });
        return channel;
    }

    // Forgets key unless another caller has joined its in-flight call, so the
    // next caller starts a fresh computation. Returns true if key is now
    // absent, false if the call is shared and was kept.
    bool forgetUnshared(const K& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(key);
        if (it == calls_.end()) {
            return true;
        }
        if (it->second->dups == 0) {
            calls_.erase(it);
            stats_.forgotten++;
            spdlog::debug("[SingleFlight] Forgot unshared call");
            return true;
        }
        return false;
    }

    Stats getStats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        Stats stats = stats_;
        stats.in_flight = calls_.size();
        return stats;
    }

private:
    // value and error are written once by the task running the computation
    // before done is set. dups and channels change only under mutex_ while
    // done is false.
    struct Call {
        std::condition_variable done_cv;
        bool done = false;
        V value{};
        std::exception_ptr error;
        std::size_t dups = 0;
        std::vector<ResultChannel<V>> channels;
    };

    Result<V> execute(const CancellationToken& token, const K& key, Function& fn, bool cancellable) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = calls_.find(key);
        if (it != calls_.end()) {
            std::shared_ptr<Call> call = it->second;
            call->dups++;
            stats_.joins++;
            spdlog::debug("[SingleFlight] Joined in-flight call ({} duplicates)", call->dups);

            if (cancellable && token.canBeCancelled()) {
                return waitCancellable(lock, token, call);
            }
            call->done_cv.wait(lock, [&call] { return call->done; });
            return Result<V>{call->value, call->error, true};
        }

        auto call = std::make_shared<Call>();
        calls_.emplace(key, call);
        stats_.executions++;
        lock.unlock();

        runCall(token, call, key, fn);

        // dups is final: joiners only reach a call through calls_, and runCall
        // removed it from there when it completed.
        return Result<V>{call->value, call->error, call->dups > 0};
    }

    Result<V> waitCancellable(std::unique_lock<std::mutex>& lock, const CancellationToken& token,
                              const std::shared_ptr<Call>& call) {
        // The callback takes mutex_, so it must be registered with the lock
        // released; it may run right away.
        lock.unlock();
        CancellationRegistration registration = token.registerCallback([this, call] {
            std::lock_guard<std::mutex> guard(mutex_);
            call->done_cv.notify_all();
        });
        lock.lock();

        call->done_cv.wait(lock, [&call, &token] {
            return call->done || token.isCancellationRequested();
        });

        Result<V> result;
        result.shared = true;
        if (call->done) {
            result.value = call->value;
            result.error = call->error;
        } else {
            result.error = std::make_exception_ptr(CallerCancelled());
            spdlog::debug("[SingleFlight] Caller cancelled while waiting on shared call");
        }

        // Resetting the registration may wait for the callback, which needs mutex_.
        lock.unlock();
        registration.reset();
        return result;
    }

    void runCall(const CancellationToken& token, const std::shared_ptr<Call>& call,
                 const K& key, Function& fn) {
        try {
            call->value = fn(token);
        } catch (...) {
            call->error = std::current_exception();
        }

        std::vector<ResultChannel<V>> channels;
        Result<V> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            call->done = true;
            call->done_cv.notify_all();

            // The key may have been forgotten and taken by a newer call.
            auto it = calls_.find(key);
            if (it != calls_.end() && it->second == call) {
                calls_.erase(it);
            }

            channels.swap(call->channels);
            result = Result<V>{call->value, call->error, call->dups > 0};
        }

        // Channel callbacks may call back into the group, so deliver unlocked.
        // A failed delivery must not keep the rest of the channels waiting.
        for (auto& channel : channels) {
            try {
                channel.deliver(result);
            } catch (const std::exception& e) {
                spdlog::error("[SingleFlight] Delivery error: {}", e.what());
            } catch (...) {
                spdlog::error("[SingleFlight] Delivery error: unknown exception");
            }
        }

        if (!channels.empty()) {
            spdlog::debug("[SingleFlight] Delivered result to {} subscribers", channels.size());
        }
    }

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::unordered_map<K, std::shared_ptr<Call>, Hash, KeyEqual> calls_;
    Stats stats_;
    std::size_t async_pending_ = 0;

    std::unique_ptr<boost::asio::thread_pool> pool_;
    boost::asio::any_io_executor executor_;
};
