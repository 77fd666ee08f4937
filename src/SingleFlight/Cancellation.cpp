#include "Cancellation.hpp"
#include <spdlog/spdlog.h>
#include <utility>

CancellationRegistration::~CancellationRegistration() {
    reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (!state_) {
        return;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->callbacks.erase(id_) == 0 &&
        state_->running_thread != std::this_thread::get_id()) {
        state_->callback_done.wait(lock, [this] { return state_->running_id != id_; });
    }
    lock.unlock();

    state_.reset();
    id_ = 0;
}

bool CancellationToken::isCancellationRequested() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationRegistration CancellationToken::registerCallback(std::function<void()> callback) const {
    if (!state_) {
        return CancellationRegistration();
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            std::uint64_t id = ++state_->next_id;
            state_->callbacks.emplace(id, std::move(callback));
            return CancellationRegistration(state_, id);
        }
    }

    callback();
    return CancellationRegistration();
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {
}

void CancellationSource::cancel() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        return;
    }
    state_->cancelled = true;
    state_->running_thread = std::this_thread::get_id();

    while (!state_->callbacks.empty()) {
        auto it = state_->callbacks.begin();
        std::uint64_t id = it->first;
        std::function<void()> callback = std::move(it->second);
        state_->callbacks.erase(it);
        state_->running_id = id;
        lock.unlock();

        try {
            callback();
        } catch (const std::exception& e) {
            spdlog::error("[Cancellation] Callback error: {}", e.what());
        }

        lock.lock();
        state_->running_id = 0;
        state_->callback_done.notify_all();
    }

    state_->running_thread = std::thread::id();
}

bool CancellationSource::isCancellationRequested() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}
