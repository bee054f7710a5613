#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace esc::services {

// Keeps a listener registered for as long as it lives.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}
    ~Subscription() { cancel(); }

    Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) {
        other.cancel_ = nullptr;
    }
    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            cancel();
            cancel_ = std::move(other.cancel_);
            other.cancel_ = nullptr;
        }
        return *this;
    }
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void cancel() {
        if (cancel_) {
            auto cancel = std::move(cancel_);
            cancel_ = nullptr;
            cancel();
        }
    }

    bool active() const noexcept { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

// Multicast channel. Listeners see only values published after they subscribe;
// nothing is buffered or replayed.
template <typename T>
class Broadcast {
public:
    using Listener = std::function<void(const T&)>;

    Broadcast() : state_(std::make_shared<State>()) {}

    Subscription subscribe(Listener listener) {
        std::lock_guard lock(state_->mutex);
        if (state_->closed) return Subscription();

        uint64_t key = state_->next_key++;
        state_->listeners.emplace(key, std::move(listener));

        std::weak_ptr<State> weak = state_;
        return Subscription([weak, key]() {
            if (auto state = weak.lock()) {
                std::lock_guard lock(state->mutex);
                state->listeners.erase(key);
            }
        });
    }

    void publish(const T& value) {
        std::map<uint64_t, Listener> listeners;
        {
            std::lock_guard lock(state_->mutex);
            if (state_->closed) return;
            listeners = state_->listeners;
        }
        for (const auto& [key, listener] : listeners) {
            listener(value);
        }
    }

    void close() {
        std::lock_guard lock(state_->mutex);
        state_->closed = true;
        state_->listeners.clear();
    }

    bool closed() const {
        std::lock_guard lock(state_->mutex);
        return state_->closed;
    }

    size_t listener_count() const {
        std::lock_guard lock(state_->mutex);
        return state_->listeners.size();
    }

private:
    struct State {
        std::mutex mutex;
        std::map<uint64_t, Listener> listeners;
        uint64_t next_key{0};
        bool closed{false};
    };

    std::shared_ptr<State> state_;
};

} // namespace esc::services
