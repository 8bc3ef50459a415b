#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

namespace panelbridge {

enum class TryReceive { Item, Empty, Disconnected };

// Unbounded FIFO queue between threads. Senders are copyable (one copy per
// producer), the receiver is unique. Dropping the receiver makes every send
// fail; dropping the last sender makes an empty receiver report Disconnected.
template <typename T>
class Channel {
    struct Shared {
        std::mutex mutex;
        std::deque<T> queue;
        std::size_t senders = 0;
        bool receiverAlive = true;
    };

public:
    class Sender {
    public:
        Sender() = default;
        explicit Sender(std::shared_ptr<Shared> shared) : shared_(std::move(shared)) {
            std::lock_guard<std::mutex> lock(shared_->mutex);
            ++shared_->senders;
        }
        Sender(const Sender& other) : shared_(other.shared_) {
            if (shared_) {
                std::lock_guard<std::mutex> lock(shared_->mutex);
                ++shared_->senders;
            }
        }
        Sender(Sender&& other) noexcept : shared_(std::move(other.shared_)) {}
        Sender& operator=(Sender other) noexcept {
            std::swap(shared_, other.shared_);
            return *this;
        }
        ~Sender() { release(); }

        // False when the receiver is gone; the value is dropped.
        bool send(T value) const {
            if (!shared_) {
                return false;
            }
            std::lock_guard<std::mutex> lock(shared_->mutex);
            if (!shared_->receiverAlive) {
                return false;
            }
            shared_->queue.push_back(std::move(value));
            return true;
        }

        bool valid() const { return static_cast<bool>(shared_); }

    private:
        void release() {
            if (!shared_) {
                return;
            }
            std::lock_guard<std::mutex> lock(shared_->mutex);
            --shared_->senders;
        }

        std::shared_ptr<Shared> shared_;
    };

    class Receiver {
    public:
        Receiver() = default;
        explicit Receiver(std::shared_ptr<Shared> shared) : shared_(std::move(shared)) {}
        Receiver(const Receiver&) = delete;
        Receiver& operator=(const Receiver&) = delete;
        Receiver(Receiver&& other) noexcept : shared_(std::move(other.shared_)) {}
        Receiver& operator=(Receiver&& other) noexcept {
            if (this != &other) {
                release();
                shared_ = std::move(other.shared_);
            }
            return *this;
        }
        ~Receiver() { release(); }

        TryReceive tryReceive(T& out) {
            if (!shared_) {
                return TryReceive::Disconnected;
            }
            std::lock_guard<std::mutex> lock(shared_->mutex);
            if (!shared_->queue.empty()) {
                out = std::move(shared_->queue.front());
                shared_->queue.pop_front();
                return TryReceive::Item;
            }
            return shared_->senders == 0 ? TryReceive::Disconnected : TryReceive::Empty;
        }

        bool valid() const { return static_cast<bool>(shared_); }

    private:
        void release() {
            if (!shared_) {
                return;
            }
            std::lock_guard<std::mutex> lock(shared_->mutex);
            shared_->receiverAlive = false;
            shared_->queue.clear();
        }

        std::shared_ptr<Shared> shared_;
    };

    static std::pair<Sender, Receiver> create() {
        auto shared = std::make_shared<Shared>();
        Sender tx(shared);
        Receiver rx(shared);
        return {std::move(tx), std::move(rx)};
    }
};

template <typename T>
using Sender = typename Channel<T>::Sender;

template <typename T>
using Receiver = typename Channel<T>::Receiver;

}  // namespace panelbridge
