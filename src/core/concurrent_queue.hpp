/**
 * @file concurrent_queue.hpp
 * @brief Unbounded lock-free multi-producer / single-consumer queue.
 *
 * Producers link nodes with a single atomic exchange on the head; the one
 * consumer walks from the tail. Elements from one producer come out in the
 * order that producer pushed them.
 *
 * A push that has exchanged the head but not yet published its link is not
 * visible to the consumer until it does; try_pop() simply reports empty in
 * that window.
 */

#pragma once

#include <atomic>
#include <optional>
#include <utility>

namespace diagnostics_engine {

template <typename T>
class ConcurrentQueue {
public:
    ConcurrentQueue() {
        auto* stub = new Node;
        head_.store(stub, std::memory_order_relaxed);
        tail_ = stub;
    }

    ~ConcurrentQueue() {
        while (try_pop()) {}
        delete tail_;
    }

    ConcurrentQueue(const ConcurrentQueue&) = delete;
    ConcurrentQueue& operator=(const ConcurrentQueue&) = delete;

    /// Safe to call from any number of threads.
    void push(T value) {
        auto* node = new Node;
        node->value.emplace(std::move(value));
        Node* prev = head_.exchange(node, std::memory_order_acq_rel);
        prev->next.store(node, std::memory_order_release);
    }

    /// Consumer side only.
    std::optional<T> try_pop() {
        Node* tail = tail_;
        Node* next = tail->next.load(std::memory_order_acquire);
        if (next == nullptr) return std::nullopt;

        std::optional<T> value = std::move(next->value);
        next->value.reset();
        tail_ = next;
        delete tail;
        return value;
    }

    /// Consumer side only.
    [[nodiscard]] bool empty() const {
        return tail_->next.load(std::memory_order_acquire) == nullptr;
    }

private:
    struct Node {
        std::atomic<Node*> next{nullptr};
        std::optional<T> value;
    };

    std::atomic<Node*> head_;
    Node* tail_;
};

}  // namespace diagnostics_engine
