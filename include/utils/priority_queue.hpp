#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace utils {

using Priority = std::uint64_t;

class EmptyQueue : public std::logic_error {
public:
    EmptyQueue() : std::logic_error("priority queue is empty") {}
};

class IndexOutOfRange : public std::out_of_range {
public:
    IndexOutOfRange(std::size_t index, std::size_t size)
        : std::out_of_range("priority queue index " + std::to_string(index) +
                            " out of range (size " + std::to_string(size) + ")")
    {}
};

/**
 * Array-backed binary max-heap keyed by a 64-bit priority.
 *
 *  - Every node's priority is >= the priorities of its children.
 *  - Each entry gets a sequence number on insert. Among equal priorities
 *    the lower sequence (older entry) is extracted first.
 *  - reinsert() puts an extracted entry back with its original sequence,
 *    so a partially consumed payload keeps its place in line.
 *
 * Not thread-safe.
 */
template <typename T>
class PriorityQueue {
public:
    struct Entry {
        Priority      priority{0};
        std::uint64_t sequence{0};
        T             payload{};
    };

    PriorityQueue() = default;

    std::uint64_t insert(Priority priority, T payload) {
        const std::uint64_t seq = next_sequence_++;
        push(Entry{priority, seq, std::move(payload)});
        return seq;
    }

    void reinsert(Entry entry) {
        if (entry.sequence >= next_sequence_) {
            next_sequence_ = entry.sequence + 1;
        }
        push(std::move(entry));
    }

    Entry extract_max() {
        if (heap_.empty()) {
            throw EmptyQueue();
        }

        Entry top = std::move(heap_.front());
        if (heap_.size() > 1) {
            heap_.front() = std::move(heap_.back());
        }
        heap_.pop_back();

        if (!heap_.empty()) {
            sift_down(0);
        }
        return top;
    }

    // Removes the entry with this sequence wherever it sits in the heap.
    // Returns false if no such entry is queued.
    bool erase(std::uint64_t sequence) {
        auto it = std::find_if(heap_.begin(), heap_.end(),
                               [sequence](const Entry& e) { return e.sequence == sequence; });
        if (it == heap_.end()) {
            return false;
        }

        const std::size_t idx = static_cast<std::size_t>(it - heap_.begin());
        if (idx + 1 == heap_.size()) {
            heap_.pop_back();
            return true;
        }

        heap_[idx] = std::move(heap_.back());
        heap_.pop_back();

        if (idx > 0 && before(heap_[idx], heap_[(idx - 1) / 2])) {
            sift_up(idx);
        } else {
            sift_down(idx);
        }
        return true;
    }

    const Entry& top() const {
        if (heap_.empty()) {
            throw EmptyQueue();
        }
        return heap_.front();
    }

    // Storage order, not priority order.
    const Entry& peek_at(std::size_t index) const {
        if (index >= heap_.size()) {
            throw IndexOutOfRange(index, heap_.size());
        }
        return heap_[index];
    }

    std::size_t size() const noexcept { return heap_.size(); }
    bool empty() const noexcept { return heap_.empty(); }

    void reserve(std::size_t n) { heap_.reserve(n); }

    void clear() noexcept {
        heap_.clear();
        next_sequence_ = 0;
    }

    typename std::vector<Entry>::const_iterator begin() const noexcept { return heap_.begin(); }
    typename std::vector<Entry>::const_iterator end() const noexcept { return heap_.end(); }

private:
    // a is served before b
    static bool before(const Entry& a, const Entry& b) noexcept {
        if (a.priority != b.priority) {
            return a.priority > b.priority;
        }
        return a.sequence < b.sequence;
    }

    void push(Entry entry) {
        heap_.push_back(std::move(entry));
        sift_up(heap_.size() - 1);
    }

    void sift_up(std::size_t idx) {
        while (idx > 0) {
            std::size_t parent = (idx - 1) / 2;
            if (!before(heap_[idx], heap_[parent])) {
                break;
            }
            std::swap(heap_[idx], heap_[parent]);
            idx = parent;
        }
    }

    void sift_down(std::size_t idx) {
        const std::size_t n = heap_.size();
        for (;;) {
            std::size_t left  = 2 * idx + 1;
            std::size_t right = left + 1;
            std::size_t best  = idx;

            if (left < n && before(heap_[left], heap_[best])) {
                best = left;
            }
            if (right < n && before(heap_[right], heap_[best])) {
                best = right;
            }
            if (best == idx) {
                return;
            }
            std::swap(heap_[idx], heap_[best]);
            idx = best;
        }
    }

    std::vector<Entry> heap_;
    std::uint64_t      next_sequence_{0};
};

} // namespace utils
