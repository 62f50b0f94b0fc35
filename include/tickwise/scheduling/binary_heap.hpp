// Tickwise Scheduling
// binary_heap.hpp - Mutable binary min-heap keyed by an external extractor

#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tickwise::scheduling {

// ============================================================================
// BinaryHeap
// ============================================================================

// Array-backed min-heap over elements whose key is read through a caller
// supplied function. Keys are never cached: every comparison re-reads them,
// so a caller may shift keys between operations as long as the relative
// order is preserved (e.g. subtracting the same amount from every key).
//
// Elements are identified by value equality (pointer identity when T is a
// pointer) and may appear at most once. Ties on the key are broken by
// insertion sequence, giving FIFO order among equal keys.
//
// The heap does not own what its elements point to.
template<typename T, typename Hash = std::hash<T>>
class BinaryHeap {
public:
    using KeyFunction = std::function<double(const T&)>;

    explicit BinaryHeap(KeyFunction key_fn) : key_fn_(std::move(key_fn)) {}

    // Non-copyable, movable
    BinaryHeap(const BinaryHeap&) = delete;
    BinaryHeap& operator=(const BinaryHeap&) = delete;
    BinaryHeap(BinaryHeap&&) noexcept = default;
    BinaryHeap& operator=(BinaryHeap&&) noexcept = default;

    // ========================================================================
    // Insertion
    // ========================================================================

    // Insert one element. Rejected (returns false, heap untouched) when the
    // key is not finite or the element is already present.
    bool push(const T& value) {
        if (!accepts(value)) {
            return false;
        }
        append(value);
        sift_up(nodes_.size() - 1);
        return true;
    }

    // Insert elements in span order, returns how many were accepted.
    // Large batches are re-heapified bottom-up instead of sifted one by one.
    size_t push_all(std::span<const T> values) {
        const size_t first_new = nodes_.size();
        for (const T& value : values) {
            if (accepts(value)) {
                append(value);
            }
        }

        const size_t added = nodes_.size() - first_new;
        if (added == 0) {
            return 0;
        }

        if (added > first_new) {
            for (size_t i = nodes_.size() / 2; i-- > 0;) {
                sift_down(i);
            }
        } else {
            for (size_t i = first_new; i < nodes_.size(); ++i) {
                sift_up(i);
            }
        }
        return added;
    }

    // ========================================================================
    // Access
    // ========================================================================

    // Minimum element, or nullopt when empty
    [[nodiscard]] std::optional<T> peek() const {
        if (nodes_.empty()) {
            return std::nullopt;
        }
        return nodes_.front().value;
    }

    // Element at internal array rank [0, size). Order is heap order, not sorted.
    [[nodiscard]] const T& peek(size_t rank) const {
        if (rank >= nodes_.size()) {
            throw std::out_of_range("BinaryHeap::peek rank " + std::to_string(rank) + " out of range (size " +
                                    std::to_string(nodes_.size()) + ")");
        }
        return nodes_[rank].value;
    }

    // Remove and return the minimum element, or nullopt when empty
    std::optional<T> pop() {
        if (nodes_.empty()) {
            return std::nullopt;
        }
        T result = nodes_.front().value;
        erase_at(0);
        return result;
    }

    // Remove an element by identity, wherever it sits. False if absent.
    bool remove(const T& value) {
        auto it = index_.find(value);
        if (it == index_.end()) {
            return false;
        }
        erase_at(it->second);
        return true;
    }

    [[nodiscard]] bool contains(const T& value) const { return index_.find(value) != index_.end(); }

    [[nodiscard]] size_t size() const { return nodes_.size(); }
    [[nodiscard]] bool empty() const { return nodes_.empty(); }

    void clear() {
        nodes_.clear();
        index_.clear();
    }

    // Check heap ordering and index consistency
    [[nodiscard]] bool validate() const {
        if (index_.size() != nodes_.size()) {
            return false;
        }
        for (size_t i = 0; i < nodes_.size(); ++i) {
            auto it = index_.find(nodes_[i].value);
            if (it == index_.end() || it->second != i) {
                return false;
            }
            if (i > 0 && less(i, (i - 1) / 2)) {
                return false;
            }
        }
        return true;
    }

private:
    struct Node {
        T value;
        uint64_t sequence;
    };

    [[nodiscard]] bool accepts(const T& value) const {
        return std::isfinite(key_fn_(value)) && !contains(value);
    }

    void append(const T& value) {
        index_.emplace(value, nodes_.size());
        nodes_.push_back(Node{value, next_sequence_++});
    }

    // Strict (key, sequence) ordering between two slots
    [[nodiscard]] bool less(size_t a, size_t b) const {
        const double key_a = key_fn_(nodes_[a].value);
        const double key_b = key_fn_(nodes_[b].value);
        if (key_a != key_b) {
            return key_a < key_b;
        }
        return nodes_[a].sequence < nodes_[b].sequence;
    }

    void swap_nodes(size_t a, size_t b) {
        std::swap(nodes_[a], nodes_[b]);
        index_[nodes_[a].value] = a;
        index_[nodes_[b].value] = b;
    }

    void erase_at(size_t pos) {
        const size_t last = nodes_.size() - 1;
        index_.erase(nodes_[pos].value);
        if (pos != last) {
            nodes_[pos] = std::move(nodes_[last]);
            index_[nodes_[pos].value] = pos;
        }
        nodes_.pop_back();

        if (pos < nodes_.size()) {
            if (pos > 0 && less(pos, (pos - 1) / 2)) {
                sift_up(pos);
            } else {
                sift_down(pos);
            }
        }
    }

    void sift_up(size_t pos) {
        while (pos > 0) {
            const size_t parent = (pos - 1) / 2;
            if (!less(pos, parent)) {
                break;
            }
            swap_nodes(pos, parent);
            pos = parent;
        }
    }

    void sift_down(size_t pos) {
        const size_t count = nodes_.size();
        while (true) {
            const size_t left = 2 * pos + 1;
            const size_t right = left + 1;
            size_t smallest = pos;

            if (left < count && less(left, smallest)) {
                smallest = left;
            }
            if (right < count && less(right, smallest)) {
                smallest = right;
            }
            if (smallest == pos) {
                break;
            }
            swap_nodes(pos, smallest);
            pos = smallest;
        }
    }

    KeyFunction key_fn_;
    std::vector<Node> nodes_;
    std::unordered_map<T, size_t, Hash> index_;
    uint64_t next_sequence_ = 0;
};

}  // namespace tickwise::scheduling
