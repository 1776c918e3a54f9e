#pragma once
// Bounded containers: fixed-capacity history and result stores
//
// RingBuffer keeps the newest N records (call history).
// BoundedMap keeps the newest N keyed results in insertion order
// (chains, trees, verdicts, knowledge blocks). Neither is thread-safe;
// owners guard them with their own mutex.

#include <deque>
#include <unordered_map>
#include <vector>

namespace cortex {

template<typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    void push(T value) {
        if (items_.size() >= capacity_) {
            items_.pop_front();
        }
        items_.push_back(std::move(value));
    }

    // Oldest first
    std::vector<T> to_vector() const {
        return std::vector<T>(items_.begin(), items_.end());
    }

    size_t size() const { return items_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return items_.empty(); }
    void clear() { items_.clear(); }

private:
    size_t capacity_;
    std::deque<T> items_;
};

template<typename K, typename V>
class BoundedMap {
public:
    explicit BoundedMap(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    // Insert or replace. A new key past capacity drops the oldest key.
    void set(const K& key, V value) {
        auto it = items_.find(key);
        if (it != items_.end()) {
            it->second = std::move(value);
            return;
        }
        while (items_.size() >= capacity_ && !order_.empty()) {
            items_.erase(order_.front());
            order_.pop_front();
        }
        order_.push_back(key);
        items_.emplace(key, std::move(value));
    }

    V* get(const K& key) {
        auto it = items_.find(key);
        return it != items_.end() ? &it->second : nullptr;
    }

    const V* get(const K& key) const {
        auto it = items_.find(key);
        return it != items_.end() ? &it->second : nullptr;
    }

    bool contains(const K& key) const { return items_.count(key) > 0; }

    bool erase(const K& key) {
        if (items_.erase(key) == 0) return false;
        for (auto it = order_.begin(); it != order_.end(); ++it) {
            if (*it == key) {
                order_.erase(it);
                break;
            }
        }
        return true;
    }

    // Insertion order, oldest first
    std::vector<V> values() const {
        std::vector<V> out;
        out.reserve(order_.size());
        for (const auto& key : order_) {
            out.push_back(items_.at(key));
        }
        return out;
    }

    size_t size() const { return items_.size(); }
    size_t capacity() const { return capacity_; }
    void clear() {
        items_.clear();
        order_.clear();
    }

private:
    size_t capacity_;
    std::unordered_map<K, V> items_;
    std::deque<K> order_;
};

} // namespace cortex
