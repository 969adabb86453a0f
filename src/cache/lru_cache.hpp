#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace secretcache {

/**
 * LRU cache statistics
 */
struct CacheStats {
    size_t hits;
    size_t misses;
    size_t evictions;
    size_t entries_count;
};

/**
 * Fixed-capacity LRU cache
 *
 * Features:
 * - O(1) get / insert / promote
 * - Nodes live in an index-addressed arena; evicted slots go on a free-list
 * - Eviction is silent (no callbacks)
 * - Capacity 0 retains nothing (caching disabled)
 * - Thread-safe: one mutex per instance guards every operation
 */
template <typename K, typename V>
class LRUCache {
public:
    /**
     * Constructor
     * @param capacity Maximum number of entries (default: 1024)
     */
    explicit LRUCache(size_t capacity = 1024)
        : capacity_(capacity)
        , head_(NIL)
        , tail_(NIL)
        , free_(NIL)
        , hits_(0)
        , misses_(0)
        , evictions_(0)
    {
    }

    LRUCache(const LRUCache&) = delete;
    LRUCache& operator=(const LRUCache&) = delete;

    /**
     * Get entry and mark it most recently used
     * @param key Cache key
     * @return Value if present, std::nullopt otherwise
     */
    std::optional<V> get(const K& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            misses_++;
            return std::nullopt;
        }

        move_to_head(it->second);
        hits_++;
        return nodes_[it->second].value;
    }

    /**
     * Insert entry if the key is not already present
     *
     * An existing entry is left untouched and not promoted.
     *
     * @return true if the value was inserted
     */
    bool put_if_absent(const K& key, V value) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (index_.count(key) != 0) {
            return false;
        }
        insert(key, std::move(value));
        return true;
    }

    /**
     * Get entry, creating it with factory() on a miss
     *
     * Lookup, creation and insertion happen under one lock hold. The created
     * value is returned even if it was evicted immediately (capacity 0).
     * factory() must not call back into this cache.
     */
    template <typename Factory>
    V get_or_put(const K& key, Factory&& factory) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = index_.find(key);
        if (it != index_.end()) {
            move_to_head(it->second);
            hits_++;
            return nodes_[it->second].value;
        }

        misses_++;
        V value = factory();
        insert(key, value);
        return value;
    }

    /**
     * Check presence without touching recency
     */
    bool contains(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.count(key) != 0;
    }

    /**
     * Visit every value, most recently used first, without promoting
     */
    template <typename Visitor>
    void for_each(Visitor&& visit) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = head_; i != NIL; i = nodes_[i].next) {
            visit(nodes_[i].key, nodes_[i].value);
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

    size_t capacity() const { return capacity_; }

    /**
     * Get cache statistics
     */
    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);

        CacheStats stats;
        stats.hits = hits_;
        stats.misses = misses_;
        stats.evictions = evictions_;
        stats.entries_count = index_.size();
        return stats;
    }

private:
    static constexpr size_t NIL = static_cast<size_t>(-1);

    struct Node {
        K key;
        V value;
        size_t prev;
        size_t next;
    };

    const size_t capacity_;
    mutable std::mutex mutex_;

    std::vector<Node> nodes_;
    std::unordered_map<K, size_t> index_;
    size_t head_;
    size_t tail_;
    size_t free_;  // Head of the free-list, chained through Node::next

    size_t hits_;
    size_t misses_;
    size_t evictions_;

    // Caller holds mutex_
    void insert(const K& key, V value) {
        size_t slot;
        if (free_ != NIL) {
            slot = free_;
            free_ = nodes_[slot].next;
            nodes_[slot].key = key;
            nodes_[slot].value = std::move(value);
        } else {
            slot = nodes_.size();
            nodes_.push_back(Node{key, std::move(value), NIL, NIL});
        }

        nodes_[slot].prev = NIL;
        nodes_[slot].next = NIL;
        link_at_head(slot);
        index_[key] = slot;

        if (index_.size() > capacity_) {
            evict_lru();
        }
    }

    void evict_lru() {
        size_t slot = tail_;
        unlink(slot);
        index_.erase(nodes_[slot].key);

        // Drop the value now so the evicted object is released promptly
        nodes_[slot].value = V();
        nodes_[slot].next = free_;
        free_ = slot;
        evictions_++;
    }

    void move_to_head(size_t slot) {
        if (slot == head_) {
            return;
        }
        unlink(slot);
        link_at_head(slot);
    }

    void link_at_head(size_t slot) {
        nodes_[slot].prev = NIL;
        nodes_[slot].next = head_;
        if (head_ != NIL) {
            nodes_[head_].prev = slot;
        }
        head_ = slot;
        if (tail_ == NIL) {
            tail_ = slot;
        }
    }

    void unlink(size_t slot) {
        Node& node = nodes_[slot];
        if (node.prev != NIL) {
            nodes_[node.prev].next = node.next;
        } else {
            head_ = node.next;
        }
        if (node.next != NIL) {
            nodes_[node.next].prev = node.prev;
        } else {
            tail_ = node.prev;
        }
        node.prev = NIL;
        node.next = NIL;
    }
};

} // namespace secretcache
