#pragma once

#include <cstddef>
#include <functional>
#include <utility>

// Separate-chaining hash map. Used by IndexedMaxHeap as its element -> slot
// index, so lookups go through Hash/KeyEqual rather than operator==.
template <typename K, typename V, typename Hash = std::hash<K>,
          typename KeyEqual = std::equal_to<K>>
class HashMap {
private:
    struct Entry {
        K key;
        V value;
        Entry* next;
        Entry(const K& k, const V& v) : key(k), value(v), next(nullptr) {}
    };

    static constexpr std::size_t kInitialCapacity = 16;

public:
    using key_type = K;
    using mapped_type = V;
    using size_type = std::size_t;

    explicit HashMap(const Hash& hash = Hash(), const KeyEqual& equal = KeyEqual())
        : buckets_(new Entry*[kInitialCapacity]()),
          capacity_(kInitialCapacity),
          size_(0),
          hash_(hash),
          equal_(equal) {}

    HashMap(const HashMap& other)
        : buckets_(new Entry*[other.capacity_]()),
          capacity_(other.capacity_),
          size_(0),
          hash_(other.hash_),
          equal_(other.equal_) {
        try {
            copy_entries(other);
        } catch (...) {
            release();
            throw;
        }
    }

    HashMap(HashMap&& other) noexcept
        : buckets_(other.buckets_),
          capacity_(other.capacity_),
          size_(other.size_),
          hash_(std::move(other.hash_)),
          equal_(std::move(other.equal_)) {
        other.buckets_ = nullptr;
        other.capacity_ = 0;
        other.size_ = 0;
    }

    HashMap& operator=(const HashMap& other) {
        if (this != &other) {
            HashMap temp(other);
            swap(temp);
        }
        return *this;
    }

    HashMap& operator=(HashMap&& other) noexcept {
        if (this != &other) {
            release();
            buckets_ = other.buckets_;
            capacity_ = other.capacity_;
            size_ = other.size_;
            hash_ = std::move(other.hash_);
            equal_ = std::move(other.equal_);
            other.buckets_ = nullptr;
            other.capacity_ = 0;
            other.size_ = 0;
        }
        return *this;
    }

    ~HashMap() { release(); }

    void swap(HashMap& other) noexcept {
        std::swap(buckets_, other.buckets_);
        std::swap(capacity_, other.capacity_);
        std::swap(size_, other.size_);
        std::swap(hash_, other.hash_);
        std::swap(equal_, other.equal_);
    }

    // Inserts or overwrites. An existing entry keeps its stored key object.
    void insert(const K& key, const V& value) {
        if (V* existing = find(key)) {
            *existing = value;
            return;
        }
        link(new Entry(key, value));
    }

    V* find(const K& key) {
        Entry* e = find_entry(key);
        return e ? &e->value : nullptr;
    }

    const V* find(const K& key) const {
        const Entry* e = find_entry(key);
        return e ? &e->value : nullptr;
    }

    bool remove(const K& key) {
        if (capacity_ == 0)
            return false;
        size_type idx = bucket_index(key, capacity_);
        Entry* prev = nullptr;
        for (Entry* e = buckets_[idx]; e != nullptr; prev = e, e = e->next) {
            if (equal_(e->key, key)) {
                if (prev == nullptr)
                    buckets_[idx] = e->next;
                else
                    prev->next = e->next;
                delete e;
                --size_;
                return true;
            }
        }
        return false;
    }

    bool contains(const K& key) const {
        return find_entry(key) != nullptr;
    }

    size_type size() const { return size_; }
    bool empty() const { return size_ == 0; }
    void clear() {
        if (buckets_ == nullptr)
            return;
        for (size_type i = 0; i < capacity_; ++i) {
            Entry* e = buckets_[i];
            while (e != nullptr) {
                Entry* next = e->next;
                delete e;
                e = next;
            }
            buckets_[i] = nullptr;
        }
        size_ = 0;
    }

private:
    Entry** buckets_;
    size_type capacity_;
    size_type size_;
    Hash hash_;
    KeyEqual equal_;

    size_type bucket_index(const K& key, size_type capacity) const {
        return hash_(key) % capacity;
    }

    bool should_rehash() const {
        return size_ * 4 > capacity_ * 3;
    }

    // A moved-from map has no buckets; give it a fresh table on reuse.
    void ensure_buckets() {
        if (capacity_ != 0)
            return;
        delete[] buckets_;
        buckets_ = new Entry*[kInitialCapacity]();
        capacity_ = kInitialCapacity;
    }

    void link(Entry* entry) {
        ensure_buckets();
        if (should_rehash())
            rehash();
        size_type idx = bucket_index(entry->key, capacity_);
        entry->next = buckets_[idx];
        buckets_[idx] = entry;
        ++size_;
    }

    void rehash() {
        size_type new_capacity = capacity_ * 2;
        Entry** new_buckets = new Entry*[new_capacity]();
        for (size_type i = 0; i < capacity_; ++i) {
            Entry* e = buckets_[i];
            while (e != nullptr) {
                Entry* next = e->next;
                size_type idx = bucket_index(e->key, new_capacity);
                e->next = new_buckets[idx];
                new_buckets[idx] = e;
                e = next;
            }
        }
        delete[] buckets_;
        buckets_ = new_buckets;
        capacity_ = new_capacity;
    }

    Entry* find_entry(const K& key) const {
        if (capacity_ == 0)
            return nullptr;
        size_type idx = bucket_index(key, capacity_);
        for (Entry* e = buckets_[idx]; e != nullptr; e = e->next) {
            if (equal_(e->key, key))
                return e;
        }
        return nullptr;
    }

    void copy_entries(const HashMap& other) {
        for (size_type i = 0; i < other.capacity_; ++i) {
            for (Entry* e = other.buckets_[i]; e != nullptr; e = e->next)
                insert(e->key, e->value);
        }
    }

    void release() {
        if (buckets_ == nullptr)
            return;
        clear();
        delete[] buckets_;
        buckets_ = nullptr;
        capacity_ = 0;
    }
};
