#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <utility>
#include <vector>

#include "hash_map.hpp"

// Array-backed binary max-heap that also tracks where every element sits,
// so arbitrary elements can be removed or re-prioritised in O(log n).
//
// Compare ranks elements (comp(a, b) means a ranks below b). Hash and
// KeyEqual identify an element in the position index, which maps each key to
// every slot holding an equal element, so duplicates are allowed. remove()
// and update_priority() locate their target by the value it was inserted
// with, so that value must still hash and compare equal to the stored one.
template <typename T, typename Compare = std::less<T>, typename Hash = std::hash<T>,
          typename KeyEqual = std::equal_to<T>>
class IndexedMaxHeap {
public:
    using value_type = T;
    using size_type = std::size_t;
    using value_compare = Compare;

    IndexedMaxHeap()
        : data_(nullptr), size_(0), capacity_(0), index_(), comp_() {}

    explicit IndexedMaxHeap(const Compare& comp, const Hash& hash = Hash(),
                            const KeyEqual& equal = KeyEqual())
        : data_(nullptr), size_(0), capacity_(0), index_(hash, equal), comp_(comp) {}

    IndexedMaxHeap(const IndexedMaxHeap& other)
        : data_(nullptr), size_(0), capacity_(0), index_(other.index_), comp_(other.comp_) {
        T* copy = other.capacity_ > 0 ? new T[other.capacity_] : nullptr;
        try {
            for (size_type i = 0; i < other.size_; ++i)
                copy[i] = other.data_[i];
        } catch (...) {
            delete[] copy;
            throw;
        }
        data_ = copy;
        size_ = other.size_;
        capacity_ = other.capacity_;
    }

    IndexedMaxHeap(IndexedMaxHeap&& other) noexcept
        : data_(other.data_),
          size_(other.size_),
          capacity_(other.capacity_),
          index_(std::move(other.index_)),
          comp_(std::move(other.comp_)) {
        other.data_ = nullptr;
        other.size_ = 0;
        other.capacity_ = 0;
    }

    IndexedMaxHeap& operator=(const IndexedMaxHeap& other) {
        IndexedMaxHeap temp(other);
        swap(temp);
        return *this;
    }

    IndexedMaxHeap& operator=(IndexedMaxHeap&& other) noexcept {
        if (this != &other) {
            delete[] data_;
            data_ = other.data_;
            size_ = other.size_;
            capacity_ = other.capacity_;
            index_ = std::move(other.index_);
            comp_ = std::move(other.comp_);
            other.data_ = nullptr;
            other.size_ = 0;
            other.capacity_ = 0;
        }
        return *this;
    }

    ~IndexedMaxHeap() { delete[] data_; }

    void swap(IndexedMaxHeap& other) noexcept {
        std::swap(data_, other.data_);
        std::swap(size_, other.size_);
        std::swap(capacity_, other.capacity_);
        index_.swap(other.index_);
        std::swap(comp_, other.comp_);
    }

    // Copies first: `value` may refer into the storage that reserve() frees.
    void insert(const T& value) {
        insert(T(value));
    }

    void insert(T&& value) {
        if (size_ == capacity_)
            reserve(capacity_ == 0 ? 1 : capacity_ * 2);
        data_[size_] = std::move(value);
        add_slot(data_[size_], size_);
        ++size_;
        sift_up(size_ - 1);
    }

    // nullptr when the heap is empty.
    const T* peek_max() const {
        return size_ == 0 ? nullptr : &data_[0];
    }

    // Moves the top element into `out`. Returns false on an empty heap.
    bool extract_max(T& out) {
        if (size_ == 0)
            return false;
        drop_slot(data_[0], 0);
        out = std::move(data_[0]);
        --size_;
        if (size_ > 0) {
            place(0, size_);
            sift_down(0);
        }
        return true;
    }

    // Removes one occurrence of `value`.
    bool remove(const T& value) {
        const Slots* slots = index_.find(value);
        if (slots == nullptr)
            return false;
        size_type idx = slots->back();
        drop_slot(value, idx);
        --size_;
        if (idx != size_) {
            place(idx, size_);
            restore(idx);
        }
        return true;
    }

    // Replaces one occurrence of `old_value` with `new_value` in its current
    // slot and restores heap order. Returns false if `old_value` is not stored.
    bool update_priority(const T& old_value, const T& new_value) {
        const Slots* slots = index_.find(old_value);
        if (slots == nullptr)
            return false;
        size_type idx = slots->back();
        bool same_rank = ranks_equal(data_[idx], new_value);
        drop_slot(old_value, idx);
        data_[idx] = new_value;
        add_slot(data_[idx], idx);
        if (!same_rank)
            restore(idx);
        return true;
    }

    // Replaces the contents with arr[0..n) and heapifies bottom-up.
    void build_heap(const T* arr, size_type n) {
        clear();
        reserve(n);
        for (size_type i = 0; i < n; ++i) {
            data_[i] = arr[i];
            add_slot(data_[i], i);
            ++size_;
        }
        for (size_type i = size_ / 2; i > 0; --i)
            sift_down(i - 1);
    }

    template <typename Container>
    void build_heap(const Container& elements) {
        std::vector<T> staged(std::begin(elements), std::end(elements));
        build_heap(staged.data(), staged.size());
    }

    static IndexedMaxHeap from_array(const T* arr, size_type n) {
        IndexedMaxHeap heap;
        heap.build_heap(arr, n);
        return heap;
    }

    bool contains(const T& value) const {
        return index_.contains(value);
    }

    size_type count(const T& value) const {
        const Slots* slots = index_.find(value);
        return slots == nullptr ? 0 : slots->size();
    }

    // A slot holding `value`, or nullptr if it is not stored.
    const size_type* index_of(const T& value) const {
        const Slots* slots = index_.find(value);
        return slots == nullptr ? nullptr : &slots->front();
    }

    // Every slot holding an element equal to `value`, in no particular order.
    const std::vector<size_type>* slots_of(const T& value) const {
        return index_.find(value);
    }

    size_type size() const { return size_; }
    bool empty() const { return size_ == 0; }

    void clear() {
        size_ = 0;
        index_.clear();
    }

    // Copies in array order; the result does not alias heap storage.
    template <typename Container>
    void to_array(Container& out) const {
        for (size_type i = 0; i < size_; ++i)
            out.push_back(data_[i]);
    }

    std::vector<T> to_array() const {
        return std::vector<T>(data_, data_ + size_);
    }

    bool is_valid() const {
        for (size_type i = 1; i < size_; ++i) {
            if (comp_(data_[parent(i)], data_[i]))
                return false;
        }
        return true;
    }

    const Compare& value_comp() const { return comp_; }

    class DrainRange {
    public:
        class iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = T;
            using difference_type = std::ptrdiff_t;
            using pointer = const T*;
            using reference = const T&;

            iterator() : heap_(nullptr), current_() {}

            explicit iterator(IndexedMaxHeap* heap) : heap_(heap), current_() {
                advance();
            }

            reference operator*() const { return current_; }
            pointer operator->() const { return &current_; }

            iterator& operator++() {
                advance();
                return *this;
            }

            bool operator==(const iterator& other) const { return heap_ == other.heap_; }
            bool operator!=(const iterator& other) const { return heap_ != other.heap_; }

        private:
            IndexedMaxHeap* heap_;
            T current_;

            void advance() {
                if (heap_ != nullptr && !heap_->extract_max(current_))
                    heap_ = nullptr;
            }
        };

        explicit DrainRange(IndexedMaxHeap* heap) : heap_(heap) {}

        iterator begin() { return iterator(heap_); }
        iterator end() { return iterator(); }

    private:
        IndexedMaxHeap* heap_;
    };

    // Destructive: every step extracts the current maximum, so iterating a
    // second time finds the heap empty.
    DrainRange drain_descending() { return DrainRange(this); }

private:
    using Slots = std::vector<size_type>;
    using PositionIndex = HashMap<T, Slots, Hash, KeyEqual>;

    T* data_;
    size_type size_;
    size_type capacity_;
    PositionIndex index_;
    Compare comp_;

    static size_type parent(size_type i) { return (i - 1) / 2; }
    static size_type left_child(size_type i) { return 2 * i + 1; }
    static size_type right_child(size_type i) { return 2 * i + 2; }

    bool ranks_equal(const T& a, const T& b) const {
        return !comp_(a, b) && !comp_(b, a);
    }

    void reserve(size_type new_cap) {
        if (new_cap <= capacity_)
            return;
        T* new_data = new T[new_cap];
        for (size_type i = 0; i < size_; ++i)
            new_data[i] = std::move(data_[i]);
        delete[] data_;
        data_ = new_data;
        capacity_ = new_cap;
    }

    void add_slot(const T& value, size_type i) {
        if (Slots* slots = index_.find(value))
            slots->push_back(i);
        else
            index_.insert(value, Slots(1, i));
    }

    // The key's entry goes away with its last slot.
    void drop_slot(const T& value, size_type i) {
        Slots* slots = index_.find(value);
        for (size_type k = 0; k < slots->size(); ++k) {
            if ((*slots)[k] == i) {
                (*slots)[k] = slots->back();
                slots->pop_back();
                break;
            }
        }
        if (slots->empty())
            index_.remove(value);
    }

    static void move_slot(Slots& slots, size_type from, size_type to) {
        for (size_type& s : slots) {
            if (s == from) {
                s = to;
                return;
            }
        }
    }

    // Moves the element in slot `from` into the vacant slot `to`.
    void place(size_type to, size_type from) {
        move_slot(*index_.find(data_[from]), from, to);
        data_[to] = std::move(data_[from]);
    }

    // Every position change made by a sift goes through here, so the index
    // never holds a stale slot for either element. Equal keys share one slot
    // list, which a swap between them leaves unchanged.
    void swap_nodes(size_type i, size_type j) {
        Slots* a = index_.find(data_[i]);
        Slots* b = index_.find(data_[j]);
        if (a != b) {
            move_slot(*a, i, j);
            move_slot(*b, j, i);
        }
        using std::swap;
        swap(data_[i], data_[j]);
    }

    void sift_up(size_type index) {
        while (index > 0) {
            size_type up = parent(index);
            if (!comp_(data_[up], data_[index]))
                break;
            swap_nodes(index, up);
            index = up;
        }
    }

    void sift_down(size_type index) {
        while (true) {
            size_type largest = index;
            size_type left = left_child(index);
            size_type right = right_child(index);

            if (left < size_ && comp_(data_[largest], data_[left]))
                largest = left;
            if (right < size_ && comp_(data_[largest], data_[right]))
                largest = right;

            if (largest == index)
                break;

            swap_nodes(index, largest);
            index = largest;
        }
    }

    // Only one direction can actually move the element; the other is a
    // no-op. Both run so callers need not work out which.
    void restore(size_type index) {
        sift_up(index);
        sift_down(index);
    }
};
