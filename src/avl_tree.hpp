#pragma once

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

// Height-balanced binary search tree. Values are unique under Compare;
// inserting a value that is already present leaves the tree unchanged.
template <typename T, typename Compare = std::less<T>>
class AVLTree {
public:
    using value_type = T;
    using size_type = std::size_t;
    using value_compare = Compare;

    AVLTree() : root_(nullptr), size_(0), comp_() {}

    explicit AVLTree(const Compare& comp)
        : root_(nullptr), size_(0), comp_(comp) {}

    AVLTree(const AVLTree& other)
        : root_(nullptr), size_(other.size_), comp_(other.comp_) {
        root_ = clone_tree(other.root_);
    }

    AVLTree(AVLTree&& other) noexcept
        : root_(other.root_), size_(other.size_), comp_(std::move(other.comp_)) {
        other.root_ = nullptr;
        other.size_ = 0;
    }

    AVLTree& operator=(const AVLTree& other) {
        if (this != &other) {
            AVLTree temp(other);
            swap(temp);
        }
        return *this;
    }

    AVLTree& operator=(AVLTree&& other) noexcept {
        if (this != &other) {
            clear();
            root_ = other.root_;
            size_ = other.size_;
            comp_ = std::move(other.comp_);
            other.root_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }

    ~AVLTree() { clear(); }

    void swap(AVLTree& other) noexcept {
        std::swap(root_, other.root_);
        std::swap(size_, other.size_);
        std::swap(comp_, other.comp_);
    }

    void insert(const T& value) {
        const T* inserted = nullptr;
        root_ = insert_node(root_, value, inserted);
    }

    void insert(T&& value) {
        const T* inserted = nullptr;
        root_ = insert_node(root_, std::move(value), inserted);
    }

    // Returns false when no equal value is stored.
    bool remove(const T& value) {
        bool removed = false;
        root_ = remove_node(root_, value, removed);
        return removed;
    }

    bool contains(const T& value) const {
        return find_node(root_, value) != nullptr;
    }

    // nullptr on an empty tree.
    const T* min() const {
        return root_ == nullptr ? nullptr : &find_min(root_)->value;
    }

    const T* max() const {
        return root_ == nullptr ? nullptr : &find_max(root_)->value;
    }

    size_type size() const { return size_; }
    bool empty() const { return root_ == nullptr; }

    size_type height() const {
        return node_height(root_);
    }

    // Recomputes subtree heights from scratch. Fails on a height gap above
    // one or on a cached height that differs from the measured one.
    bool is_balanced() const {
        bool balanced = true;
        measure_height(root_, balanced);
        return balanced;
    }

    // Strict ascending order under Compare across the whole tree.
    bool is_valid_bst() const {
        return check_order(root_, nullptr, nullptr);
    }

    const Compare& value_comp() const { return comp_; }

    void clear() {
        destroy_tree(root_);
        root_ = nullptr;
        size_ = 0;
    }

    template <typename Container>
    void in_order(Container& result) const {
        in_order_traverse(root_, result);
    }

    std::vector<T> in_order() const {
        std::vector<T> result;
        result.reserve(size_);
        in_order_traverse(root_, result);
        return result;
    }

    template <typename Container>
    void pre_order(Container& result) const {
        pre_order_traverse(root_, result);
    }

    template <typename Container>
    void post_order(Container& result) const {
        post_order_traverse(root_, result);
    }

    // One row per depth, left to right.
    std::vector<std::vector<T>> level_order() const {
        std::vector<std::vector<T>> levels;
        if (root_ == nullptr)
            return levels;
        std::vector<const Node*> current(1, root_);
        while (!current.empty()) {
            std::vector<const Node*> next;
            levels.emplace_back();
            levels.back().reserve(current.size());
            for (const Node* node : current) {
                levels.back().push_back(node->value);
                if (node->left != nullptr)
                    next.push_back(node->left);
                if (node->right != nullptr)
                    next.push_back(node->right);
            }
            current.swap(next);
        }
        return levels;
    }

private:
    struct Node {
        T value;
        Node* left;
        Node* right;
        size_type height;

        explicit Node(const T& v)
            : value(v), left(nullptr), right(nullptr), height(1) {}
        explicit Node(T&& v)
            : value(std::move(v)), left(nullptr), right(nullptr), height(1) {}
    };

    Node* root_;
    size_type size_;
    Compare comp_;

    static size_type node_height(const Node* node) {
        return node == nullptr ? 0 : node->height;
    }

    static void update_height(Node* node) {
        size_type left_h = node_height(node->left);
        size_type right_h = node_height(node->right);
        node->height = 1 + (left_h > right_h ? left_h : right_h);
    }

    static int balance_factor(const Node* node) {
        if (node == nullptr)
            return 0;
        return static_cast<int>(node_height(node->left)) -
               static_cast<int>(node_height(node->right));
    }

    static Node* right_rotate(Node* y) {
        Node* x = y->left;
        Node* b = x->right;
        x->right = y;
        y->left = b;
        update_height(y);
        update_height(x);
        return x;
    }

    static Node* left_rotate(Node* x) {
        Node* y = x->right;
        Node* b = y->left;
        y->left = x;
        x->right = b;
        update_height(x);
        update_height(y);
        return y;
    }

    // After an insert the heavy side is the one the new value went down,
    // so the case is chosen by comparing against the child's value.
    Node* rebalance_after_insert(Node* node, const T& value) {
        update_height(node);
        int balance = balance_factor(node);

        if (balance > 1) {
            if (comp_(node->left->value, value))
                node->left = left_rotate(node->left);
            return right_rotate(node);
        }

        if (balance < -1) {
            if (comp_(value, node->right->value))
                node->right = right_rotate(node->right);
            return left_rotate(node);
        }

        return node;
    }

    static Node* rebalance(Node* node) {
        update_height(node);
        int balance = balance_factor(node);

        if (balance > 1) {
            if (balance_factor(node->left) < 0)
                node->left = left_rotate(node->left);
            return right_rotate(node);
        }

        if (balance < -1) {
            if (balance_factor(node->right) > 0)
                node->right = right_rotate(node->right);
            return left_rotate(node);
        }

        return node;
    }

    // `inserted` is left null when an equal value already exists.
    template <typename U>
    Node* insert_node(Node* node, U&& value, const T*& inserted) {
        if (node == nullptr) {
            Node* created = new Node(std::forward<U>(value));
            ++size_;
            inserted = &created->value;
            return created;
        }

        if (comp_(value, node->value))
            node->left = insert_node(node->left, std::forward<U>(value), inserted);
        else if (comp_(node->value, value))
            node->right = insert_node(node->right, std::forward<U>(value), inserted);

        if (inserted == nullptr)
            return node;
        return rebalance_after_insert(node, *inserted);
    }

    Node* remove_node(Node* node, const T& value, bool& removed) {
        if (node == nullptr)
            return nullptr;

        if (comp_(value, node->value)) {
            node->left = remove_node(node->left, value, removed);
        } else if (comp_(node->value, value)) {
            node->right = remove_node(node->right, value, removed);
        } else {
            removed = true;
            if (node->left == nullptr) {
                Node* right = node->right;
                delete node;
                --size_;
                return right;
            }
            if (node->right == nullptr) {
                Node* left = node->left;
                delete node;
                --size_;
                return left;
            }
            node->right = remove_min(node->right, node->value);
        }

        return rebalance(node);
    }

    // Detaches the in-order successor, moving its value into `slot`.
    Node* remove_min(Node* node, T& slot) {
        if (node->left == nullptr) {
            Node* right = node->right;
            slot = std::move(node->value);
            delete node;
            --size_;
            return right;
        }
        node->left = remove_min(node->left, slot);
        return rebalance(node);
    }

    const Node* find_node(const Node* node, const T& value) const {
        while (node != nullptr) {
            if (comp_(value, node->value))
                node = node->left;
            else if (comp_(node->value, value))
                node = node->right;
            else
                return node;
        }
        return nullptr;
    }

    static const Node* find_min(const Node* node) {
        while (node->left != nullptr)
            node = node->left;
        return node;
    }

    static const Node* find_max(const Node* node) {
        while (node->right != nullptr)
            node = node->right;
        return node;
    }

    static void destroy_tree(Node* node) {
        if (node == nullptr)
            return;
        destroy_tree(node->left);
        destroy_tree(node->right);
        delete node;
    }

    static Node* clone_tree(const Node* node) {
        if (node == nullptr)
            return nullptr;
        Node* copy = new Node(node->value);
        copy->height = node->height;
        try {
            copy->left = clone_tree(node->left);
            copy->right = clone_tree(node->right);
        } catch (...) {
            destroy_tree(copy);
            throw;
        }
        return copy;
    }

    static size_type measure_height(const Node* node, bool& balanced) {
        if (node == nullptr)
            return 0;
        size_type left_h = measure_height(node->left, balanced);
        size_type right_h = measure_height(node->right, balanced);
        size_type diff = left_h > right_h ? left_h - right_h : right_h - left_h;
        size_type measured = 1 + (left_h > right_h ? left_h : right_h);
        if (diff > 1 || node->height != measured)
            balanced = false;
        return measured;
    }

    bool check_order(const Node* node, const T* low, const T* high) const {
        if (node == nullptr)
            return true;
        if (low != nullptr && !comp_(*low, node->value))
            return false;
        if (high != nullptr && !comp_(node->value, *high))
            return false;
        return check_order(node->left, low, &node->value) &&
               check_order(node->right, &node->value, high);
    }

    template <typename Container>
    static void in_order_traverse(const Node* node, Container& result) {
        if (node == nullptr)
            return;
        in_order_traverse(node->left, result);
        result.push_back(node->value);
        in_order_traverse(node->right, result);
    }

    template <typename Container>
    static void pre_order_traverse(const Node* node, Container& result) {
        if (node == nullptr)
            return;
        result.push_back(node->value);
        pre_order_traverse(node->left, result);
        pre_order_traverse(node->right, result);
    }

    template <typename Container>
    static void post_order_traverse(const Node* node, Container& result) {
        if (node == nullptr)
            return;
        post_order_traverse(node->left, result);
        post_order_traverse(node->right, result);
        result.push_back(node->value);
    }
};
