// src/lsm/avl_memtable.cpp
#include "strata/lsm/avl_memtable.h"
#include "strata/storage_error/storage_error.h"

#include <vector>
#include <algorithm>
#include <cstdlib>
#include <mutex>

namespace strata {
namespace lsm {

/**
 * @class AVLMemTable::Iterator
 * @brief In-order traversal using an explicit stack of the ancestors still to visit.
 */
class AVLMemTable::Iterator : public MemTableIterator {
public:
    explicit Iterator(const AVLMemTable* memtable) : memtable_(memtable) {
        SeekToFirst();
    }

    bool Valid() const override {
        return !stack_.empty();
    }

    void Next() override {
        if (!Valid()) {
            return;
        }
        const Node* current = stack_.back();
        stack_.pop_back();
        pushLeftSpine(current->right.get());
    }

    void SeekToFirst() override {
        stack_.clear();
        pushLeftSpine(memtable_->root_.get());
    }

    void Seek(const std::string& key) override {
        stack_.clear();
        const Node* node = memtable_->root_.get();
        while (node) {
            if (node->entry.key < key) {
                node = node->right.get();
            } else {
                stack_.push_back(node);
                node = node->left.get();
            }
        }
    }

    const Entry& GetEntry() const override {
        return stack_.back()->entry;
    }

private:
    void pushLeftSpine(const Node* node) {
        while (node) {
            stack_.push_back(node);
            node = node->left.get();
        }
    }

    const AVLMemTable* memtable_;
    std::vector<const Node*> stack_;
};

// --- Rotations and rebalancing ---

int AVLMemTable::balanceFactor(const std::unique_ptr<Node>& node) {
    return node ? height(node->left) - height(node->right) : 0;
}

void AVLMemTable::updateHeight(Node& node) {
    node.height = 1 + std::max(height(node.left), height(node.right));
}

std::unique_ptr<AVLMemTable::Node> AVLMemTable::rotateRight(std::unique_ptr<Node> node) {
    std::unique_ptr<Node> pivot = std::move(node->left);
    node->left = std::move(pivot->right);
    updateHeight(*node);
    pivot->right = std::move(node);
    updateHeight(*pivot);
    return pivot;
}

std::unique_ptr<AVLMemTable::Node> AVLMemTable::rotateLeft(std::unique_ptr<Node> node) {
    std::unique_ptr<Node> pivot = std::move(node->right);
    node->right = std::move(pivot->left);
    updateHeight(*node);
    pivot->left = std::move(node);
    updateHeight(*pivot);
    return pivot;
}

std::unique_ptr<AVLMemTable::Node> AVLMemTable::rebalance(std::unique_ptr<Node> node) {
    updateHeight(*node);
    int balance = balanceFactor(node);

    if (balance > 1) {
        if (balanceFactor(node->left) < 0) {
            node->left = rotateLeft(std::move(node->left));   // LR
        }
        return rotateRight(std::move(node));                   // LL
    }
    if (balance < -1) {
        if (balanceFactor(node->right) > 0) {
            node->right = rotateRight(std::move(node->right)); // RL
        }
        return rotateLeft(std::move(node));                    // RR
    }
    return node;
}

std::unique_ptr<AVLMemTable::Node> AVLMemTable::insert(std::unique_ptr<Node> node, Entry& entry) {
    if (!node) {
        memory_usage_ += entryFootprint(entry);
        ++count_;
        return std::make_unique<Node>(std::move(entry));
    }

    if (entry.key < node->entry.key) {
        node->left = insert(std::move(node->left), entry);
    } else if (node->entry.key < entry.key) {
        node->right = insert(std::move(node->right), entry);
    } else {
        // Same key: the newer write replaces the entry, the shape is unchanged.
        memory_usage_ -= entryFootprint(node->entry);
        memory_usage_ += entryFootprint(entry);
        node->entry = std::move(entry);
        return node;
    }

    return rebalance(std::move(node));
}

size_t AVLMemTable::entryFootprint(const Entry& entry) {
    size_t bytes = sizeof(Node) + entry.key.size();
    if (!entry.isTombstone()) {
        bytes += entry.value().size();
    }
    return bytes;
}

// --- MemTableRep interface ---

void AVLMemTable::upsert(Entry entry) {
    if (entry.key.empty()) {
        throw storage::StorageError::invalidKey("Key must not be empty.");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    root_ = insert(std::move(root_), entry);
}

void AVLMemTable::Add(const std::string& key, const std::string& value, SequenceNumber seq) {
    upsert(Entry::makeValue(key, value, seq));
}

void AVLMemTable::Delete(const std::string& key, SequenceNumber seq) {
    upsert(Entry::makeTombstone(key, seq));
}

std::optional<Entry> AVLMemTable::Get(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Node* node = root_.get();
    while (node) {
        if (key < node->entry.key) {
            node = node->left.get();
        } else if (node->entry.key < key) {
            node = node->right.get();
        } else {
            return node->entry;
        }
    }
    return std::nullopt;
}

std::unique_ptr<MemTableIterator> AVLMemTable::NewIterator() const {
    return std::make_unique<Iterator>(this);
}

size_t AVLMemTable::ApproximateMemoryUsage() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sizeof(*this) + memory_usage_;
}

size_t AVLMemTable::Count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return count_;
}

bool AVLMemTable::Empty() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return count_ == 0;
}

int AVLMemTable::Height() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return height(root_);
}

bool AVLMemTable::validateNode(const Node* node, int& out_height) {
    if (!node) {
        out_height = 0;
        return true;
    }
    int left_height = 0;
    int right_height = 0;
    if (!validateNode(node->left.get(), left_height) || !validateNode(node->right.get(), right_height)) {
        return false;
    }
    if (node->left && !(node->left->entry.key < node->entry.key)) {
        return false;
    }
    if (node->right && !(node->entry.key < node->right->entry.key)) {
        return false;
    }
    if (std::abs(left_height - right_height) > 1) {
        return false;
    }
    out_height = 1 + std::max(left_height, right_height);
    return out_height == node->height;
}

bool AVLMemTable::ValidateInvariants() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    int root_height = 0;
    if (!validateNode(root_.get(), root_height)) {
        return false;
    }

    // Child-parent checks alone do not catch a key misplaced deeper in a subtree.
    const std::string* previous = nullptr;
    size_t seen = 0;
    Iterator it(this);
    for (; it.Valid(); it.Next()) {
        const std::string& key = it.GetEntry().key;
        if (previous && !(*previous < key)) {
            return false;
        }
        previous = &key;
        ++seen;
    }
    return seen == count_;
}

} // namespace lsm
} // namespace strata
