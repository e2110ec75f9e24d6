// include/strata/lsm/avl_memtable.h
#pragma once

#include "memtable_rep.h"

#include <memory>
#include <shared_mutex>

namespace strata {
namespace lsm {

/**
 * @class AVLMemTable
 * @brief A MemTableRep backed by a height-balanced binary search tree.
 *
 * Add, Delete and Get are O(log n). Every node keeps its subtree height and the
 * tree is rebalanced bottom-up after each insertion, so that for every node
 * |height(left) - height(right)| <= 1 holds at all times.
 */
class AVLMemTable : public MemTableRep {
public:
    AVLMemTable() = default;
    ~AVLMemTable() override = default;

    AVLMemTable(const AVLMemTable&) = delete;
    AVLMemTable& operator=(const AVLMemTable&) = delete;

    void Add(const std::string& key, const std::string& value, SequenceNumber seq) override;
    void Delete(const std::string& key, SequenceNumber seq) override;
    std::optional<Entry> Get(const std::string& key) const override;
    std::unique_ptr<MemTableIterator> NewIterator() const override;
    size_t ApproximateMemoryUsage() const override;
    size_t Count() const override;
    bool Empty() const override;

    // Height of the root; 0 for an empty tree.
    int Height() const;

    /**
     * @brief Walks the whole tree and checks balance, cached heights and strict key order.
     */
    bool ValidateInvariants() const;

private:
    struct Node {
        Entry entry;
        int height = 1;
        std::unique_ptr<Node> left;
        std::unique_ptr<Node> right;

        explicit Node(Entry e) : entry(std::move(e)) {}
    };

    class Iterator;

    void upsert(Entry entry);

    static int height(const std::unique_ptr<Node>& node) { return node ? node->height : 0; }
    static int balanceFactor(const std::unique_ptr<Node>& node);
    static void updateHeight(Node& node);
    static std::unique_ptr<Node> rotateLeft(std::unique_ptr<Node> node);
    static std::unique_ptr<Node> rotateRight(std::unique_ptr<Node> node);
    static std::unique_ptr<Node> rebalance(std::unique_ptr<Node> node);
    std::unique_ptr<Node> insert(std::unique_ptr<Node> node, Entry& entry);

    static bool validateNode(const Node* node, int& out_height);
    static size_t entryFootprint(const Entry& entry);

    std::unique_ptr<Node> root_;
    size_t count_ = 0;
    size_t memory_usage_ = 0;
    mutable std::shared_mutex mutex_;
};

} // namespace lsm
} // namespace strata
