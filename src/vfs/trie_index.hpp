#pragma once

#include "vfs/entry.hpp"

#include <map>
#include <memory>
#include <string_view>
#include <vector>

namespace tvfs::vfs {

/// Character trie of entries keyed by mount-relative path.
/// Several entries may share a key; the index does not enforce uniqueness.
class TrieIndex {
public:
    TrieIndex();
    ~TrieIndex();

    TrieIndex(const TrieIndex&) = delete;
    TrieIndex& operator=(const TrieIndex&) = delete;

    /// Add an entry under key (appends if the key already holds entries).
    void insert(std::string_view key, Entry entry);

    /// Remove every entry stored under exactly this key.
    /// Returns the number of entries removed (0 if the key was absent).
    size_t remove(std::string_view key);

    /// All entries whose key starts with prefix, in key order.
    /// An empty prefix returns every entry.
    std::vector<Entry> get(std::string_view prefix) const;

    /// True if at least one key starts with prefix.
    bool has_prefix(std::string_view prefix) const;

    /// Total number of stored entries.
    size_t size() const { return size_; }

private:
    struct Node {
        std::map<char, std::unique_ptr<Node>> children;
        std::vector<Entry> values;
    };

    std::unique_ptr<Node> root_;
    size_t size_ = 0;

    const Node* find_node(std::string_view key) const;
    static void collect(const Node& node, std::vector<Entry>& out);

    /// Remove values at key and prune now-empty nodes on the way back up.
    static size_t remove_at(Node& node, std::string_view key);
};

} // namespace tvfs::vfs
