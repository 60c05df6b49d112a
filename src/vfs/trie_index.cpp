#include "vfs/trie_index.hpp"

namespace tvfs::vfs {

TrieIndex::TrieIndex() : root_(std::make_unique<Node>()) {}
TrieIndex::~TrieIndex() = default;

void TrieIndex::insert(std::string_view key, Entry entry) {
    Node* node = root_.get();
    for (char c : key) {
        auto& child = node->children[c];
        if (!child) {
            child = std::make_unique<Node>();
        }
        node = child.get();
    }
    node->values.push_back(std::move(entry));
    size_++;
}

size_t TrieIndex::remove(std::string_view key) {
    size_t removed = remove_at(*root_, key);
    size_ -= removed;
    return removed;
}

size_t TrieIndex::remove_at(Node& node, std::string_view key) {
    if (key.empty()) {
        size_t removed = node.values.size();
        node.values.clear();
        return removed;
    }

    auto it = node.children.find(key.front());
    if (it == node.children.end()) {
        return 0;
    }

    size_t removed = remove_at(*it->second, key.substr(1));
    if (it->second->values.empty() && it->second->children.empty()) {
        node.children.erase(it);
    }
    return removed;
}

const TrieIndex::Node* TrieIndex::find_node(std::string_view key) const {
    const Node* node = root_.get();
    for (char c : key) {
        auto it = node->children.find(c);
        if (it == node->children.end()) {
            return nullptr;
        }
        node = it->second.get();
    }
    return node;
}

void TrieIndex::collect(const Node& node, std::vector<Entry>& out) {
    out.insert(out.end(), node.values.begin(), node.values.end());
    for (const auto& [c, child] : node.children) {
        collect(*child, out);
    }
}

std::vector<Entry> TrieIndex::get(std::string_view prefix) const {
    std::vector<Entry> result;
    if (const Node* node = find_node(prefix)) {
        collect(*node, result);
    }
    return result;
}

bool TrieIndex::has_prefix(std::string_view prefix) const {
    const Node* node = find_node(prefix);
    // Pruning keeps every non-root node on a path to some value
    return node && (node != root_.get() || size_ > 0);
}

} // namespace tvfs::vfs
