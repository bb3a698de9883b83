#pragma once

// ============================================================
// dedup_index.hpp -- Fingerprint and tag lookup over the
//   non-terminal operations
//
// Not thread-safe; NetworkEngine guards it with its own mutex.
// ============================================================

#include "network_operation.hpp"
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

class DedupIndex {
public:
    // The tag is captured here, so retagging an enqueued operation does
    // not move it between tag buckets.
    // Returns false if the fingerprint is already present.
    bool insert(const OperationPtr& op);

    // Removes op only if it is the entry stored for its fingerprint
    bool erase(const OperationPtr& op);

    OperationPtr find(const std::string& fingerprint) const;

    // Insertion-ordered operations carrying tag
    std::vector<OperationPtr> with_tag(const std::string& tag) const;
    bool has_tag(const std::string& tag) const;

    // Insertion-ordered
    std::vector<OperationPtr> all() const;

    size_t size() const { return by_fp_.size(); }
    bool empty() const { return by_fp_.empty(); }
    void clear();

private:
    struct Entry {
        OperationPtr op;
        std::string  tag;
        u64          seq;
    };

    std::unordered_map<std::string, Entry>     by_fp_;
    std::map<std::string, std::set<u64>>       by_tag_;   // tag -> seqs
    std::map<u64, std::string>                 by_seq_;   // seq -> fingerprint
    u64                                        next_seq_{0};
};
