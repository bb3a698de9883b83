// ============================================================
// dedup_index.cpp
// ============================================================

#include "dedup_index.hpp"

bool DedupIndex::insert(const OperationPtr& op) {
    const std::string& fp = op->unique_identifier();
    if (by_fp_.count(fp)) return false;

    Entry e;
    e.op  = op;
    e.tag = op->tag();
    e.seq = next_seq_++;

    if (!e.tag.empty()) by_tag_[e.tag].insert(e.seq);
    by_seq_[e.seq] = fp;
    by_fp_.emplace(fp, std::move(e));
    return true;
}

bool DedupIndex::erase(const OperationPtr& op) {
    auto it = by_fp_.find(op->unique_identifier());
    if (it == by_fp_.end() || it->second.op != op) return false;

    const Entry& e = it->second;
    if (!e.tag.empty()) {
        auto t = by_tag_.find(e.tag);
        if (t != by_tag_.end()) {
            t->second.erase(e.seq);
            if (t->second.empty()) by_tag_.erase(t);
        }
    }
    by_seq_.erase(e.seq);
    by_fp_.erase(it);
    return true;
}

OperationPtr DedupIndex::find(const std::string& fingerprint) const {
    auto it = by_fp_.find(fingerprint);
    return it != by_fp_.end() ? it->second.op : nullptr;
}

std::vector<OperationPtr> DedupIndex::with_tag(const std::string& tag) const {
    std::vector<OperationPtr> out;
    auto t = by_tag_.find(tag);
    if (t == by_tag_.end()) return out;
    for (u64 seq : t->second) {
        auto s = by_seq_.find(seq);
        if (s == by_seq_.end()) continue;
        out.push_back(by_fp_.at(s->second).op);
    }
    return out;
}

bool DedupIndex::has_tag(const std::string& tag) const {
    return by_tag_.count(tag) > 0;
}

std::vector<OperationPtr> DedupIndex::all() const {
    std::vector<OperationPtr> out;
    out.reserve(by_seq_.size());
    for (auto& kv : by_seq_) out.push_back(by_fp_.at(kv.second).op);
    return out;
}

void DedupIndex::clear() {
    by_fp_.clear();
    by_tag_.clear();
    by_seq_.clear();
}
