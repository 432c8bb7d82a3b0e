#include "term_index.hpp"

void TermIndex::put(const TermRec& t) {
    auto it = pos_.find(t.name);
    if (it != pos_.end()) {
        terms_[it->second].definition = t.definition;
        return;
    }
    pos_.emplace(t.name, terms_.size());
    terms_.push_back(t);
}

void TermIndex::bulk_load(const std::vector<TermRec>& ts) {
    terms_.reserve(terms_.size() + ts.size());
    pos_.reserve(pos_.size() + ts.size());
    for (auto& t : ts) put(t);
}

const TermRec* TermIndex::get(const std::string& name) const {
    auto it = pos_.find(name);
    return it == pos_.end() ? nullptr : &terms_[it->second];
}
