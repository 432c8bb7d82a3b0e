#include "relation_index.hpp"

namespace {
const std::vector<size_t> kNoEdges;
}

void RelationIndex::add(const RelationRec& r) {
    size_t id = edges_.size();
    edges_.push_back(r);
    out_[r.src].push_back(id);
    in_[r.dst].push_back(id);
}

void RelationIndex::bulk_load(const std::vector<RelationRec>& rs) {
    edges_.reserve(edges_.size() + rs.size());
    for (auto& r : rs) add(r);
}

std::vector<RelationRec> RelationIndex::relations_from(const std::string& name) const {
    std::vector<RelationRec> out;
    for (auto id : outgoing(name)) out.push_back(edges_[id]);
    return out;
}

const std::vector<size_t>& RelationIndex::outgoing(const std::string& name) const {
    auto it = out_.find(name);
    return it == out_.end() ? kNoEdges : it->second;
}

const std::vector<size_t>& RelationIndex::incoming(const std::string& name) const {
    auto it = in_.find(name);
    return it == in_.end() ? kNoEdges : it->second;
}
