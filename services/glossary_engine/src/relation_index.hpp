#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

// Directed, typed edge. The type is an open label carried verbatim.
struct RelationRec {
    std::string src, dst, type;
};

inline bool operator==(const RelationRec& a, const RelationRec& b) {
    return a.src == b.src && a.dst == b.dst && a.type == b.type;
}

struct RelationHash {
    size_t operator()(const RelationRec& r) const {
        std::hash<std::string> h;
        size_t seed = h(r.src);
        seed ^= h(r.dst) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        seed ^= h(r.type) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};

// Edge list plus outgoing/incoming adjacency by edge id. Adjacency lists keep
// insertion order, which is what makes traversal results deterministic.
class RelationIndex {
public:
    void add(const RelationRec& r);
    void bulk_load(const std::vector<RelationRec>& rs);
    std::vector<RelationRec> relations_from(const std::string& name) const;
    const std::vector<size_t>& outgoing(const std::string& name) const;
    const std::vector<size_t>& incoming(const std::string& name) const;
    const RelationRec& edge(size_t id) const { return edges_[id]; }
    const std::vector<RelationRec>& edges() const { return edges_; }
    size_t size() const { return edges_.size(); }
private:
    std::vector<RelationRec> edges_;
    std::unordered_map<std::string, std::vector<size_t>> out_, in_;
};
