#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "relation_index.hpp"
#include "term_index.hpp"

// How find_path expands a node. Relation listing is always directed.
enum class TraversalMode { Undirected, Directed };

struct EngineOptions {
    int default_relations_depth = 1;
    int default_path_depth = 10;
    // Caps the defaults only; a positive requested depth is always honoured
    // and the work it causes is bounded by max_visited_nodes.
    int max_depth_ceiling = 64;
    size_t max_visited_nodes = 100000;
    TraversalMode path_traversal = TraversalMode::Undirected;
};

// Immutable once published by Engine::load.
struct GraphSnapshot {
    TermIndex terms;
    RelationIndex relations;
    uint64_t generation = 0;
    size_t dangling = 0;
};

struct RelationsResult {
    std::vector<RelationRec> relations;
    size_t total_count = 0;
    bool truncated = false;
};

struct PathResult {
    std::vector<std::string> path;
    bool exists = false;
    std::string message;
};

struct TermsResult {
    std::vector<TermRec> terms;
    size_t total_count = 0;
};

struct LoadResult {
    bool ok = false;
    std::string message;
    size_t term_count = 0, relation_count = 0, dangling = 0;
    uint64_t generation = 0;
};

// Read-mostly term graph. Queries run against whichever snapshot is current
// when they start; load() builds a replacement off to the side and swaps it in.
// Query methods throw std::invalid_argument for empty term names.
class Engine {
public:
    explicit Engine(EngineOptions opts = EngineOptions());
    // Throws std::invalid_argument if the initial batch is malformed.
    Engine(const std::vector<TermRec>& ts, const std::vector<RelationRec>& rs,
           EngineOptions opts = EngineOptions());

    LoadResult load(const std::vector<TermRec>& ts, const std::vector<RelationRec>& rs);

    std::optional<TermRec> get_term(const std::string& name) const;
    // Direct outgoing relations; empty for names not in the term index, like
    // list_relations.
    std::vector<RelationRec> relations_from(const std::string& name) const;
    RelationsResult list_relations(const std::string& name, int max_depth) const;
    PathResult find_path(const std::string& src, const std::string& dst, int max_depth) const;
    TermsResult list_all_terms() const;

    std::shared_ptr<const GraphSnapshot> snapshot() const;
    const EngineOptions& options() const { return opts_; }

    int effective_relations_depth(int requested) const;
    int effective_path_depth(int requested) const;

private:
    template <typename Visit>
    void for_each_neighbor(const GraphSnapshot& g, const std::string& u, Visit&& visit) const;

    EngineOptions opts_;
    std::mutex load_mu_;
    uint64_t generation_ = 0;
    std::shared_ptr<const GraphSnapshot> snap_;
};

// Returns an empty string when the batch is acceptable, otherwise a
// description of the first malformed row.
std::string validate_batch(const std::vector<TermRec>& ts, const std::vector<RelationRec>& rs);
