#include "engine.hpp"
#include <algorithm>
#include <new>
#include <queue>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include "logging.hpp"

namespace {

void require_name(const std::string& name, const char* what) {
    if (name.empty()) throw std::invalid_argument(std::string(what) + " must not be empty");
}

std::vector<std::string> trace_back(const std::unordered_map<std::string, std::string>& parent,
                                    const std::string& src, const std::string& dst) {
    std::vector<std::string> path{dst};
    for (std::string cur = dst; cur != src;) {
        cur = parent.at(cur);
        path.push_back(cur);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

}  // namespace

std::string validate_batch(const std::vector<TermRec>& ts, const std::vector<RelationRec>& rs) {
    for (size_t i = 0; i < ts.size(); ++i)
        if (ts[i].name.empty()) return "term #" + std::to_string(i) + " has an empty name";
    for (size_t i = 0; i < rs.size(); ++i) {
        const auto& r = rs[i];
        if (r.src.empty() || r.dst.empty() || r.type.empty())
            return "relation #" + std::to_string(i) + " (" + r.src + " -> " + r.dst + ", '" + r.type +
                   "') has an empty field";
    }
    return {};
}

Engine::Engine(EngineOptions opts) : opts_(opts), snap_(std::make_shared<GraphSnapshot>()) {
    if (opts_.max_depth_ceiling < 1) opts_.max_depth_ceiling = 1;
    if (opts_.max_visited_nodes == 0) opts_.max_visited_nodes = 1;
}

Engine::Engine(const std::vector<TermRec>& ts, const std::vector<RelationRec>& rs, EngineOptions opts)
    : Engine(opts) {
    auto res = load(ts, rs);
    if (!res.ok) throw std::invalid_argument(res.message);
}

LoadResult Engine::load(const std::vector<TermRec>& ts, const std::vector<RelationRec>& rs) {
    LoadResult res;
    std::string bad = validate_batch(ts, rs);
    if (!bad.empty()) {
        res.message = "rejected batch: " + bad;
        glossary_log()->warn("load {}; keeping generation {}", res.message, snapshot()->generation);
        return res;
    }

    std::lock_guard<std::mutex> lock(load_mu_);
    std::shared_ptr<GraphSnapshot> next;
    try {
        next = std::make_shared<GraphSnapshot>();
        next->terms.bulk_load(ts);
        next->relations.bulk_load(rs);
        for (auto& r : next->relations.edges())
            if (!next->terms.contains(r.src) || !next->terms.contains(r.dst)) ++next->dangling;
    } catch (const std::bad_alloc&) {
        res.message = "out of memory while building indexes";
        glossary_log()->error("load failed: {}; keeping generation {}", res.message, generation_);
        return res;
    }
    next->generation = ++generation_;

    res.ok = true;
    res.term_count = next->terms.size();
    res.relation_count = next->relations.size();
    res.dangling = next->dangling;
    res.generation = next->generation;
    res.message = "loaded " + std::to_string(res.term_count) + " terms and " +
                  std::to_string(res.relation_count) + " relations";

    std::atomic_store(&snap_, std::shared_ptr<const GraphSnapshot>(std::move(next)));

    glossary_log()->info("graph generation {}: {} terms, {} relations", res.generation, res.term_count,
                         res.relation_count);
    if (res.dangling)
        glossary_log()->warn("graph generation {}: {} relations reference unknown terms", res.generation,
                             res.dangling);
    return res;
}

std::shared_ptr<const GraphSnapshot> Engine::snapshot() const {
    return std::atomic_load(&snap_);
}

int Engine::effective_relations_depth(int requested) const {
    if (requested > 0) return requested;
    return std::clamp(opts_.default_relations_depth, 1, opts_.max_depth_ceiling);
}

int Engine::effective_path_depth(int requested) const {
    if (requested > 0) return requested;
    return std::clamp(opts_.default_path_depth, 1, opts_.max_depth_ceiling);
}

std::optional<TermRec> Engine::get_term(const std::string& name) const {
    require_name(name, "term name");
    auto g = snapshot();
    const TermRec* t = g->terms.get(name);
    if (!t) return std::nullopt;
    return *t;
}

std::vector<RelationRec> Engine::relations_from(const std::string& name) const {
    require_name(name, "term name");
    auto g = snapshot();
    if (!g->terms.contains(name)) return {};
    return g->relations.relations_from(name);
}

RelationsResult Engine::list_relations(const std::string& name, int max_depth) const {
    require_name(name, "term name");
    auto g = snapshot();
    RelationsResult res;
    if (!g->terms.contains(name)) return res;

    const int hops = effective_relations_depth(max_depth);
    std::unordered_set<std::string> seen{name};
    std::unordered_set<RelationRec, RelationHash> emitted;
    std::queue<std::pair<std::string, int>> q;
    q.push({name, 0});
    size_t expanded = 0;
    while (!q.empty()) {
        auto [u, d] = q.front(); q.pop();
        if (d >= hops) continue;
        if (++expanded > opts_.max_visited_nodes) {
            res.truncated = true;
            glossary_log()->warn("list_relations({}) stopped after {} nodes", name, opts_.max_visited_nodes);
            break;
        }
        for (auto ei : g->relations.outgoing(u)) {
            const auto& r = g->relations.edge(ei);
            if (!emitted.insert(r).second) continue;
            res.relations.push_back(r);
            if (seen.insert(r.dst).second) q.push({r.dst, d + 1});
        }
    }
    res.total_count = res.relations.size();
    glossary_log()->debug("list_relations({}, {}) -> {} relations", name, hops, res.total_count);
    return res;
}

// The only place that decides which edges find_path may cross. Outgoing edges
// come first, then incoming ones, each in insertion order. Returning true from
// visit stops the expansion.
template <typename Visit>
void Engine::for_each_neighbor(const GraphSnapshot& g, const std::string& u, Visit&& visit) const {
    for (auto ei : g.relations.outgoing(u))
        if (visit(g.relations.edge(ei).dst)) return;
    if (opts_.path_traversal == TraversalMode::Directed) return;
    for (auto ei : g.relations.incoming(u))
        if (visit(g.relations.edge(ei).src)) return;
}

PathResult Engine::find_path(const std::string& src, const std::string& dst, int max_depth) const {
    require_name(src, "source term");
    require_name(dst, "target term");
    auto g = snapshot();
    PathResult res;

    bool has_src = g->terms.contains(src), has_dst = g->terms.contains(dst);
    if (!has_src && !has_dst) {
        res.message = "terms not found: '" + src + "', '" + dst + "'";
        return res;
    }
    if (!has_src || !has_dst) {
        res.message = "term not found: '" + (has_src ? dst : src) + "'";
        return res;
    }
    if (src == dst) {
        res.exists = true;
        res.path.push_back(src);
        res.message = "source and target are the same term";
        return res;
    }

    const int hops = effective_path_depth(max_depth);
    std::unordered_map<std::string, std::string> parent{{src, std::string()}};
    std::vector<std::string> frontier{src}, next;
    size_t expanded = 0;
    for (int d = 0; d < hops && !frontier.empty(); ++d) {
        next.clear();
        for (const auto& u : frontier) {
            if (++expanded > opts_.max_visited_nodes) {
                res.message = "search stopped after visiting " + std::to_string(opts_.max_visited_nodes) +
                              " terms without reaching '" + dst + "'";
                glossary_log()->warn("find_path({}, {}): {}", src, dst, res.message);
                return res;
            }
            bool hit = false;
            for_each_neighbor(*g, u, [&](const std::string& v) {
                if (!parent.emplace(v, u).second) return false;
                if (v == dst) {
                    hit = true;
                    return true;
                }
                next.push_back(v);
                return false;
            });
            if (hit) {
                res.path = trace_back(parent, src, dst);
                res.exists = true;
                res.message = "path found: " + std::to_string(res.path.size() - 1) + " hops";
                glossary_log()->debug("find_path({}, {}, {}) -> {} hops", src, dst, hops, res.path.size() - 1);
                return res;
            }
        }
        frontier.swap(next);
    }
    res.message = "no path within " + std::to_string(hops) + " hops";
    glossary_log()->debug("find_path({}, {}, {}) -> none", src, dst, hops);
    return res;
}

TermsResult Engine::list_all_terms() const {
    auto g = snapshot();
    TermsResult res;
    res.terms = g->terms.list_all();
    res.total_count = res.terms.size();
    return res;
}
