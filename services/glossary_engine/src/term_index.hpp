#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

struct TermRec {
    std::string name, definition;
};

inline bool operator==(const TermRec& a, const TermRec& b) {
    return a.name == b.name && a.definition == b.definition;
}

// Terms keyed by exact (case-sensitive) name, kept in first-insertion order.
class TermIndex {
public:
    void put(const TermRec& t);
    void bulk_load(const std::vector<TermRec>& ts);
    const TermRec* get(const std::string& name) const;
    bool contains(const std::string& name) const { return pos_.count(name) != 0; }
    const std::vector<TermRec>& list_all() const { return terms_; }
    size_t size() const { return terms_.size(); }
private:
    std::vector<TermRec> terms_;
    std::unordered_map<std::string, size_t> pos_;
};
