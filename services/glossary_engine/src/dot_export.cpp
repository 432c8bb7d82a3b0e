#include "dot_export.hpp"
#include <string>
#include <unordered_set>

namespace {

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        if (c == '\n') {
            out += "\\n";
            continue;
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

}  // namespace

void write_dot(const GraphSnapshot& g, std::ostream& os) {
    os << "digraph glossary {\n";
    os << "  node [shape=box];\n";
    for (auto& t : g.terms.list_all()) os << "  " << quote(t.name) << ";\n";

    std::unordered_set<std::string> dangling;
    for (auto& r : g.relations.edges()) {
        for (auto* end : {&r.src, &r.dst})
            if (!g.terms.contains(*end) && dangling.insert(*end).second)
                os << "  " << quote(*end) << " [style=dashed];\n";
        os << "  " << quote(r.src) << " -> " << quote(r.dst) << " [label=" << quote(r.type) << "];\n";
    }
    os << "}\n";
}
