#include "csv_loader.hpp"
#include <fstream>
#include <iterator>
#include <unordered_map>

namespace {

struct Table {
    std::unordered_map<std::string, size_t> columns;
    std::vector<CsvRow> rows;
};

Table read_table(std::istream& in, const std::string& source, const std::vector<std::string>& required) {
    auto records = parse_csv(in, source);
    if (records.empty()) throw CsvError(source + ": missing header row");

    Table t;
    for (size_t i = 0; i < records[0].size(); ++i) t.columns.emplace(records[0][i], i);
    for (auto& col : required)
        if (!t.columns.count(col)) throw CsvError(source + ": missing column '" + col + "'");

    size_t width = records[0].size();
    for (size_t r = 1; r < records.size(); ++r) {
        if (records[r].size() != width)
            throw CsvError(source + ": record " + std::to_string(r + 1) + " has " +
                           std::to_string(records[r].size()) + " fields, expected " + std::to_string(width));
        t.rows.push_back(std::move(records[r]));
    }
    return t;
}

std::ifstream open_or_throw(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw CsvError(path + ": cannot open file");
    return in;
}

}  // namespace

std::vector<CsvRow> parse_csv(std::istream& in, const std::string& source) {
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    size_t i = text.compare(0, 3, "\xEF\xBB\xBF") == 0 ? 3 : 0;

    std::vector<CsvRow> out;
    CsvRow row;
    std::string field;
    bool quoted = false, field_started = false;
    size_t line = 1, quote_line = 0;

    auto end_field = [&] {
        row.push_back(std::move(field));
        field.clear();
        field_started = false;
    };
    auto end_row = [&] {
        if (row.empty() && !field_started) return;  // blank line
        end_field();
        out.push_back(std::move(row));
        row.clear();
    };

    for (; i < text.size(); ++i) {
        char c = text[i];
        if (quoted) {
            if (c != '"') {
                if (c == '\n') ++line;
                field.push_back(c);
            } else if (i + 1 < text.size() && text[i + 1] == '"') {
                field.push_back('"');
                ++i;
            } else {
                quoted = false;
            }
            continue;
        }
        switch (c) {
        case '"':
            if (!field.empty()) throw CsvError(source + ":" + std::to_string(line) + ": stray quote in field");
            quoted = true;
            field_started = true;
            quote_line = line;
            break;
        case ',':
            end_field();
            field_started = true;
            break;
        case '\r':
            break;
        case '\n':
            end_row();
            ++line;
            break;
        default:
            field.push_back(c);
            field_started = true;
        }
    }
    if (quoted) throw CsvError(source + ":" + std::to_string(quote_line) + ": unterminated quoted field");
    end_row();
    return out;
}

std::vector<TermRec> read_terms_csv(std::istream& in, const std::string& source) {
    auto t = read_table(in, source, {"term", "definition"});
    size_t name = t.columns["term"], def = t.columns["definition"];
    std::vector<TermRec> out;
    out.reserve(t.rows.size());
    for (auto& r : t.rows) out.push_back({r[name], r[def]});
    return out;
}

std::vector<RelationRec> read_links_csv(std::istream& in, const std::string& source) {
    auto t = read_table(in, source, {"source", "target", "relation"});
    size_t src = t.columns["source"], dst = t.columns["target"], type = t.columns["relation"];
    std::vector<RelationRec> out;
    out.reserve(t.rows.size());
    for (auto& r : t.rows) out.push_back({r[src], r[dst], r[type]});
    return out;
}

std::vector<TermRec> load_terms_csv(const std::string& path) {
    auto in = open_or_throw(path);
    return read_terms_csv(in, path);
}

std::vector<RelationRec> load_links_csv(const std::string& path) {
    auto in = open_or_throw(path);
    return read_links_csv(in, path);
}
