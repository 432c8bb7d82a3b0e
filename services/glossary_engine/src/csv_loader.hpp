#pragma once
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>
#include "relation_index.hpp"
#include "term_index.hpp"

class CsvError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using CsvRow = std::vector<std::string>;

// RFC 4180 records: quoted fields may hold commas, newlines and "" escapes.
// Blank lines are skipped and a leading UTF-8 BOM is ignored. `source` only
// labels error messages.
std::vector<CsvRow> parse_csv(std::istream& in, const std::string& source);

// terms.csv: header with `term` and `definition` columns.
std::vector<TermRec> read_terms_csv(std::istream& in, const std::string& source);
// links.csv: header with `source`, `target` and `relation` columns.
std::vector<RelationRec> read_links_csv(std::istream& in, const std::string& source);

std::vector<TermRec> load_terms_csv(const std::string& path);
std::vector<RelationRec> load_links_csv(const std::string& path);
