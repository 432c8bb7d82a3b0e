#include <fstream>
#include <iostream>
#include <string>
#include "csv_loader.hpp"
#include "dot_export.hpp"
#include "engine.hpp"
#include "logging.hpp"

// usage: glossary_dot <terms.csv> <links.csv> [out.dot]
int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <terms.csv> <links.csv> [out.dot]\n";
        return 2;
    }
    Engine eng;
    try {
        auto res = eng.load(load_terms_csv(argv[1]), load_links_csv(argv[2]));
        if (!res.ok) {
            glossary_log()->error("{}", res.message);
            return 1;
        }
    } catch (const CsvError& e) {
        glossary_log()->error("{}", e.what());
        return 1;
    }

    auto g = eng.snapshot();
    if (argc < 4) {
        write_dot(*g, std::cout);
        return 0;
    }
    std::ofstream out(argv[3]);
    if (!out) {
        glossary_log()->error("cannot write {}", argv[3]);
        return 1;
    }
    write_dot(*g, out);
    glossary_log()->info("wrote {} terms and {} relations to {}", g->terms.size(), g->relations.size(), argv[3]);
    return 0;
}
