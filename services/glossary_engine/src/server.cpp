#include <exception>
#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include "config.hpp"
#include "csv_loader.hpp"
#include "engine.hpp"
#include "glossary_service.hpp"
#include "logging.hpp"

using grpc::Server;
using grpc::ServerBuilder;

int main(int argc, char** argv) {
    Config cfg;
    try {
        cfg = load_config(argc > 1 ? argv[1] : "glossary.yaml");
        init_logging(cfg.logging.level, cfg.logging.file);
    } catch (const std::exception& e) {
        glossary_log()->critical("configuration: {}", e.what());
        return 1;
    }

    Engine eng(cfg.engine);
    try {
        auto res = eng.load(load_terms_csv(cfg.data.terms_file), load_links_csv(cfg.data.links_file));
        if (!res.ok) {
            glossary_log()->critical("initial load: {}", res.message);
            return 1;
        }
    } catch (const CsvError& e) {
        glossary_log()->critical("initial load: {}", e.what());
        return 1;
    }

    std::string addr = cfg.server.address();
    GlossaryServiceImpl svc(eng);
    ServerBuilder b; b.AddListeningPort(addr, grpc::InsecureServerCredentials());
    b.RegisterService(&svc);
    std::unique_ptr<Server> server(b.BuildAndStart());
    if (!server) {
        glossary_log()->critical("could not listen on {}", addr);
        return 1;
    }
    glossary_log()->info("GlossaryService listening on {}", addr);
    server->Wait();
    return 0;
}
