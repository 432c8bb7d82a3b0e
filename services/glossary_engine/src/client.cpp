#include <iostream>
#include <memory>
#include <string>
#include <google/protobuf/empty.pb.h>
#include <grpcpp/grpcpp.h>
#include "glossary.grpc.pb.h"

using glossary::GlossaryService;

namespace {

void report(const grpc::Status& st) {
    std::cout << "error: " << st.error_code() << " - " << st.error_message() << "\n\n";
}

void banner(const std::string& title) {
    std::cout << title << "\n" << std::string(60, '-') << "\n";
}

}  // namespace

// usage: glossary_client [address] [term] [path-source] [path-target]
int main(int argc, char** argv) {
    std::string addr = argc > 1 ? argv[1] : "localhost:50052";
    std::string term = argc > 2 ? argv[2] : "Backend-Driven UI";
    std::string from = argc > 3 ? argv[3] : "Layout Engine";
    std::string to = argc > 4 ? argv[4] : "JSON Schema";

    auto stub = GlossaryService::NewStub(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()));

    banner("1. All terms");
    {
        grpc::ClientContext ctx;
        google::protobuf::Empty req;
        glossary::AllTermsResponse resp;
        auto st = stub->GetAllTerms(&ctx, req, &resp);
        if (!st.ok()) {
            report(st);
        } else {
            std::cout << "total: " << resp.total_count() << "\n";
            for (int i = 0; i < resp.terms_size() && i < 5; ++i)
                std::cout << "  " << i + 1 << ". " << resp.terms(i).name() << "\n";
            std::cout << "\n";
        }
    }

    banner("2. Term '" + term + "'");
    {
        grpc::ClientContext ctx;
        glossary::TermRequest req;
        req.set_term_name(term);
        glossary::TermResponse resp;
        auto st = stub->GetTerm(&ctx, req, &resp);
        if (!st.ok()) report(st);
        else if (resp.found()) std::cout << resp.term().name() << ": " << resp.term().definition() << "\n\n";
        else std::cout << "not found\n\n";
    }

    banner("3. Relations of '" + term + "'");
    {
        grpc::ClientContext ctx;
        glossary::RelationsRequest req;
        req.set_term_name(term);
        req.set_max_depth(1);
        glossary::RelationsResponse resp;
        auto st = stub->GetTermRelations(&ctx, req, &resp);
        if (!st.ok()) {
            report(st);
        } else {
            std::cout << "total: " << resp.total_count() << "\n";
            for (auto& r : resp.relations())
                std::cout << "  " << r.source_term() << " --[" << r.relation_type() << "]--> " << r.target_term()
                          << "\n";
            std::cout << "\n";
        }
    }

    banner("4. Path '" + from + "' -> '" + to + "'");
    {
        grpc::ClientContext ctx;
        glossary::PathRequest req;
        req.set_source_term(from);
        req.set_target_term(to);
        req.set_max_depth(5);
        glossary::PathResponse resp;
        auto st = stub->FindPath(&ctx, req, &resp);
        if (!st.ok()) {
            report(st);
        } else if (resp.path_exists()) {
            for (int i = 0; i < resp.path_size(); ++i) std::cout << (i ? " -> " : "  ") << resp.path(i);
            std::cout << "\n" << resp.message() << "\n\n";
        } else {
            std::cout << resp.message() << "\n\n";
        }
    }
    return 0;
}
