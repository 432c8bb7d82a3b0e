#pragma once
#include <exception>
#include <stdexcept>
#include <grpcpp/grpcpp.h>
#include "engine.hpp"
#include "glossary.grpc.pb.h"
#include "logging.hpp"

// Runs fn and maps what it throws onto a status: std::invalid_argument is
// INVALID_ARGUMENT, any other std::exception is INTERNAL and logged.
template <typename Fn>
grpc::Status run_guarded(const char* rpc, Fn&& fn) {
    try {
        fn();
        return grpc::Status::OK;
    } catch (const std::invalid_argument& e) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
    } catch (const std::exception& e) {
        glossary_log()->error("{} failed: {}", rpc, e.what());
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

// Maps GlossaryService RPCs onto an Engine. Negative results travel as
// found/path_exists flags with Status::OK; empty term names are
// INVALID_ARGUMENT.
class GlossaryServiceImpl final : public glossary::GlossaryService::Service {
public:
    explicit GlossaryServiceImpl(Engine& eng) : eng_(eng) {}

    grpc::Status GetTerm(grpc::ServerContext*, const glossary::TermRequest* req,
                         glossary::TermResponse* out) override;
    grpc::Status GetAllTerms(grpc::ServerContext*, const google::protobuf::Empty*,
                             glossary::AllTermsResponse* out) override;
    grpc::Status GetTermRelations(grpc::ServerContext*, const glossary::RelationsRequest* req,
                                  glossary::RelationsResponse* out) override;
    grpc::Status FindPath(grpc::ServerContext*, const glossary::PathRequest* req,
                          glossary::PathResponse* out) override;
    grpc::Status LoadGraph(grpc::ServerContext*, const glossary::LoadGraphRequest* req,
                           glossary::LoadGraphResponse* out) override;

private:
    Engine& eng_;
};
