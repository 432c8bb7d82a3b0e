#include "glossary_service.hpp"

using grpc::Status;

namespace {

void fill(glossary::Term* t, const TermRec& r) {
    t->set_name(r.name);
    t->set_definition(r.definition);
}

void fill(glossary::Relation* e, const RelationRec& r) {
    e->set_source_term(r.src);
    e->set_target_term(r.dst);
    e->set_relation_type(r.type);
}

}  // namespace

Status GlossaryServiceImpl::GetTerm(grpc::ServerContext*, const glossary::TermRequest* req,
                                    glossary::TermResponse* out) {
    return run_guarded("GetTerm", [&] {
        auto t = eng_.get_term(req->term_name());
        out->set_found(t.has_value());
        if (t) fill(out->mutable_term(), *t);
    });
}

Status GlossaryServiceImpl::GetAllTerms(grpc::ServerContext*, const google::protobuf::Empty*,
                                        glossary::AllTermsResponse* out) {
    return run_guarded("GetAllTerms", [&] {
        auto res = eng_.list_all_terms();
        out->mutable_terms()->Reserve(static_cast<int>(res.terms.size()));
        for (auto& t : res.terms) fill(out->add_terms(), t);
        out->set_total_count(static_cast<int32_t>(res.total_count));
    });
}

Status GlossaryServiceImpl::GetTermRelations(grpc::ServerContext*, const glossary::RelationsRequest* req,
                                             glossary::RelationsResponse* out) {
    return run_guarded("GetTermRelations", [&] {
        auto res = eng_.list_relations(req->term_name(), req->max_depth());
        for (auto& r : res.relations) fill(out->add_relations(), r);
        out->set_total_count(static_cast<int32_t>(res.total_count));
        out->set_truncated(res.truncated);
    });
}

Status GlossaryServiceImpl::FindPath(grpc::ServerContext*, const glossary::PathRequest* req,
                                     glossary::PathResponse* out) {
    return run_guarded("FindPath", [&] {
        auto res = eng_.find_path(req->source_term(), req->target_term(), req->max_depth());
        for (auto& p : res.path) out->add_path(p);
        out->set_path_exists(res.exists);
        out->set_message(res.message);
    });
}

Status GlossaryServiceImpl::LoadGraph(grpc::ServerContext*, const glossary::LoadGraphRequest* req,
                                      glossary::LoadGraphResponse* out) {
    return run_guarded("LoadGraph", [&] {
        std::vector<TermRec> ts;
        ts.reserve(req->terms_size());
        for (auto& t : req->terms()) ts.push_back({t.name(), t.definition()});
        std::vector<RelationRec> rs;
        rs.reserve(req->relations_size());
        for (auto& r : req->relations()) rs.push_back({r.source_term(), r.target_term(), r.relation_type()});

        auto res = eng_.load(ts, rs);
        out->set_ok(res.ok);
        out->set_message(res.message);
        out->set_term_count(static_cast<int32_t>(res.term_count));
        out->set_relation_count(static_cast<int32_t>(res.relation_count));
    });
}
