#pragma once
#include <string>
#include <vector>
#include "engine.hpp"

inline std::vector<TermRec> terms_of(const std::vector<std::string>& names) {
    std::vector<TermRec> ts;
    for (auto& n : names) ts.push_back({n, "definition of " + n});
    return ts;
}

// cat -is-a-> animal, cat -is-a-> pet
inline Engine pet_engine(EngineOptions opts = EngineOptions()) {
    return Engine(terms_of({"cat", "animal", "pet"}),
                  {{"cat", "animal", "is-a"}, {"cat", "pet", "is-a"}}, opts);
}
