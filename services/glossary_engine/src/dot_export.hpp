#pragma once
#include <ostream>
#include "engine.hpp"

// Graphviz DOT rendering of a snapshot: one node per term, one labelled
// directed edge per relation. Relation endpoints missing from the term index
// are drawn as dashed nodes.
void write_dot(const GraphSnapshot& g, std::ostream& os);
