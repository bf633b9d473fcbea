// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include "filter.hpp"
#include "graph.hpp"
#include "output.hpp"
#include <unordered_map>
#include <unordered_set>

namespace callscope {

enum class Direction { Forward, Reverse };

const char *direction_to_string(Direction direction);

// Depth sentinel meaning "no bound"
constexpr int UNLIMITED_DEPTH = -1;

struct ExtractOptions {
    Direction direction = Direction::Forward;
    int max_depth = UNLIMITED_DEPTH;
    bool locations = false;            // label edges with call sites
    NodeId end_function = INVALID_NODE; // enables path pruning
};

// Mutable traversal state for one request, shared by all of its roots
struct Session {
    std::unordered_set<NodeId> visited;           // expanded nodes
    std::unordered_map<NodeId, bool> reaches_end; // resolved subtrees (pruning only)
    size_t edges_emitted = 0;
    size_t edges_retracted = 0;
};

// Depth-first, filter-aware subgraph walk. Emits into an OutputAssembler
// and, when an end function is configured, retracts every edge whose
// subtree never reaches it.
class Extractor {
public:
    Extractor(const Graph &graph, FilterRegistry &filters, const ExtractOptions &options,
              Session &session, OutputAssembler &output);

    // Walk from one root and return the number of retained edges it added.
    // A root without surviving edges is kept as an isolated node. Throws
    // EmptyResultError when pruning retracted everything the root emitted.
    size_t extract(NodeId root);

private:
    const Graph &graph_;
    FilterRegistry &filters_;
    ExtractOptions options_;
    Session &session_;
    OutputAssembler &output_;

    bool pruning() const { return options_.end_function != INVALID_NODE; }

    const std::vector<Edge> &relations(NodeId id) const;

    // Node may be expanded at this depth
    bool expandable(NodeId id, int depth) const;

    void mark_node(NodeId id);
};

} // namespace callscope
