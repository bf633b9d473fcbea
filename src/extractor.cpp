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
#include "callscope/extractor.hpp"
#include "callscope/errors.hpp"

namespace callscope {

const char *direction_to_string(Direction direction) {
    switch (direction) {
    case Direction::Forward:
        return "forward";
    case Direction::Reverse:
        return "reverse";
    default:
        return "unknown";
    }
}

Extractor::Extractor(const Graph &graph, FilterRegistry &filters, const ExtractOptions &options,
                     Session &session, OutputAssembler &output)
    : graph_(graph), filters_(filters), options_(options), session_(session), output_(output) {}

const std::vector<Edge> &Extractor::relations(NodeId id) const {
    return options_.direction == Direction::Forward ? graph_.get_callees(id)
                                                    : graph_.get_callers(id);
}

bool Extractor::expandable(NodeId id, int depth) const {
    if (session_.visited.count(id))
        return false;
    if (options_.max_depth != UNLIMITED_DEPTH && depth >= options_.max_depth)
        return false;
    return !relations(id).empty();
}

void Extractor::mark_node(NodeId id) {
    if (!graph_.is_defined(id)) {
        output_.set_attribute(id, "style", "dashed");
    }
    if (id == options_.end_function) {
        output_.set_attribute(id, "color", "red");
    }
}

size_t Extractor::extract(NodeId root) {
    // State stores an index into the active relation list of each node
    struct State {
        NodeId node;
        int depth;
        size_t next;    // next relation to examine
        NodeId pending; // child being expanded, INVALID_NODE if none
        bool reached;   // some child subtree reached the end function
    };

    const size_t records_before = output_.size();
    const size_t emitted_before = session_.edges_emitted;

    output_.pin(root);
    mark_node(root);
    output_.set_attribute(root, "style", "bold,filled");
    output_.set_attribute(root, "fillcolor", "#f5f5f5");

    // A root that is the end function is a path of length zero
    if (pruning() && root == options_.end_function)
        return 0;

    // Retract the edge to dest unless its subtree reached the end function
    auto settle = [&](State &state, bool reached) {
        if (!pruning())
            return;
        if (reached) {
            state.reached = true;
        } else {
            output_.retract_last();
            ++session_.edges_retracted;
        }
    };

    std::vector<State> stack;
    stack.reserve(256);

    if (expandable(root, 0)) {
        session_.visited.insert(root);
        stack.push_back({root, 0, 0, INVALID_NODE, false});
    }

    while (!stack.empty()) {
        State &state = stack.back();

        // Returning from a child's subtree
        if (state.pending != INVALID_NODE) {
            NodeId child = state.pending;
            state.pending = INVALID_NODE;
            if (pruning())
                settle(state, child == options_.end_function || session_.reaches_end[child]);
            continue;
        }

        const auto &edges = relations(state.node);
        if (state.next == edges.size()) {
            if (pruning())
                session_.reaches_end[state.node] = state.reached;
            stack.pop_back();
            continue;
        }

        const Edge &relation = edges[state.next++];
        NodeId dest = relation.target;

        if (filters_.excluded(graph_, dest))
            continue;

        std::string label;
        if (options_.locations) {
            for (const auto &site : relation.sites) {
                if (!label.empty())
                    label.push_back('\n');
                label += site;
            }
        }
        output_.emit(state.node, dest, std::move(label));
        ++session_.edges_emitted;
        mark_node(dest);

        bool reached = dest == options_.end_function;

        if (filters_.is_shown(graph_.get_symbol(dest))) {
            output_.set_attribute(dest, "shape", "box");
            output_.set_attribute(dest, "style", "filled");
            output_.set_attribute(dest, "fillcolor", "#ffe0b0");
            settle(state, reached);
            continue;
        }

        if (expandable(dest, state.depth + 1)) {
            session_.visited.insert(dest);
            state.pending = dest;
            int depth = state.depth + 1;
            // state is invalidated by push_back
            stack.push_back({dest, depth, 0, INVALID_NODE, false});
            continue;
        }

        // Already expanded elsewhere, depth-bounded or a leaf
        if (session_.visited.count(dest)) {
            auto it = session_.reaches_end.find(dest);
            reached = reached || (it != session_.reaches_end.end() && it->second);
        }
        settle(state, reached);
    }

    size_t retained = output_.size() - records_before;
    if (pruning() && retained == 0 && session_.edges_emitted > emitted_before) {
        output_.unpin(root);
        throw EmptyResultError("No path from " + graph_.get_symbol(root) + " reaches " +
                               graph_.get_symbol(options_.end_function));
    }
    return retained;
}

} // namespace callscope
