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

#include "graph.hpp"
#include <iosfwd>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace callscope {

// Global rendering attributes written into the description header
struct RenderOptions {
    std::string rankdir = "TB";
    std::string font = "Helvetica";
    int font_size = 10;
};

// One emitted edge. from/to are already in printed order.
struct EdgeRecord {
    NodeId from = INVALID_NODE;
    NodeId to = INVALID_NODE;
    std::string label;
};

// Accumulates the edge stream of one request and serializes it as a
// Graphviz digraph. Edges live in an append/undo log so the most recent
// emission can be retracted; nothing is written until render().
//
// Membership is reference-counted: a node belongs to the output while a
// retained edge touches it or it is pinned as a root. A node whose edges
// were all retracted is dropped rather than kept as an isolated statement.
class OutputAssembler {
public:
    void emit(NodeId from, NodeId to, std::string label = {});

    // Undo the most recent emit(); throws std::logic_error on an empty log
    void retract_last();

    // Number of retained edges
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    const std::vector<EdgeRecord> &records() const { return records_; }

    // Roots stay in the output even without edges
    void pin(NodeId id);
    void unpin(NodeId id);

    // Node is referenced by a retained edge or pinned
    bool is_member(NodeId id) const;

    // Members in order of first appearance
    std::vector<NodeId> members() const;

    // Per-run rendering override, e.g. ("shape", "box")
    void set_attribute(NodeId id, const std::string &key, const std::string &value);
    const std::map<std::string, std::string> &attributes(NodeId id) const;

    // Distinct source files of the members, sorted
    std::set<std::string> source_files(const Graph &graph) const;

    void write(std::ostream &out, const Graph &graph, const RenderOptions &options) const;
    std::string render(const Graph &graph, const RenderOptions &options) const;

private:
    std::vector<EdgeRecord> records_;
    std::unordered_map<NodeId, size_t> edge_refs_;
    std::unordered_map<NodeId, bool> pinned_;
    std::vector<NodeId> order_; // first appearance, never shrinks
    std::unordered_map<NodeId, std::map<std::string, std::string>> attributes_;

    void note(NodeId id);
};

// Quote a string for use as a DOT identifier or attribute value
std::string dot_quote(const std::string &value);

} // namespace callscope
