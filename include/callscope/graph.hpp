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

#include "types.hpp"
#include <iosfwd>
#include <nlohmann/json.hpp>
#include <regex>
#include <string>
#include <vector>

namespace callscope {

using json = nlohmann::json;

class Graph {
public:
    CallGraph call_graph;

    // Declare a symbol with its location; defined == false marks it extern
    NodeId add_node(const std::string &name, const std::string &location, bool defined);

    // Reference a symbol without declaring it (extern until declared)
    NodeId add_node(const std::string &name);

    // Add a call relationship
    void add_call(const std::string &caller, const std::string &callee);

    // Add a "target~location" call-site tag recorded on the caller
    void add_call_site(const std::string &caller, const std::string &tag);

    // Save to file in the graph file format
    void save(const std::string &filepath) const;
    void save(std::ostream &out) const;

    // Load from file (streaming SAX parse; throws InputError)
    static Graph load(const std::string &filepath);
    static Graph load(std::istream &in, const std::string &source_name);

    // Get node id for symbol (INVALID_NODE if absent)
    NodeId get_id(const std::string &name) const;

    // Exact lookup; throws NotFoundError with suggestions when absent
    NodeId resolve(const std::string &name) const;

    // Get symbol name from node id
    const std::string &get_symbol(NodeId id) const;

    const Node &node(NodeId id) const;

    // Get callees for a caller
    const std::vector<Edge> &get_callees(NodeId caller) const;

    // Get callers for a callee
    const std::vector<Edge> &get_callers(NodeId callee) const;

    // Check if symbol exists
    bool has_symbol(const std::string &name) const;

    // False for functions with no known definition
    bool is_defined(NodeId id) const;

    // Source file of a node's declaration (empty if unknown)
    const std::string &get_file_path(NodeId id) const;

    size_t num_nodes() const;
    size_t num_edges() const;

    // Get all symbols
    std::vector<std::string> get_all_symbols() const;

    // Symbols containing every pattern as a substring
    std::vector<std::string> find_symbols(const std::vector<std::string> &patterns) const;
    std::vector<std::string> find_symbols(const std::string &pattern) const;

    // Nodes whose name matches a regular expression, in id order
    std::vector<NodeId> match_symbols(const std::regex &pattern) const;
};

} // namespace callscope
