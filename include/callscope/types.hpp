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

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace callscope {

// ============================================================================
// String Pool - Intern strings to avoid duplication
// ============================================================================
class StringPool {
public:
    // Intern a string and return its index
    size_t intern(std::string_view str) {
        auto it = index_.find(str);
        if (it != index_.end()) {
            return it->second;
        }
        size_t idx = strings_.size();
        strings_.emplace_back(str);
        // deque never relocates existing elements, so the view stays valid
        index_[strings_.back()] = idx;
        return idx;
    }

    // Get string by index
    const std::string &get(size_t idx) const {
        static const std::string empty;
        return (idx < strings_.size()) ? strings_[idx] : empty;
    }

    // Get index for string (returns SIZE_MAX if not found)
    size_t find(std::string_view str) const {
        auto it = index_.find(str);
        return (it != index_.end()) ? it->second : SIZE_MAX;
    }

    size_t size() const { return strings_.size(); }

    void shrink_to_fit() { strings_.shrink_to_fit(); }

    void clear() {
        strings_.clear();
        index_.clear();
    }

    auto begin() const { return strings_.begin(); }
    auto end() const { return strings_.end(); }

private:
    std::deque<std::string> strings_;
    std::unordered_map<std::string_view, size_t> index_;
};

// Node identifier - dense index into CallGraph::nodes
using NodeId = uint32_t;

constexpr NodeId INVALID_NODE = UINT32_MAX;
constexpr size_t NO_FILE = SIZE_MAX;

// Directed relation between two functions. Stored once in the caller's
// callee list and once in the callee's caller list.
struct Edge {
    NodeId target = INVALID_NODE;
    std::vector<std::string> sites; // call-site locations ("file:line")
};

// One function or symbol
struct Node {
    size_t name_idx = 0;        // index into CallGraph::symbol_pool
    std::string location;       // declared location, "file:line" or an address
    size_t file_idx = NO_FILE;  // index into CallGraph::filepath_pool
    bool defined = false;       // false => extern
    std::vector<Edge> callees;
    std::vector<Edge> callers;
};

// Split "path/to/file.c:123" into its file part. Addresses and bare names
// have no file.
inline std::string_view location_file(std::string_view location) {
    if (location.empty() || location.rfind("0x", 0) == 0)
        return {};
    size_t colon = location.rfind(':');
    if (colon == std::string_view::npos || colon == 0)
        return location;
    std::string_view tail = location.substr(colon + 1);
    if (tail.empty())
        return location.substr(0, colon);
    for (char c : tail) {
        if (c < '0' || c > '9')
            return location;
    }
    return location.substr(0, colon);
}

// Call graph representation using dense node ids with string interning
struct CallGraph {
    // String pool for symbol names - single source of truth for strings
    StringPool symbol_pool;

    // Symbol name -> node id (keys are views into symbol_pool)
    std::unordered_map<std::string_view, NodeId> symbol_to_id;

    std::vector<Node> nodes;

    // Source files referenced by node locations
    StringPool filepath_pool;

    size_t num_edges = 0;

    // Get or create the node for a symbol (uses string interning)
    NodeId get_or_create_id(std::string_view symbol_name) {
        auto it = symbol_to_id.find(symbol_name);
        if (it != symbol_to_id.end()) {
            return it->second;
        }
        NodeId id = static_cast<NodeId>(nodes.size());
        size_t str_idx = symbol_pool.intern(symbol_name);
        symbol_to_id[symbol_pool.get(str_idx)] = id;
        Node node;
        node.name_idx = str_idx;
        nodes.push_back(std::move(node));
        return id;
    }

    // Get node id for a symbol (returns INVALID_NODE if not found)
    NodeId get_id(std::string_view symbol_name) const {
        auto it = symbol_to_id.find(symbol_name);
        return (it != symbol_to_id.end()) ? it->second : INVALID_NODE;
    }

    // Get symbol name from node id (returns reference to interned string)
    const std::string &get_symbol(NodeId id) const {
        static const std::string empty_str;
        return (id < nodes.size()) ? symbol_pool.get(nodes[id].name_idx) : empty_str;
    }

    // Record where a symbol is declared
    void set_location(NodeId id, std::string_view location) {
        Node &node = nodes[id];
        node.location = std::string(location);
        std::string_view file = location_file(location);
        node.file_idx = file.empty() ? NO_FILE : filepath_pool.intern(file);
    }

    // Add a call edge; duplicate calls merge into the existing edge
    Edge &add_call(NodeId caller, NodeId callee) {
        for (Edge &edge : nodes[caller].callees) {
            if (edge.target == callee)
                return edge;
        }
        Edge reverse;
        reverse.target = caller;
        nodes[callee].callers.push_back(std::move(reverse));
        Edge forward;
        forward.target = callee;
        nodes[caller].callees.push_back(std::move(forward));
        ++num_edges;
        return nodes[caller].callees.back();
    }

    // Attach a call-site location to caller -> callee (creating the call)
    void add_site(NodeId caller, NodeId callee, std::string_view location) {
        add_call(caller, callee).sites.emplace_back(location);
        for (Edge &edge : nodes[callee].callers) {
            if (edge.target == caller) {
                edge.sites.emplace_back(location);
                break;
            }
        }
    }

    // Get file path of a node's declaration (empty if unknown)
    const std::string &get_file_path(NodeId id) const {
        static const std::string empty_str;
        if (id >= nodes.size() || nodes[id].file_idx == NO_FILE)
            return empty_str;
        return filepath_pool.get(nodes[id].file_idx);
    }

    size_t num_nodes() const { return nodes.size(); }

    // Reclaim unused memory from all containers
    void shrink_to_fit() {
        symbol_pool.shrink_to_fit();
        filepath_pool.shrink_to_fit();
        nodes.shrink_to_fit();
        for (auto &node : nodes) {
            node.callees.shrink_to_fit();
            node.callers.shrink_to_fit();
        }
    }
};

} // namespace callscope
