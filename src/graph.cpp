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
#include "callscope/graph.hpp"
#include "callscope/errors.hpp"
#include "callscope/version.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace callscope {

NodeId Graph::add_node(const std::string &name, const std::string &location, bool defined) {
    NodeId id = call_graph.get_or_create_id(name);
    // First declaration with a location wins
    if (!location.empty() && call_graph.nodes[id].location.empty()) {
        call_graph.set_location(id, location);
    }
    call_graph.nodes[id].defined = call_graph.nodes[id].defined || defined;
    return id;
}

NodeId Graph::add_node(const std::string &name) {
    return call_graph.get_or_create_id(name);
}

void Graph::add_call(const std::string &caller, const std::string &callee) {
    NodeId caller_id = call_graph.get_or_create_id(caller);
    NodeId callee_id = call_graph.get_or_create_id(callee);
    call_graph.add_call(caller_id, callee_id);
}

void Graph::add_call_site(const std::string &caller, const std::string &tag) {
    size_t sep = tag.find('~');
    if (sep == std::string::npos || sep == 0) {
        throw InputError("Malformed call-site tag '" + tag + "' on " + caller +
                         " (expected target~location)");
    }
    NodeId caller_id = call_graph.get_or_create_id(caller);
    NodeId callee_id = call_graph.get_or_create_id(std::string_view(tag).substr(0, sep));
    call_graph.add_site(caller_id, callee_id, std::string_view(tag).substr(sep + 1));
}

// Stream JSON directly - one node per line so large graphs diff well
void Graph::save(std::ostream &out) const {
    out << "{\"metadata\":{";
    out << "\"version\":\"" << GRAPH_SCHEMA_VERSION << "\",";
    out << "\"num_nodes\":" << call_graph.num_nodes() << ",";
    out << "\"num_edges\":" << call_graph.num_edges << "},\n";
    out << "\"nodes\":[";

    for (NodeId id = 0; id < call_graph.nodes.size(); ++id) {
        const Node &node = call_graph.nodes[id];
        if (id > 0) out << ",";
        out << "\n{\"name\":" << json(get_symbol(id)).dump();
        if (!node.location.empty()) {
            out << ",\"location\":" << json(node.location).dump();
        }
        out << ",\"defined\":" << (node.defined ? "true" : "false");

        out << ",\"calls\":[";
        bool first = true;
        for (const Edge &edge : node.callees) {
            if (!first) out << ",";
            first = false;
            out << json(get_symbol(edge.target)).dump();
        }
        out << "]";

        bool has_sites = std::any_of(node.callees.begin(), node.callees.end(),
                                     [](const Edge &e) { return !e.sites.empty(); });
        if (has_sites) {
            out << ",\"sites\":[";
            first = true;
            for (const Edge &edge : node.callees) {
                for (const auto &site : edge.sites) {
                    if (!first) out << ",";
                    first = false;
                    out << json(get_symbol(edge.target) + "~" + site).dump();
                }
            }
            out << "]";
        }
        out << "}";
    }
    out << "\n]}\n";
}

void Graph::save(const std::string &filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw ResourceError("Failed to open file for writing: " + filepath);
    }
    save(file);
    if (!file) {
        throw ResourceError("Failed to write graph file: " + filepath);
    }
}

// SAX-style JSON parser handler for memory-efficient loading
class GraphSaxHandler : public json::json_sax_t {
public:
    Graph &graph;
    std::string source;

    enum class Section { None, Metadata, Nodes, Unknown };
    enum class Field { None, Name, Location, Defined, Calls, Sites, Other };
    Section current_section = Section::None;
    Field current_field = Field::None;

    // Node record being assembled
    struct NodeRecord {
        std::string name;
        std::string location;
        bool defined = false;
        bool has_defined = false;
        std::vector<std::string> calls;
        std::vector<std::string> sites;
    };
    NodeRecord current;

    std::string current_key;
    int depth = 0;       // object nesting
    int array_depth = 0; // array nesting inside "nodes"
    int skip_depth = 0;  // nesting of a value we do not care about
    bool in_node = false;
    bool seen_version = false;
    bool seen_nodes = false;
    size_t node_count = 0;

    GraphSaxHandler(Graph &g, std::string src) : graph(g), source(std::move(src)) {}

    [[noreturn]] void fail(const std::string &what) const {
        throw InputError(source + ": " + what);
    }

    void commit_node() {
        ++node_count;
        if (current.name.empty()) {
            fail("node #" + std::to_string(node_count) + " has no name");
        }
        bool defined = current.has_defined ? current.defined : !current.location.empty();
        graph.add_node(current.name, current.location, defined);
        for (const auto &callee : current.calls) {
            graph.add_call(current.name, callee);
        }
        for (const auto &tag : current.sites) {
            graph.add_call_site(current.name, tag);
        }
        current = NodeRecord{};
    }

    bool null() override { return true; }

    bool boolean(bool val) override {
        if (skip_depth > 0) return true;
        if (in_node && current_field == Field::Defined) {
            current.defined = val;
            current.has_defined = true;
        }
        return true;
    }

    bool number_integer(number_integer_t) override { return true; }

    bool number_unsigned(number_unsigned_t val) override {
        if (skip_depth > 0) return true;
        if (current_section == Section::Metadata && depth == 2 && current_key == "num_nodes") {
            graph.call_graph.nodes.reserve(static_cast<size_t>(val));
        }
        return true;
    }

    bool number_float(number_float_t, const string_t &) override { return true; }

    bool string(string_t &val) override {
        if (skip_depth > 0) return true;

        if (current_section == Section::Metadata && depth == 2) {
            if (current_key == "version") {
                int major = 0, minor = 0, patch = 0;
                if (!parse_version(val, major, minor, patch)) {
                    fail("invalid schema version '" + val + "'");
                }
                if (!is_schema_compatible(major)) {
                    fail("graph file version " + val + " is not compatible with schema " +
                         GRAPH_SCHEMA_VERSION + ". Please regenerate the graph.");
                }
                seen_version = true;
            }
            return true;
        }

        if (current_section != Section::Nodes) return true;
        if (!in_node) {
            fail("entries of 'nodes' must be objects");
        }

        switch (current_field) {
        case Field::Name:
            current.name = val;
            break;
        case Field::Location:
            current.location = val;
            break;
        case Field::Calls:
            if (array_depth != 2) fail("'calls' of " + current.name + " must be an array");
            current.calls.push_back(val);
            break;
        case Field::Sites:
            if (array_depth != 2) fail("'sites' of " + current.name + " must be an array");
            current.sites.push_back(val);
            break;
        default:
            break;
        }
        return true;
    }

    bool binary(binary_t &) override { return true; }

    bool start_object(std::size_t) override {
        if (skip_depth > 0) {
            skip_depth++;
            return true;
        }
        depth++;
        if (depth == 1) return true;
        if (depth == 2 && current_section == Section::Metadata) return true;
        if (depth == 2 && current_section == Section::Nodes && array_depth == 1) {
            in_node = true;
            current_field = Field::None;
            return true;
        }
        // Anything else is opaque to us
        depth--;
        skip_depth = 1;
        return true;
    }

    bool end_object() override {
        if (skip_depth > 0) {
            skip_depth--;
            return true;
        }
        if (depth == 2 && in_node) {
            commit_node();
            in_node = false;
        } else if (depth == 2 && current_section == Section::Metadata) {
            current_section = Section::None;
        }
        depth--;
        return true;
    }

    bool start_array(std::size_t) override {
        if (skip_depth > 0) {
            skip_depth++;
            return true;
        }
        if (depth == 0) {
            fail("graph file must contain a JSON object");
        }
        if (depth == 1 && current_section == Section::Nodes && array_depth == 0) {
            array_depth = 1;
            seen_nodes = true;
            return true;
        }
        if (in_node && array_depth == 1 &&
            (current_field == Field::Calls || current_field == Field::Sites)) {
            array_depth = 2;
            return true;
        }
        skip_depth = 1;
        return true;
    }

    bool end_array() override {
        if (skip_depth > 0) {
            skip_depth--;
            return true;
        }
        array_depth--;
        if (array_depth == 0) {
            current_section = Section::None;
        }
        return true;
    }

    bool key(string_t &key) override {
        if (skip_depth > 0) return true;

        if (depth == 1) {
            if (key == "metadata") current_section = Section::Metadata;
            else if (key == "nodes") current_section = Section::Nodes;
            else current_section = Section::Unknown;
        } else if (depth == 2 && current_section == Section::Metadata) {
            current_key = key;
        } else if (depth == 2 && in_node) {
            if (key == "name") current_field = Field::Name;
            else if (key == "location") current_field = Field::Location;
            else if (key == "defined") current_field = Field::Defined;
            else if (key == "calls") current_field = Field::Calls;
            else if (key == "sites") current_field = Field::Sites;
            else current_field = Field::Other;
        }
        return true;
    }

    bool parse_error(std::size_t position, const std::string &,
                     const json::exception &ex) override {
        fail("JSON parse error at position " + std::to_string(position) + ": " + ex.what());
    }
};

// Load from stream using streaming SAX parser (memory efficient)
Graph Graph::load(std::istream &in, const std::string &source_name) {
    Graph g;
    GraphSaxHandler handler(g, source_name);

    // Use SAX parser - processes JSON without building DOM
    bool result = json::sax_parse(in, &handler);
    if (!result) {
        throw InputError("Failed to parse graph file: " + source_name);
    }
    if (!handler.seen_version) {
        throw InputError(source_name + ": missing metadata.version");
    }
    if (!handler.seen_nodes) {
        throw InputError(source_name + ": missing 'nodes' array");
    }

    g.call_graph.shrink_to_fit();
    return g;
}

Graph Graph::load(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw InputError("Failed to open graph file: " + filepath);
    }
    return load(file, filepath);
}

NodeId Graph::get_id(const std::string &name) const {
    return call_graph.get_id(name);
}

NodeId Graph::resolve(const std::string &name) const {
    NodeId id = call_graph.get_id(name);
    if (id != INVALID_NODE) {
        return id;
    }

    std::string message = "Symbol not found: " + name;
    auto matches = find_symbols(name);
    std::sort(matches.begin(), matches.end());
    if (!matches.empty()) {
        message += ". Did you mean one of these?";
        for (size_t i = 0; i < std::min(matches.size(), size_t(5)); ++i)
            message += "\n  " + matches[i];
    }
    throw NotFoundError(message);
}

const std::string &Graph::get_symbol(NodeId id) const {
    return call_graph.get_symbol(id);
}

const Node &Graph::node(NodeId id) const {
    return call_graph.nodes.at(id);
}

const std::vector<Edge> &Graph::get_callees(NodeId caller) const {
    static const std::vector<Edge> empty;
    return (caller < call_graph.nodes.size()) ? call_graph.nodes[caller].callees : empty;
}

const std::vector<Edge> &Graph::get_callers(NodeId callee) const {
    static const std::vector<Edge> empty;
    return (callee < call_graph.nodes.size()) ? call_graph.nodes[callee].callers : empty;
}

bool Graph::has_symbol(const std::string &name) const {
    return call_graph.get_id(name) != INVALID_NODE;
}

bool Graph::is_defined(NodeId id) const {
    return id < call_graph.nodes.size() && call_graph.nodes[id].defined;
}

const std::string &Graph::get_file_path(NodeId id) const {
    return call_graph.get_file_path(id);
}

size_t Graph::num_nodes() const { return call_graph.num_nodes(); }

size_t Graph::num_edges() const { return call_graph.num_edges; }

std::vector<std::string> Graph::get_all_symbols() const {
    std::vector<std::string> symbols;
    symbols.reserve(call_graph.nodes.size());
    for (NodeId id = 0; id < call_graph.nodes.size(); ++id) {
        symbols.push_back(get_symbol(id));
    }
    return symbols;
}

std::vector<std::string> Graph::find_symbols(const std::vector<std::string> &patterns) const {
    if (patterns.empty())
        return {};

    // Start with first pattern
    std::vector<std::string> matches = find_symbols(patterns[0]);

    // Narrow down with each subsequent pattern
    for (size_t i = 1; i < patterns.size() && !matches.empty(); ++i) {
        std::vector<std::string> filtered;
        for (const auto &sym : matches) {
            if (sym.find(patterns[i]) != std::string::npos) {
                filtered.push_back(sym);
            }
        }
        matches = std::move(filtered);
    }

    return matches;
}

std::vector<std::string> Graph::find_symbols(const std::string &pattern) const {
    std::vector<std::string> matches;
    for (const auto &symbol : call_graph.symbol_pool) {
        if (symbol.find(pattern) != std::string::npos) {
            matches.push_back(symbol);
        }
    }
    return matches;
}

std::vector<NodeId> Graph::match_symbols(const std::regex &pattern) const {
    std::vector<NodeId> matches;
    for (NodeId id = 0; id < call_graph.nodes.size(); ++id) {
        if (std::regex_search(get_symbol(id), pattern)) {
            matches.push_back(id);
        }
    }
    return matches;
}

} // namespace callscope
