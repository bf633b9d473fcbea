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
#include "callscope/output.hpp"
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace callscope {

std::string dot_quote(const std::string &value) {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted.push_back('"');
    for (char c : value) {
        switch (c) {
        case '"':
            quoted.append("\\\"");
            break;
        case '\\':
            quoted.append("\\\\");
            break;
        case '\n':
            // DOT line break inside a label
            quoted.append("\\n");
            break;
        default:
            quoted.push_back(c);
        }
    }
    quoted.push_back('"');
    return quoted;
}

void OutputAssembler::note(NodeId id) {
    if (edge_refs_.find(id) == edge_refs_.end() && pinned_.find(id) == pinned_.end()) {
        order_.push_back(id);
    }
}

void OutputAssembler::emit(NodeId from, NodeId to, std::string label) {
    note(from);
    ++edge_refs_[from];
    note(to);
    ++edge_refs_[to];
    records_.push_back({from, to, std::move(label)});
}

void OutputAssembler::retract_last() {
    if (records_.empty()) {
        throw std::logic_error("retract_last() on an empty edge log");
    }
    const EdgeRecord &last = records_.back();
    --edge_refs_[last.from];
    --edge_refs_[last.to];
    records_.pop_back();
}

void OutputAssembler::pin(NodeId id) {
    note(id);
    pinned_[id] = true;
}

void OutputAssembler::unpin(NodeId id) {
    auto it = pinned_.find(id);
    if (it != pinned_.end()) {
        it->second = false;
    }
}

bool OutputAssembler::is_member(NodeId id) const {
    auto pin = pinned_.find(id);
    if (pin != pinned_.end() && pin->second) {
        return true;
    }
    auto refs = edge_refs_.find(id);
    return refs != edge_refs_.end() && refs->second > 0;
}

std::vector<NodeId> OutputAssembler::members() const {
    std::vector<NodeId> result;
    result.reserve(order_.size());
    for (NodeId id : order_) {
        if (is_member(id)) {
            result.push_back(id);
        }
    }
    return result;
}

void OutputAssembler::set_attribute(NodeId id, const std::string &key, const std::string &value) {
    attributes_[id][key] = value;
}

const std::map<std::string, std::string> &OutputAssembler::attributes(NodeId id) const {
    static const std::map<std::string, std::string> empty;
    auto it = attributes_.find(id);
    return (it != attributes_.end()) ? it->second : empty;
}

std::set<std::string> OutputAssembler::source_files(const Graph &graph) const {
    std::set<std::string> files;
    for (NodeId id : members()) {
        const std::string &file = graph.get_file_path(id);
        if (!file.empty()) {
            files.insert(file);
        }
    }
    return files;
}

void OutputAssembler::write(std::ostream &out, const Graph &graph,
                            const RenderOptions &options) const {
    out << "digraph callscope {\n";
    out << "  graph [rankdir=" << options.rankdir << ", fontname=" << dot_quote(options.font)
        << ", fontsize=" << options.font_size << "];\n";
    out << "  node [fontname=" << dot_quote(options.font) << ", fontsize=" << options.font_size
        << "];\n";

    for (const auto &record : records_) {
        out << "  " << dot_quote(graph.get_symbol(record.from)) << " -> "
            << dot_quote(graph.get_symbol(record.to));
        if (!record.label.empty()) {
            out << " [label=" << dot_quote(record.label) << "]";
        }
        out << ";\n";
    }

    for (NodeId id : members()) {
        const std::string &name = graph.get_symbol(id);
        const std::string &location = graph.node(id).location;
        out << "  " << dot_quote(name) << " [label="
            << dot_quote(location.empty() ? name : name + "\n" + location);
        for (const auto &[key, value] : attributes(id)) {
            out << ", " << key << "=" << dot_quote(value);
        }
        out << "];\n";
    }

    out << "}\n";
}

std::string OutputAssembler::render(const Graph &graph, const RenderOptions &options) const {
    std::ostringstream out;
    write(out, graph, options);
    return out.str();
}

} // namespace callscope
