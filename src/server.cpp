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
#include "callscope/server.hpp"
#include "callscope/errors.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <regex>

namespace callscope {

static void write_text(const fs::path &path, const std::string &text) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw ResourceError("Failed to open file for writing: " + path.string());
    }
    file << text;
    if (!file) {
        throw ResourceError("Failed to write " + path.string());
    }
}

static void write_file_list(const fs::path &path, const std::set<std::string> &files) {
    std::string text;
    for (const auto &file : files) {
        text += file;
        text.push_back('\n');
    }
    write_text(path, text);
}

static fs::path with_suffix(const std::string &output, const char *suffix) {
    return fs::path(output + suffix);
}

Server::Server(const Graph &graph, LayoutEngine &engine, std::ostream &status)
    : graph_(graph), engine_(engine), status_(status) {}

std::vector<NodeId> Server::resolve_roots(const Request &request) const {
    std::vector<NodeId> roots;
    auto add = [&roots](NodeId id) {
        if (std::find(roots.begin(), roots.end(), id) == roots.end())
            roots.push_back(id);
    };

    // Explicit names first in request order, pattern hits by name
    for (const auto &name : request.roots) {
        add(graph_.resolve(name));
    }
    const size_t explicit_count = roots.size();

    for (const auto &pattern : request.root_patterns) {
        std::vector<NodeId> matches;
        try {
            matches = graph_.match_symbols(std::regex(pattern, std::regex::ECMAScript));
        } catch (const std::regex_error &e) {
            throw ConfigError("Invalid root pattern '" + pattern + "': " + e.what());
        }
        if (matches.empty()) {
            throw NotFoundError("No symbol matches root pattern '" + pattern + "'");
        }
        for (NodeId id : matches) {
            add(id);
        }
    }

    std::sort(roots.begin() + static_cast<std::ptrdiff_t>(explicit_count), roots.end(),
              [this](NodeId a, NodeId b) { return graph_.get_symbol(a) < graph_.get_symbol(b); });
    return roots;
}

void Server::write_output(const Request &request, const std::string &description,
                          const OutputAssembler &output) {
    if (!request.needs_layout()) {
        if (request.output == "-") {
            std::cout << description << std::flush;
        } else {
            write_text(request.output, description);
        }
        if (request.keep && request.output != "-") {
            write_file_list(with_suffix(request.output, ".files"), output.source_files(graph_));
        }
        return;
    }

    WorkDir work;
    fs::path dot_path = work.path() / "callscope.dot";
    write_text(dot_path, description);

    auto keep_intermediate = [&]() {
        if (!request.keep)
            return;
        std::error_code ec;
        fs::copy_file(dot_path, with_suffix(request.output, ".dot"),
                      fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw ResourceError("Failed to keep graph description: " + ec.message());
        }
        write_file_list(with_suffix(request.output, ".files"), output.source_files(graph_));
    };

    try {
        engine_.render(dot_path, request.output, request.format);
    } catch (const RenderError &) {
        // The render failure is the one worth reporting
        try {
            keep_intermediate();
        } catch (const ResourceError &e) {
            status_ << "Warning: " << e.what() << std::endl;
        }
        throw;
    }
    keep_intermediate();
}

RequestResult Server::process(const Request &request) {
    request.validate();

    FilterRegistry filters(request.filters);
    std::vector<NodeId> roots = resolve_roots(request);

    ExtractOptions options;
    options.direction = request.direction;
    options.max_depth = request.max_depth;
    options.locations = request.locations;
    if (!request.end_function.empty()) {
        options.end_function = graph_.resolve(request.end_function);
    }

    Session session;
    OutputAssembler output;
    Extractor extractor(graph_, filters, options, session, output);

    RequestResult result;
    result.output = request.output;
    result.roots = roots.size();

    for (NodeId root : roots) {
        try {
            extractor.extract(root);
        } catch (const EmptyResultError &e) {
            status_ << "Warning: " << e.what() << std::endl;
            ++result.empty_roots;
        }
    }

    if (result.empty_roots == result.roots) {
        throw EmptyResultError("No graph generated: filters eliminated every requested root");
    }

    result.edges = output.size();
    result.nodes = output.members().size();
    result.retracted = session.edges_retracted;

    write_output(request, output.render(graph_, request.render), output);
    return result;
}

int Server::run_once(const Request &request) {
    try {
        RequestResult result = process(request);
        ++served_;
        if (result.output != "-") {
            status_ << "Graph written to: " << result.output << " (" << result.edges
                    << " edges, " << result.nodes << " nodes)" << std::endl;
        }
        return 0;
    } catch (const EmptyResultError &e) {
        ++served_;
        status_ << "Warning: " << e.what() << std::endl;
        return 0;
    } catch (const Error &e) {
        status_ << "Error: " << e.what() << std::endl;
        return 1;
    }
}

bool Server::handle_record(const std::string &record) {
    ++served_;
    try {
        Request request = Request::decode(record);
        RequestResult result = process(request);
        status_ << "ok " << result.output << " (" << result.edges << " edges, "
                << result.nodes << " nodes)" << std::endl;
        return true;
    } catch (const Error &e) {
        status_ << "Error: " << e.what() << std::endl;
    } catch (const std::exception &e) {
        // Keep serving; the next request gets a fresh session
        status_ << "Error: unexpected failure: " << e.what() << std::endl;
    }
    return false;
}

void Server::serve(RequestChannel &channel, const std::atomic<bool> &stop,
                   std::chrono::milliseconds poll_slice) {
    status_ << "Listening on " << channel.path() << " (" << graph_.num_nodes() << " nodes, "
            << graph_.num_edges() << " edges)" << std::endl;

    while (!stop.load()) {
        std::optional<std::string> record = channel.receive(poll_slice);
        if (!record || record->empty()) {
            continue;
        }
        handle_record(*record);
    }
}

} // namespace callscope
