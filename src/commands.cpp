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
#include "callscope/commands.hpp"
#include "callscope/channel.hpp"
#include "callscope/errors.hpp"
#include "callscope/server.hpp"
#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>

extern "C" {
#include <signal.h>
}

namespace callscope {

static std::atomic<bool> g_stop{false};

static void handle_stop_signal(int) { g_stop.store(true); }

bool load_graph(Graph &graph, const std::string &graph_path, std::ostream &status) {
    try {
        graph = Graph::load(graph_path);
        return true;
    } catch (const Error &e) {
        status << "Error loading graph: " << e.what() << std::endl;
        status << "Please generate " << graph_path << " with your call graph collector first."
               << std::endl;
        return false;
    }
}

int cmd_extract(const std::string &graph_path, const Request &request, std::ostream &status) {
    // Reject bad parameters before paying for the load
    try {
        request.validate();
    } catch (const ConfigError &e) {
        status << "Error: " << e.what() << std::endl;
        return 1;
    }

    Graph graph;
    if (!load_graph(graph, graph_path, status)) {
        return 1;
    }

    GraphvizEngine engine;
    Server server(graph, engine, status);
    return server.run_once(request);
}

int cmd_daemon(const std::string &graph_path, const std::string &channel, std::ostream &status) {
    Graph graph;
    if (!load_graph(graph, graph_path, status)) {
        return 1;
    }

    struct sigaction action {};
    action.sa_handler = handle_stop_signal;
    sigemptyset(&action.sa_mask);
    ::sigaction(SIGINT, &action, nullptr);
    ::sigaction(SIGTERM, &action, nullptr);

    try {
        RequestChannel requests(channel);
        GraphvizEngine engine;
        Server server(graph, engine, status);
        server.serve(requests, g_stop);
        status << "Daemon stopped after " << server.requests_served() << " requests" << std::endl;
        return 0;
    } catch (const Error &e) {
        status << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_submit(const std::string &channel, Request request, std::ostream &status) {
    try {
        request.validate();
        // The daemon runs elsewhere; anchor the output to our directory
        if (request.output != "-") {
            request.output = fs::absolute(request.output).string();
        }
        ::signal(SIGPIPE, SIG_IGN);
        RequestChannel::submit(channel, request.encode());
        std::cout << "Request submitted to " << channel << std::endl;
        return 0;
    } catch (const Error &e) {
        status << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_list_symbols(const std::string &graph_path, std::ostream &status) {
    Graph graph;
    if (!load_graph(graph, graph_path, status)) {
        return 1;
    }

    std::vector<std::string> symbols = graph.get_all_symbols();
    std::sort(symbols.begin(), symbols.end());

    std::cout << "Symbols in graph (" << symbols.size() << "):" << std::endl;
    for (const auto &sym : symbols) {
        std::cout << "  " << sym << std::endl;
    }
    return 0;
}

int cmd_search(const std::string &graph_path, const std::vector<std::string> &patterns,
               std::ostream &status) {
    Graph graph;
    if (!load_graph(graph, graph_path, status)) {
        return 1;
    }

    auto matches = graph.find_symbols(patterns);
    std::sort(matches.begin(), matches.end());

    std::cout << matches.size() << " Matches found" << std::endl;
    if (matches.empty()) {
        std::cout << "  (none found)" << std::endl;
    } else {
        for (const auto &sym : matches) {
            std::cout << "  " << sym << std::endl;
        }
    }
    return 0;
}

} // namespace callscope
