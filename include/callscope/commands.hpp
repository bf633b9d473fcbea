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
#include "request.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace callscope {

// Default graph file produced by the collector
constexpr const char *GRAPH_FILE = "callgraph.json";

// Command handlers; each returns a process exit code
int cmd_extract(const std::string &graph_path, const Request &request, std::ostream &status);
int cmd_daemon(const std::string &graph_path, const std::string &channel, std::ostream &status);
int cmd_submit(const std::string &channel, Request request, std::ostream &status);
int cmd_list_symbols(const std::string &graph_path, std::ostream &status);
int cmd_search(const std::string &graph_path, const std::vector<std::string> &patterns,
               std::ostream &status);

// Helper functions
bool load_graph(Graph &graph, const std::string &graph_path, std::ostream &status);

} // namespace callscope
