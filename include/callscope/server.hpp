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

#include "channel.hpp"
#include "graph.hpp"
#include "layout.hpp"
#include "request.hpp"
#include <atomic>
#include <chrono>
#include <iosfwd>
#include <string>
#include <vector>

namespace callscope {

// Summary of one completed request
struct RequestResult {
    std::string output;
    size_t roots = 0;
    size_t empty_roots = 0;
    size_t edges = 0;
    size_t nodes = 0;
    size_t retracted = 0;
};

// Serves extraction requests against one resident graph, one at a time
class Server {
public:
    Server(const Graph &graph, LayoutEngine &engine, std::ostream &status);

    // Run one request to completion. Throws callscope::Error subclasses.
    RequestResult process(const Request &request);

    // Direct mode: process once and report; returns a process exit code
    int run_once(const Request &request);

    // Daemon mode: serve records from the channel until stop is set. A bad
    // request is reported on the status stream and never ends the loop.
    void serve(RequestChannel &channel, const std::atomic<bool> &stop,
               std::chrono::milliseconds poll_slice = std::chrono::milliseconds(500));

    // Decode and process one daemon record, reporting the outcome
    bool handle_record(const std::string &record);

    size_t requests_served() const { return served_.load(); }

    // Resolve explicit roots and root patterns into a sorted, unique list
    std::vector<NodeId> resolve_roots(const Request &request) const;

private:
    const Graph &graph_;
    LayoutEngine &engine_;
    std::ostream &status_;
    std::atomic<size_t> served_{0};

    void write_output(const Request &request, const std::string &description,
                      const OutputAssembler &output);
};

} // namespace callscope
