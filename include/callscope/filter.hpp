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
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace callscope {

// Filter specification as it arrives in a request
struct FilterConfig {
    std::vector<std::string> ignore;
    std::vector<std::string> ignore_patterns;
    std::vector<std::string> show;
    std::vector<std::string> show_patterns;
    bool trim = false;
    bool no_extern = false;
};

// Outcome of the precedence list for one candidate node
enum class Verdict {
    Include,
    Extern,        // no known definition and extern-exclusion enabled
    Ignored,       // exact ignore match
    IgnoredByPattern,
    Trimmed        // member of the built-in noise catalog
};

const char *verdict_to_string(Verdict verdict);

// Built-in catalog of noise symbols excluded by --trim
const std::unordered_set<std::string> &trim_set();

// Compiled filters for one extraction run.
//
// Exclusion precedence, first match wins:
//   1. extern-exclusion (node has no known definition)
//   2. exact ignore
//   3. ignore pattern
//   4. trim catalog
//   5. include
// Show membership is independent and never overrides an exclusion.
class FilterRegistry {
public:
    // Throws ConfigError when a pattern is not a valid regular expression
    explicit FilterRegistry(const FilterConfig &config);

    // Run the precedence list. Extern hits are remembered in the dynamic
    // ignore set so later lookups short-circuit.
    Verdict classify(const Graph &graph, NodeId id);

    bool excluded(const Graph &graph, NodeId id) { return classify(graph, id) != Verdict::Include; }

    // Render but do not expand
    bool is_shown(const std::string &name) const;

    const std::unordered_set<std::string> &dynamic_ignores() const { return dynamic_ignore_; }

private:
    std::unordered_set<std::string> ignore_;
    std::vector<std::regex> ignore_patterns_;
    std::unordered_set<std::string> show_;
    std::vector<std::regex> show_patterns_;
    bool trim_;
    bool no_extern_;

    std::unordered_set<std::string> dynamic_ignore_;

    static std::vector<std::regex> compile(const std::vector<std::string> &patterns,
                                           const char *label);
};

} // namespace callscope
