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

#include "extractor.hpp"
#include "filter.hpp"
#include "output.hpp"
#include <string>
#include <vector>

namespace callscope {

// Separates fields of a daemon record (ASCII unit separator)
constexpr char FIELD_DELIMITER = '\x1f';

// Separates items of a list-valued field
constexpr char LIST_DELIMITER = ';';

// One extraction request: what to walk, how to filter it, where to write it
struct Request {
    std::vector<std::string> roots;
    std::vector<std::string> root_patterns;
    Direction direction = Direction::Forward;
    int max_depth = UNLIMITED_DEPTH;
    FilterConfig filters;
    std::string end_function;
    bool locations = false;

    std::string output = "callscope.graph";
    std::string format = "plain";
    RenderOptions render;
    bool keep = false;

    // Throws ConfigError for invalid parameter combinations
    void validate() const;

    // Plain formats are written directly, others go through the layout engine
    bool needs_layout() const { return format != "plain"; }

    // Encode as a single daemon record (no trailing newline)
    std::string encode() const;

    // Decode a daemon record; throws ConfigError on a malformed record
    static Request decode(const std::string &record);
};

// Split "a;b;c" into items, dropping empty ones
std::vector<std::string> split_list(const std::string &value, char delimiter = LIST_DELIMITER);

std::string join_list(const std::vector<std::string> &items, char delimiter = LIST_DELIMITER);

// Accepted values for --format and --rankdir
const std::vector<std::string> &output_formats();
const std::vector<std::string> &layout_directions();

} // namespace callscope
