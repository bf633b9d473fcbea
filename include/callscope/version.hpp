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

#include <stdexcept>
#include <string>

namespace callscope {

constexpr const char *VERSION_STRING = "1.0.0";

// Graph file schema. Files with a different major version are rejected.
constexpr int GRAPH_SCHEMA_MAJOR = 1;
constexpr const char *GRAPH_SCHEMA_VERSION = "1.0.0";

// Daemon request record layout; bump when fields are added or reordered
constexpr int REQUEST_PROTOCOL_VERSION = 1;

inline bool is_schema_compatible(int major) { return major == GRAPH_SCHEMA_MAJOR; }

// Split "X.Y.Z"; false when any component is missing or not a number
inline bool parse_version(const std::string &version, int &major, int &minor, int &patch) {
    size_t first = version.find('.');
    size_t second = first == std::string::npos ? first : version.find('.', first + 1);
    if (second == std::string::npos)
        return false;
    try {
        major = std::stoi(version.substr(0, first));
        minor = std::stoi(version.substr(first + 1, second - first - 1));
        patch = std::stoi(version.substr(second + 1));
    } catch (const std::logic_error &) {
        return false;
    }
    return true;
}

} // namespace callscope
