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
#include "callscope/request.hpp"
#include "callscope/errors.hpp"
#include "callscope/version.hpp"
#include <algorithm>
#include <regex>

namespace callscope {

namespace {

// Field order of a daemon record; version first
enum RecordField {
    F_VERSION,
    F_ROOTS,
    F_ROOT_PATTERNS,
    F_DIRECTION,
    F_MAX_DEPTH,
    F_IGNORE,
    F_IGNORE_PATTERNS,
    F_SHOW,
    F_SHOW_PATTERNS,
    F_TRIM,
    F_NO_EXTERN,
    F_END_FUNCTION,
    F_LOCATIONS,
    F_OUTPUT,
    F_FORMAT,
    F_FONT,
    F_FONT_SIZE,
    F_RANKDIR,
    F_KEEP,
    F_COUNT
};

int parse_int(const std::string &value, const char *label) {
    size_t used = 0;
    int result = 0;
    try {
        result = std::stoi(value, &used);
    } catch (const std::logic_error &) {
        throw ConfigError(std::string("Invalid ") + label + " '" + value + "'");
    }
    if (used != value.size()) {
        throw ConfigError(std::string("Invalid ") + label + " '" + value + "'");
    }
    return result;
}

bool parse_flag(const std::string &value, const char *label) {
    if (value == "1")
        return true;
    if (value == "0")
        return false;
    throw ConfigError(std::string("Invalid ") + label + " flag '" + value + "'");
}

// A list item must not contain the list delimiter or it would split on decode
std::string list_field(const std::vector<std::string> &items, const char *label) {
    for (const auto &item : items) {
        if (item.find(LIST_DELIMITER) != std::string::npos) {
            throw ConfigError(std::string("Invalid ") + label + " '" + item + "' (contains '" +
                              LIST_DELIMITER + "')");
        }
    }
    return join_list(items);
}

bool contains(const std::vector<std::string> &values, const std::string &value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

const std::vector<std::string> &output_formats() {
    static const std::vector<std::string> formats = {"plain", "dot", "svg", "png", "pdf", "ps"};
    return formats;
}

const std::vector<std::string> &layout_directions() {
    static const std::vector<std::string> directions = {"TB", "LR", "BT", "RL"};
    return directions;
}

std::vector<std::string> split_list(const std::string &value, char delimiter) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(delimiter, start);
        if (end == std::string::npos)
            end = value.size();
        if (end > start)
            items.push_back(value.substr(start, end - start));
        start = end + 1;
    }
    return items;
}

std::string join_list(const std::vector<std::string> &items, char delimiter) {
    std::string joined;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0)
            joined.push_back(delimiter);
        joined += items[i];
    }
    return joined;
}

void Request::validate() const {
    if (roots.empty() && root_patterns.empty()) {
        throw ConfigError("No root function specified (use --function or --root-pattern)");
    }
    if (max_depth < UNLIMITED_DEPTH) {
        throw ConfigError("Invalid max depth " + std::to_string(max_depth));
    }
    if (!contains(layout_directions(), render.rankdir)) {
        throw ConfigError("Unknown layout direction '" + render.rankdir +
                          "' (expected TB, LR, BT or RL)");
    }
    if (!contains(output_formats(), format)) {
        throw ConfigError("Unknown output format '" + format + "'");
    }
    if (render.font_size <= 0) {
        throw ConfigError("Invalid font size " + std::to_string(render.font_size));
    }
    if (render.font.empty()) {
        throw ConfigError("Font name must not be empty");
    }
    if (output.empty()) {
        throw ConfigError("Output path must not be empty");
    }
    if (output == "-" && needs_layout()) {
        throw ConfigError("Only plain output can be written to stdout");
    }
    for (const auto &pattern : root_patterns) {
        try {
            std::regex compiled(pattern, std::regex::ECMAScript);
        } catch (const std::regex_error &e) {
            throw ConfigError("Invalid root pattern '" + pattern + "': " + e.what());
        }
    }
}

std::string Request::encode() const {
    std::vector<std::string> fields(F_COUNT);
    fields[F_VERSION] = std::to_string(REQUEST_PROTOCOL_VERSION);
    fields[F_ROOTS] = list_field(roots, "root");
    fields[F_ROOT_PATTERNS] = list_field(root_patterns, "root pattern");
    fields[F_DIRECTION] = direction_to_string(direction);
    fields[F_MAX_DEPTH] = std::to_string(max_depth);
    fields[F_IGNORE] = list_field(filters.ignore, "ignore entry");
    fields[F_IGNORE_PATTERNS] = list_field(filters.ignore_patterns, "ignore pattern");
    fields[F_SHOW] = list_field(filters.show, "show entry");
    fields[F_SHOW_PATTERNS] = list_field(filters.show_patterns, "show pattern");
    fields[F_TRIM] = filters.trim ? "1" : "0";
    fields[F_NO_EXTERN] = filters.no_extern ? "1" : "0";
    fields[F_END_FUNCTION] = end_function;
    fields[F_LOCATIONS] = locations ? "1" : "0";
    fields[F_OUTPUT] = output;
    fields[F_FORMAT] = format;
    fields[F_FONT] = render.font;
    fields[F_FONT_SIZE] = std::to_string(render.font_size);
    fields[F_RANKDIR] = render.rankdir;
    fields[F_KEEP] = keep ? "1" : "0";

    std::string record;
    for (size_t i = 0; i < fields.size(); ++i) {
        const auto &field = fields[i];
        if (field.find(FIELD_DELIMITER) != std::string::npos ||
            field.find('\n') != std::string::npos) {
            throw ConfigError("Request field contains a reserved character: " + field);
        }
        if (i > 0)
            record.push_back(FIELD_DELIMITER);
        record += field;
    }
    return record;
}

Request Request::decode(const std::string &record) {
    std::string line = record;
    if (!line.empty() && line.back() == '\r')
        line.pop_back();

    // Keep empty fields; split_list would drop them
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t end = line.find(FIELD_DELIMITER, start);
        if (end == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, end - start));
        start = end + 1;
    }

    if (parse_int(fields[F_VERSION], "protocol version") != REQUEST_PROTOCOL_VERSION) {
        throw ConfigError("Unsupported request protocol version '" + fields[F_VERSION] + "'");
    }
    if (fields.size() != F_COUNT) {
        throw ConfigError("Malformed request: expected " + std::to_string(F_COUNT) +
                          " fields, got " + std::to_string(fields.size()));
    }

    Request request;
    request.roots = split_list(fields[F_ROOTS]);
    request.root_patterns = split_list(fields[F_ROOT_PATTERNS]);
    if (fields[F_DIRECTION] == "forward") {
        request.direction = Direction::Forward;
    } else if (fields[F_DIRECTION] == "reverse") {
        request.direction = Direction::Reverse;
    } else {
        throw ConfigError("Unknown direction '" + fields[F_DIRECTION] + "'");
    }
    request.max_depth = parse_int(fields[F_MAX_DEPTH], "max depth");
    request.filters.ignore = split_list(fields[F_IGNORE]);
    request.filters.ignore_patterns = split_list(fields[F_IGNORE_PATTERNS]);
    request.filters.show = split_list(fields[F_SHOW]);
    request.filters.show_patterns = split_list(fields[F_SHOW_PATTERNS]);
    request.filters.trim = parse_flag(fields[F_TRIM], "trim");
    request.filters.no_extern = parse_flag(fields[F_NO_EXTERN], "no-extern");
    request.end_function = fields[F_END_FUNCTION];
    request.locations = parse_flag(fields[F_LOCATIONS], "locations");
    request.output = fields[F_OUTPUT];
    request.format = fields[F_FORMAT];
    request.render.font = fields[F_FONT];
    request.render.font_size = parse_int(fields[F_FONT_SIZE], "font size");
    request.render.rankdir = fields[F_RANKDIR];
    request.keep = parse_flag(fields[F_KEEP], "keep");
    return request;
}

} // namespace callscope
