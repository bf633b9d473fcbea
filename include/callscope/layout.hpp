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

#include <filesystem>
#include <string>
#include <vector>

namespace callscope {

namespace fs = std::filesystem;

// Turns a textual graph description into a viewable artifact
class LayoutEngine {
public:
    virtual ~LayoutEngine() = default;

    // Throws RenderError when the engine is unavailable or fails
    virtual void render(const fs::path &description, const fs::path &output,
                        const std::string &format) = 0;
};

// Runs the Graphviz "dot" binary: dot -T<format> -o <output> <description>
class GraphvizEngine : public LayoutEngine {
public:
    explicit GraphvizEngine(std::string program = "dot");

    void render(const fs::path &description, const fs::path &output,
                const std::string &format) override;

private:
    std::string program_;
};

// Scratch directory for one request, removed on destruction
class WorkDir {
public:
    // Throws ResourceError when the directory cannot be created
    WorkDir();
    ~WorkDir();

    WorkDir(const WorkDir &) = delete;
    WorkDir &operator=(const WorkDir &) = delete;

    const fs::path &path() const { return path_; }

private:
    fs::path path_;
};

// Run a program with stderr captured into stderr_path; returns its exit
// status (127 when it could not be executed). Throws ResourceError.
int run_process(const std::vector<std::string> &args, const fs::path &stderr_path);

} // namespace callscope
