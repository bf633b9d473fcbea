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
#include "callscope/layout.hpp"
#include "callscope/errors.hpp"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

extern "C" {
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
}

namespace callscope {

static int open_write_file(const fs::path &path) {
    auto fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) {
        throw ResourceError("Failed to open file for writing: " + path.string());
    }
    return fd;
}

int run_process(const std::vector<std::string> &args, const fs::path &stderr_path) {
    auto stderr_fd = open_write_file(stderr_path);

    auto pid = ::fork();
    if (pid < 0) {
        ::close(stderr_fd);
        throw ResourceError("fork failed");
    }

    if (pid == 0) {
        if (::dup2(stderr_fd, STDERR_FILENO) < 0) {
            _exit(127);
        }
        ::close(stderr_fd);

        std::vector<char *> argv;
        argv.reserve(args.size() + 1);
        for (const auto &arg : args) {
            argv.push_back(const_cast<char *>(arg.c_str()));
        }
        argv.push_back(nullptr);

        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    ::close(stderr_fd);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw ResourceError("waitpid failed");
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

GraphvizEngine::GraphvizEngine(std::string program) : program_(std::move(program)) {}

void GraphvizEngine::render(const fs::path &description, const fs::path &output,
                            const std::string &format) {
    fs::path stderr_path = description;
    stderr_path += ".stderr";

    int rc = run_process({program_, "-T" + format, "-o", output.string(), description.string()},
                         stderr_path);
    if (rc == 0) {
        return;
    }
    if (rc == 127) {
        throw RenderError("Layout engine '" + program_ + "' is not available");
    }

    std::ifstream err(stderr_path);
    std::stringstream text;
    text << err.rdbuf();
    std::string message = text.str();
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r'))
        message.pop_back();

    throw RenderError("Layout engine '" + program_ + "' failed with status " +
                      std::to_string(rc) + (message.empty() ? "" : ": " + message));
}

WorkDir::WorkDir() {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }
    std::string pattern = (base / "callscope-XXXXXX").string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        throw ResourceError("Failed to create working directory under " + base.string());
    }
    path_ = pattern;
}

WorkDir::~WorkDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

} // namespace callscope
