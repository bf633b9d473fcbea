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

#include <chrono>
#include <deque>
#include <optional>
#include <string>

namespace callscope {

// Well-known endpoint shared by the daemon and its clients
constexpr const char *DEFAULT_CHANNEL = "/tmp/callscope.fifo";

// How the reader waits on the FIFO. A FIFO whose writers have all gone
// away keeps reporting end-of-input, so the endpoint is reopened to make
// the next wait block again.
struct RearmPolicy {
    std::chrono::milliseconds short_interval{50};
    std::chrono::milliseconds short_window{1000}; // after last activity
    std::chrono::milliseconds long_interval{500};
    std::chrono::milliseconds idle_budget{10000}; // reopen after this much silence
};

// Reading end of the daemon request FIFO. Records are newline-terminated.
class RequestChannel {
public:
    // Creates the FIFO if missing; throws ResourceError
    explicit RequestChannel(std::string path, RearmPolicy policy = RearmPolicy{});
    ~RequestChannel();

    RequestChannel(const RequestChannel &) = delete;
    RequestChannel &operator=(const RequestChannel &) = delete;

    // Wait up to max_wait for the next record (without its newline).
    // Returns std::nullopt when nothing arrived in time.
    std::optional<std::string> receive(std::chrono::milliseconds max_wait);

    // Close and reopen the endpoint
    void reopen();

    const std::string &path() const { return path_; }

    // Number of times the endpoint was reopened
    size_t reopen_count() const { return reopens_; }

    // Client side: write one record; throws ResourceError when no daemon
    // is listening
    static void submit(const std::string &path, const std::string &record);

private:
    std::string path_;
    RearmPolicy policy_;
    int fd_ = -1;
    bool created_ = false;
    std::string buffer_;
    std::deque<std::string> ready_;
    std::chrono::milliseconds idle_{0};
    size_t reopens_ = 0;

    void open_endpoint();
    void close_endpoint();

    // Move complete lines from buffer_ to ready_
    void split_records();
};

} // namespace callscope
