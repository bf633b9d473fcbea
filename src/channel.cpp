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
#include "callscope/channel.hpp"
#include "callscope/errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>
}

namespace callscope {

constexpr int SUBMIT_ATTEMPTS = 5;
constexpr std::chrono::milliseconds SUBMIT_RETRY_DELAY{20};

static std::string errno_text() {
    return std::strerror(errno);
}

RequestChannel::RequestChannel(std::string path, RearmPolicy policy)
    : path_(std::move(path)), policy_(policy) {
    struct stat st {};
    if (::stat(path_.c_str(), &st) == 0) {
        if (!S_ISFIFO(st.st_mode)) {
            throw ResourceError(path_ + " exists and is not a FIFO");
        }
    } else {
        if (::mkfifo(path_.c_str(), 0600) != 0) {
            throw ResourceError("Failed to create FIFO " + path_ + ": " + errno_text());
        }
        created_ = true;
    }
    open_endpoint();
}

RequestChannel::~RequestChannel() {
    close_endpoint();
    if (created_) {
        ::unlink(path_.c_str());
    }
}

void RequestChannel::open_endpoint() {
    // Non-blocking so open() does not wait for the first writer
    fd_ = ::open(path_.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd_ < 0) {
        throw ResourceError("Failed to open FIFO " + path_ + ": " + errno_text());
    }
}

void RequestChannel::close_endpoint() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void RequestChannel::reopen() {
    // Attach the new reader before dropping the old one; a FIFO left with
    // no reader discards whatever is still buffered
    int previous = fd_;
    fd_ = -1;
    try {
        open_endpoint();
    } catch (const ResourceError &) {
        fd_ = previous;
        throw;
    }
    ::close(previous);
    idle_ = std::chrono::milliseconds{0};
    ++reopens_;
}

void RequestChannel::split_records() {
    size_t newline;
    while ((newline = buffer_.find('\n')) != std::string::npos) {
        ready_.push_back(buffer_.substr(0, newline));
        buffer_.erase(0, newline + 1);
    }
}

std::optional<std::string> RequestChannel::receive(std::chrono::milliseconds max_wait) {
    auto deadline = std::chrono::steady_clock::now() + max_wait;

    while (ready_.empty()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return std::nullopt;
        }

        auto interval =
            idle_ < policy_.short_window ? policy_.short_interval : policy_.long_interval;
        auto wait = std::min(interval, remaining);

        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int ret = ::poll(&pfd, 1, static_cast<int>(wait.count()));
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ResourceError("poll on " + path_ + " failed: " + errno_text());
        }

        if (ret == 0) {
            idle_ += wait;
            if (idle_ >= policy_.idle_budget) {
                reopen();
            }
            continue;
        }

        if ((pfd.revents & POLLIN) != 0) {
            char chunk[4096];
            auto n = ::read(fd_, chunk, sizeof(chunk));
            if (n > 0) {
                buffer_.append(chunk, static_cast<size_t>(n));
                idle_ = std::chrono::milliseconds{0};
                split_records();
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
                continue;
            }
            if (n < 0) {
                throw ResourceError("read from " + path_ + " failed: " + errno_text());
            }
        }

        // Every writer has closed: re-arm so the next poll blocks
        if (!buffer_.empty()) {
            // Last writer forgot the newline; the record is still complete
            ready_.push_back(std::move(buffer_));
            buffer_.clear();
        }
        reopen();
    }

    std::string record = std::move(ready_.front());
    ready_.pop_front();
    return record;
}

void RequestChannel::submit(const std::string &path, const std::string &record) {
    // The daemon closes and reopens its end while re-arming; retry briefly
    // before concluding nobody is listening
    int fd = -1;
    for (int attempt = 0; attempt < SUBMIT_ATTEMPTS; ++attempt) {
        fd = ::open(path.c_str(), O_WRONLY | O_NONBLOCK);
        if (fd >= 0 || errno != ENXIO)
            break;
        std::this_thread::sleep_for(SUBMIT_RETRY_DELAY);
    }
    if (fd < 0) {
        if (errno == ENXIO || errno == ENOENT) {
            throw ResourceError("No daemon listening on " + path);
        }
        throw ResourceError("Failed to open " + path + ": " + errno_text());
    }

    // Blocking writes from here on; the reader is attached
    int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) < 0) {
        ::close(fd);
        throw ResourceError("Failed to configure " + path + ": " + errno_text());
    }

    std::string line = record + "\n";
    size_t written = 0;
    while (written < line.size()) {
        auto n = ::write(fd, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string reason = errno_text();
            ::close(fd);
            throw ResourceError("Failed to write request to " + path + ": " + reason);
        }
        written += static_cast<size_t>(n);
    }
    ::close(fd);
}

} // namespace callscope
