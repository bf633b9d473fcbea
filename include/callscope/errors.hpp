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

// Base class for every failure raised by callscope
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invalid parameter combination (unknown layout direction, no root, ...)
class ConfigError : public Error {
public:
    using Error::Error;
};

// Graph source missing or unparseable
class InputError : public Error {
public:
    using Error::Error;
};

// Requested root or end function does not exist
class NotFoundError : public Error {
public:
    using Error::Error;
};

// Filters eliminated the whole subgraph
class EmptyResultError : public Error {
public:
    using Error::Error;
};

// External layout engine unavailable or failed
class RenderError : public Error {
public:
    using Error::Error;
};

// Temporary storage or channel I/O failure
class ResourceError : public Error {
public:
    using Error::Error;
};

} // namespace callscope
