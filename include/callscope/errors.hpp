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

// Base class for every error raised by the analysis pipeline
class Error : public std::runtime_error {
public:
    explicit Error(const std::string &what) : std::runtime_error(what) {}
};

// No go.mod could be found, read, or understood. Fatal.
class ManifestNotFound : public Error {
public:
    explicit ManifestNotFound(const std::string &what) : Error(what) {}
};

// The project root is missing or cannot be listed. Fatal.
class IndexError : public Error {
public:
    explicit IndexError(const std::string &what) : Error(what) {}
};

// A single source file could not be read or parsed. The file is skipped.
class FileParseError : public Error {
public:
    FileParseError(const std::string &file, const std::string &reason)
        : Error("failed to parse " + file + ": " + reason), file_(file) {}

    const std::string &file() const { return file_; }

private:
    std::string file_;
};

// A function indexed earlier could not be located again for call resolution.
// Its call sites are left empty.
class FunctionReparseError : public Error {
public:
    FunctionReparseError(const std::string &identity, const std::string &reason)
        : Error("cannot resolve calls of " + identity + ": " + reason), identity_(identity) {}

    const std::string &identity() const { return identity_; }

private:
    std::string identity_;
};

// The coverage profile could not be opened. Fatal to coverage analysis only.
class CoverageProfileOpenError : public Error {
public:
    explicit CoverageProfileOpenError(const std::string &path)
        : Error("cannot open coverage profile: " + path) {}
};

} // namespace callscope
