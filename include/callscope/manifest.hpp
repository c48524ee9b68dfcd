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

namespace callscope {

constexpr const char *MANIFEST_FILE = "go.mod";

struct ModuleInfo {
    std::string path;           // Module path declared in go.mod
    std::filesystem::path root; // Directory holding go.mod
};

// Module path from the text of a go.mod file, empty if it declares none
std::string parse_module_path(const std::string &manifest_text);

// Walk upward from dir to the nearest go.mod.
// Throws ManifestNotFound if there is none or it declares no module.
ModuleInfo find_module(const std::filesystem::path &dir);

} // namespace callscope
