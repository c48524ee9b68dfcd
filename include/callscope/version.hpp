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

namespace callscope {

// ============================================================================
// Callscope Version Information
// ============================================================================

// Application version (displayed to users)
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

// Version string for display
constexpr const char* VERSION_STRING = "1.0.0";

// Schema of the JSON exports (graph and function listings)
// Increment when an export format changes
constexpr const char* EXPORT_SCHEMA_VERSION = "1.0.0";

} // namespace callscope
