/*
   Copyright 2022-2024, Adam Krzywaniak.

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#pragma once

#include "params_config.hpp"

#include <optional>
#include <string>

// throws PrivilegeError unless running as root
void checkRootPrivileges();

// throws DependencyMissing for the first kernel interface or tool not present
void checkDependencies(const ParamsConfig& cfg);

std::optional<std::string> findExecutableInPath(const std::string& toolName);
