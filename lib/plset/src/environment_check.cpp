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

#include "environment_check.hpp"
#include "errors.hpp"
#include "logging/logging.hpp"
#include "power_interface/msr.hpp"
#include "power_interface/msr_offsets.hpp"
#include "power_interface/phys_mem.hpp"
#include "power_interface/pci_config.hpp"
#include "power_interface/telemetry.hpp"

#include <unistd.h>
#include <cstdlib>
#include <sstream>
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

void checkRootPrivileges()
{
    if (geteuid() != 0) {
        throw PrivilegeError("This tool must be run with root privileges (root user or with 'sudo')");
    }
}

std::optional<std::string> findExecutableInPath(const std::string& toolName)
{
    const char* pathEnv = std::getenv("PATH");
    if (pathEnv == nullptr) {
        return std::nullopt;
    }
    std::stringstream paths(pathEnv);
    std::string dir;
    while (std::getline(paths, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const fs::path candidate = fs::path(dir) / toolName;
        boost::system::error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

static void requirePath(const std::string& path, const std::string& hint)
{
    boost::system::error_code ec;
    if (!fs::exists(path, ec)) {
        throw DependencyMissing("Required interface '" + path + "' is not available" +
                                (hint.empty() ? "" : " (" + hint + ")"));
    }
    LOG_DEBUG("Found {}", path);
}

void checkDependencies(const ParamsConfig& cfg)
{
    requirePath(MSR::devicePath(cfg.msrCore_), "load the msr kernel module: modprobe msr");
    requirePath(PHYS_MEM_DEVICE, "");
    requirePath(PciConfig::configPath(MCHBAR_PCI_BUS, MCHBAR_PCI_DEVICE, MCHBAR_PCI_FUNCTION), "");
    requirePath(cfg.powercapDir_, "load the intel_rapl_msr kernel module");

    if (cfg.telemetry_) {
        auto tool = findExecutableInPath(TurbostatTelemetry::TOOL_NAME);
        if (!tool.has_value()) {
            throw DependencyMissing(std::string("Required app '") + TurbostatTelemetry::TOOL_NAME +
                                    "' is not installed (or disable telemetry)");
        }
        LOG_DEBUG("Found {}", tool.value());
    }
}
