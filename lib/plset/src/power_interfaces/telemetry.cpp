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

#include "power_interface/telemetry.hpp"
#include "errors.hpp"

#include <stdio.h>
#include <cerrno>
#include <cstring>
#include <sstream>

std::string TurbostatTelemetry::query()
{
    // "sleep 0" makes turbostat print its header (incl. RAPL registers) and exit
    const std::string command = std::string(TOOL_NAME) + " sleep 0 2>&1";
    FILE* pipe = popen(command.c_str(), "r");
    if (pipe == nullptr) {
        throw AccessError("cannot run " + command + ": " + strerror(errno));
    }
    std::stringstream output;
    char buffer[BUFSIZ];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output << buffer;
    }
    int status = pclose(pipe);
    if (status == -1) {
        throw AccessError("cannot collect " + std::string(TOOL_NAME) + " status: " + strerror(errno));
    }
    return filterPowerLimitReport(output.str());
}

std::string TurbostatTelemetry::filterPowerLimitReport(const std::string& turbostatOutput)
{
    std::istringstream input(turbostatOutput);
    std::stringstream report;
    std::string line;
    int linesToKeep = 0;
    while (std::getline(input, line)) {
        if (line.find(REPORT_MARKER) != std::string::npos) {
            linesToKeep = LINES_AFTER_MARKER + 1;
        }
        if (linesToKeep > 0) {
            report << line << "\n";
            linesToKeep--;
        }
    }
    return report.str();
}
