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

#include <string>

/*
  PowerLimitTelemetry - human readable report of the currently applied limits.
  Reporting only, nothing in the reconciliation depends on its content.
*/
class PowerLimitTelemetry
{
public:
    PowerLimitTelemetry() {}
    virtual ~PowerLimitTelemetry() = default;
    virtual std::string query() = 0;
};

class TurbostatTelemetry : public PowerLimitTelemetry
{
public:
    static constexpr char TOOL_NAME[] = "turbostat";
    static constexpr char REPORT_MARKER[] = "MSR_PKG_POWER_LIMIT";
    static constexpr int LINES_AFTER_MARKER {2};

    TurbostatTelemetry() {}
    virtual ~TurbostatTelemetry() = default;
    std::string query() override;

    // keeps every marker line and the LINES_AFTER_MARKER lines following it
    static std::string filterPowerLimitReport(const std::string& turbostatOutput);
};
