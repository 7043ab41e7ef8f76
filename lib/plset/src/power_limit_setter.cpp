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

#include "power_limit_setter.hpp"
#include "reconcilers/mchbar_resolver.hpp"
#include "errors.hpp"
#include "logging/logging.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

PowerLimitSetter::PowerLimitSetter(RegisterAccessor& accessor,
                                   PowerCapInterface& powerCap,
                                   PowerLimitTelemetry* telemetry,
                                   MmioPolicy policy) :
    accessor_(accessor), powerCap_(powerCap), telemetry_(telemetry), policy_(policy)
{
}

uint64_t PowerLimitSetter::toMicroWatts(uint64_t watts)
{
    if (watts > MAX_WATTS) {
        throw UsageError("power limit " + std::to_string(watts) + " W is out of range (max " +
                         std::to_string(MAX_WATTS) + " W)");
    }
    return watts * MICRO_W_PER_W;
}

uint64_t PowerLimitSetter::parseWatts(const std::string& text)
{
    const bool digitsOnly = !text.empty() &&
        std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!digitsOnly) {
        throw UsageError("power limit '" + text + "' is not a non-negative integer number of watts");
    }
    uint64_t watts = 0;
    try {
        watts = std::stoull(text);
    }
    catch (const std::out_of_range&) {
        throw UsageError("power limit '" + text + "' is out of range");
    }
    // conversion checks the upper bound
    toMicroWatts(watts);
    return watts;
}

void PowerLimitSetter::reportTelemetry(const char* title)
{
    if (telemetry_ == nullptr) {
        return;
    }
    try {
        LOG_INFO("{} PL values from '{}':\n{}", title, TurbostatTelemetry::TOOL_NAME, telemetry_->query());
    }
    catch (const AccessError& e) {
        // reporting only, the registers are still handled
        LOG_WARN("Power limit telemetry unavailable: {}", e.what());
    }
}

void PowerLimitSetter::applyPowerCap(PowerCapConstraint constraint, uint64_t limitInMicroW)
{
    powerCap_.writePowerCapLimit(constraint, limitInMicroW);
    const auto readBack = powerCap_.readPowerCapLimit(constraint);
    if (readBack != limitInMicroW) {
        LOG_WARN("Limit was not overwritten succesfully (constraint {}: requested {}, read {}). "
                 "HINT: Check dmesg if it is not locked by BIOS.",
                 static_cast<int>(constraint), limitInMicroW, readBack);
    }
}

PowerLimitSummary PowerLimitSetter::apply(const PowerLimitRequest& request)
{
    PowerLimitSummary summary;
    summary.pl1InMicroWatts = toMicroWatts(request.pl1InWatts);
    summary.pl2InMicroWatts = toMicroWatts(request.pl2InWatts);

    reportTelemetry("Current");

    LOG_INFO("Setting PL1={} and PL2={} [uW] through powercap", summary.pl1InMicroWatts, summary.pl2InMicroWatts);
    applyPowerCap(PowerCapConstraint::LONG_TERM, summary.pl1InMicroWatts);
    applyPowerCap(PowerCapConstraint::SHORT_TERM, summary.pl2InMicroWatts);

    summary.msr = MsrReconciler(accessor_).reconcile();

    reportTelemetry("New");

    summary.mmioRegisterAddress = MchbarResolver(accessor_).resolvePowerLimitRegisterAddress();

    MmioReconciler mmio(accessor_, policy_);
    summary.mmio = mmio.reconcile(summary.mmioRegisterAddress, summary.msr.image);
    return summary;
}
