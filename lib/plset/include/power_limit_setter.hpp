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

#include "plset_constants.hpp"
#include "power_interface/register_accessor.hpp"
#include "power_interface/powercap.hpp"
#include "power_interface/telemetry.hpp"
#include "reconcilers/msr_reconciler.hpp"
#include "reconcilers/mmio_reconciler.hpp"

#include <cstdint>
#include <limits>
#include <string>

struct PowerLimitRequest {
    uint64_t pl1InWatts;
    uint64_t pl2InWatts;
};

struct PowerLimitSummary {
    uint64_t pl1InMicroWatts {0};
    uint64_t pl2InMicroWatts {0};
    MsrReconcileResult msr {};
    uint64_t mmioRegisterAddress {0};
    MmioReconcileResult mmio {};
};

/*
  PowerLimitSetter - applies PL1/PL2 and removes the MMIO limit path

  Steps, each one aborts the sequence by exception:
    1. PL1/PL2 written through powercap (constraint 0 and 1)
    2. MSR_PKG_POWER_LIMIT enable bits set
    3. MCHBAR resolved from host bridge config space
    4. PACKAGE_RAPL_LIMIT reconciled with the MSR image and locked
  Telemetry (when given) is reported before and after step 2.
*/
class PowerLimitSetter
{
public:
    PowerLimitSetter(RegisterAccessor& accessor,
                     PowerCapInterface& powerCap,
                     PowerLimitTelemetry* telemetry,
                     MmioPolicy policy);

    PowerLimitSummary apply(const PowerLimitRequest& request);

    // largest limit whose microwatt value still fits in 64 bits
    static constexpr uint64_t MAX_WATTS {std::numeric_limits<uint64_t>::max() / MICRO_W_PER_W};

    // throws UsageError above MAX_WATTS
    static uint64_t toMicroWatts(uint64_t watts);
    // decimal digits only, throws UsageError otherwise
    static uint64_t parseWatts(const std::string& text);

private:
    RegisterAccessor& accessor_;
    PowerCapInterface& powerCap_;
    PowerLimitTelemetry* telemetry_;
    MmioPolicy policy_;

    void applyPowerCap(PowerCapConstraint constraint, uint64_t limitInMicroW);
    void reportTelemetry(const char* title);
};
