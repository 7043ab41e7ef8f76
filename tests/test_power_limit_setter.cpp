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

#include "test_common.hpp"
#include "power_limit_setter.hpp"
#include "power_interface/msr_offsets.hpp"

static constexpr uint64_t MCHBAR_BASE {0xfed10000};
static constexpr uint64_t RAPL_LIMIT_ADDR {MCHBAR_BASE + 0x59a0};

static FakeRegisterAccessor makeMachine(uint64_t msr, uint32_t mchbar, uint32_t low, uint32_t high)
{
    FakeRegisterAccessor acc;
    acc.msrs_[MSR_PKG_RAPL_POWER_LIMIT] = msr;
    acc.pciConfig_[std::make_tuple(0u, 0u, 0u, 0x48u)] = mchbar;
    acc.memory_[RAPL_LIMIT_ADDR] = low;
    acc.memory_[RAPL_LIMIT_ADDR + 4] = high;
    return acc;
}

// Scenario A followed by scenario B
bool test_full_sequence()
{
    auto acc = makeMachine(0x0, MCHBAR_BASE | 1, 0x0, 0x0);
    FakePowerCap powerCap;
    FakeTelemetry telemetry;

    PowerLimitSetter setter(acc, powerCap, &telemetry, MmioPolicy::DISABLE);
    auto summary = setter.apply({25, 30});

    if (powerCap.writes_.size() != 2 ||
        powerCap.writes_[0] != std::make_pair(0, uint64_t(25000000)) ||
        powerCap.writes_[1] != std::make_pair(1, uint64_t(30000000))) {
        LOG_ERROR("Unexpected powercap writes");
        return false;
    }
    if (summary.pl1InMicroWatts != 25000000 || summary.pl2InMicroWatts != 30000000) {
        return false;
    }
    auto writes = acc.writes();
    if (writes.size() != 3) {
        LOG_ERROR("Expected 3 register writes, got {}", writes.size());
        return false;
    }
    if (writes[0].kind != AccessKind::MSR_WRITE || writes[0].value != 0x0000800000008000ULL) {
        return false;
    }
    if (writes[1].address != RAPL_LIMIT_ADDR || writes[1].value != 0x0 ||
        writes[2].address != RAPL_LIMIT_ADDR + 4 || writes[2].value != 0x80000000) {
        return false;
    }
    return summary.msr.outcome == MsrOutcome::ENABLED &&
           summary.mmioRegisterAddress == RAPL_LIMIT_ADDR &&
           summary.mmio.outcome == MmioOutcome::WRITTEN &&
           telemetry.queries_ == 2;
}

bool test_mirror_uses_reconciled_msr_image()
{
    // PL2 enable missing in the MSR, MMIO gets the value after enabling
    auto acc = makeMachine(0x00df00c800dd8140ULL, MCHBAR_BASE | 1, 0x0, 0x0);
    FakePowerCap powerCap;

    PowerLimitSetter setter(acc, powerCap, nullptr, MmioPolicy::MIRROR);
    auto summary = setter.apply({45, 64});

    return summary.msr.image == 0x00df80c800dd8140ULL &&
           acc.memory_[RAPL_LIMIT_ADDR] == 0x00dd8140 &&
           acc.memory_[RAPL_LIMIT_ADDR + 4] == 0x80df80c8;
}

bool test_locked_mmio_is_warning_only()
{
    auto acc = makeMachine(0x0000800000008000ULL, MCHBAR_BASE | 1, 0x0, 0x80008000);
    FakePowerCap powerCap;

    PowerLimitSetter setter(acc, powerCap, nullptr, MmioPolicy::DISABLE);
    auto summary = setter.apply({25, 30});

    return acc.writes().empty() &&
           summary.msr.outcome == MsrOutcome::ALREADY_ENABLED &&
           summary.mmio.outcome == MmioOutcome::LOCKED_WITH_LIMITS_ACTIVE &&
           summary.mmio.isWarning();
}

bool test_disabled_mchbar_aborts_before_mmio()
{
    auto acc = makeMachine(0x0, MCHBAR_BASE, 0x0, 0x0);
    FakePowerCap powerCap;

    PowerLimitSetter setter(acc, powerCap, nullptr, MmioPolicy::DISABLE);
    try {
        setter.apply({25, 30});
    }
    catch (const BaseRegisterDisabled&) {
        // MSR step already done, MMIO never touched
        return acc.count(AccessKind::MSR_WRITE) == 1 &&
               acc.count(AccessKind::MEM_READ) == 0 &&
               acc.count(AccessKind::MEM_WRITE) == 0;
    }
    LOG_ERROR("Expected BaseRegisterDisabled");
    return false;
}

bool test_msr_failure_aborts_sequence()
{
    auto acc = makeMachine(0x0, MCHBAR_BASE | 1, 0x0, 0x0);
    acc.failOn_ = AccessKind::MSR_READ;
    FakePowerCap powerCap;

    PowerLimitSetter setter(acc, powerCap, nullptr, MmioPolicy::DISABLE);
    try {
        setter.apply({25, 30});
    }
    catch (const AccessError&) {
        return acc.count(AccessKind::PCI_READ) == 0 && acc.count(AccessKind::MEM_READ) == 0;
    }
    LOG_ERROR("Expected AccessError");
    return false;
}

bool test_powercap_readback_mismatch_is_not_fatal()
{
    auto acc = makeMachine(0x0, MCHBAR_BASE | 1, 0x0, 0x0);
    FakePowerCap powerCap;
    powerCap.clampTo1W_ = true;
    FakeTelemetry telemetry;
    telemetry.fail_ = true;

    PowerLimitSetter setter(acc, powerCap, &telemetry, MmioPolicy::DISABLE);
    auto summary = setter.apply({25, 30});

    return summary.mmio.outcome == MmioOutcome::WRITTEN && telemetry.queries_ == 2;
}

bool test_micro_watts()
{
    return PowerLimitSetter::toMicroWatts(0) == 0 &&
           PowerLimitSetter::toMicroWatts(25) == 25000000 &&
           PowerLimitSetter::toMicroWatts(4096) == 4096000000ULL &&
           PowerLimitSetter::toMicroWatts(PowerLimitSetter::MAX_WATTS) == 18446744073709000000ULL;
}

bool test_micro_watts_overflow_is_rejected()
{
    for (uint64_t watts : {PowerLimitSetter::MAX_WATTS + 1, uint64_t(20000000000000ULL), uint64_t(-5)}) {
        try {
            auto microWatts = PowerLimitSetter::toMicroWatts(watts);
            LOG_ERROR("{} W converted to {} uW", watts, microWatts);
            return false;
        }
        catch (const UsageError& e) {
            LOG_DEBUG("Rejected as expected: {}", e.what());
        }
    }
    return true;
}

bool test_parse_watts()
{
    if (PowerLimitSetter::parseWatts("25") != 25 || PowerLimitSetter::parseWatts("0") != 0 ||
        PowerLimitSetter::parseWatts("18446744073709") != PowerLimitSetter::MAX_WATTS) {
        return false;
    }
    const std::vector<std::string> badValues {
        "-5", "+5", "", "25W", "2.5", " 25", "18446744073710", "99999999999999999999999"
    };
    for (auto&& text : badValues) {
        try {
            PowerLimitSetter::parseWatts(text);
            LOG_ERROR("Watts accepted: '{}'", text);
            return false;
        }
        catch (const UsageError& e) {
            LOG_DEBUG("Rejected as expected: {}", e.what());
        }
    }
    return true;
}

bool test_out_of_range_request_writes_nothing()
{
    auto acc = makeMachine(0x0, MCHBAR_BASE | 1, 0x0, 0x0);
    FakePowerCap powerCap;

    PowerLimitSetter setter(acc, powerCap, nullptr, MmioPolicy::DISABLE);
    try {
        setter.apply({20000000000000ULL, 30});
    }
    catch (const UsageError&) {
        return powerCap.writes_.empty() && acc.log_.empty();
    }
    LOG_ERROR("Expected UsageError");
    return false;
}

int main()
{
    LOAD_ENV_LEVELS()

    CHECK(test_full_sequence());
    CHECK(test_mirror_uses_reconciled_msr_image());
    CHECK(test_locked_mmio_is_warning_only());
    CHECK(test_disabled_mchbar_aborts_before_mmio());
    CHECK(test_msr_failure_aborts_sequence());
    CHECK(test_powercap_readback_mismatch_is_not_fatal());
    CHECK(test_micro_watts());
    CHECK(test_micro_watts_overflow_is_rejected());
    CHECK(test_parse_watts());
    CHECK(test_out_of_range_request_writes_nothing());

    return 0;
}
