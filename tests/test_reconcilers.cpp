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
#include "power_interface/msr_offsets.hpp"
#include "reconcilers/msr_reconciler.hpp"
#include "reconcilers/mchbar_resolver.hpp"
#include "reconcilers/mmio_reconciler.hpp"

static constexpr uint64_t MCHBAR_BASE {0xfedc0000};
static constexpr uint64_t RAPL_LIMIT_ADDR {MCHBAR_BASE + 0x59a0};

static void setMmio(FakeRegisterAccessor& acc, uint32_t low, uint32_t high)
{
    acc.memory_[RAPL_LIMIT_ADDR] = low;
    acc.memory_[RAPL_LIMIT_ADDR + 4] = high;
}

bool test_msr_enables_both_limits()
{
    FakeRegisterAccessor acc;
    acc.msrs_[MSR_PKG_RAPL_POWER_LIMIT] = 0x0;

    auto result = MsrReconciler(acc).reconcile();

    auto writes = acc.writes();
    if (writes.size() != 1 || writes[0].kind != AccessKind::MSR_WRITE) {
        LOG_ERROR("Expected exactly one MSR write, got {}", writes.size());
        return false;
    }
    if (writes[0].address != MSR_PKG_RAPL_POWER_LIMIT || writes[0].value != 0x0000800000008000ULL) {
        LOG_ERROR("Unexpected MSR write {:#x} = {:#018x}", writes[0].address, writes[0].value);
        return false;
    }
    return result.outcome == MsrOutcome::ENABLED && result.image == 0x0000800000008000ULL;
}

bool test_msr_keeps_other_bits()
{
    // PL1 = 0x140 units and window set by powercap, only PL1 enabled
    const uint64_t current = 0x00df80c800dd8140ULL & ~(uint64_t(1) << 47);
    FakeRegisterAccessor acc;
    acc.msrs_[MSR_PKG_RAPL_POWER_LIMIT] = current;

    auto result = MsrReconciler(acc).reconcile();

    auto writes = acc.writes();
    if (writes.size() != 1) {
        return false;
    }
    const uint64_t expected = current | MsrReconciler::requiredMask();
    return writes[0].value == expected && result.image == expected && result.entryImage == current;
}

bool test_msr_already_enabled()
{
    for (uint64_t current : {0x0000800000008000ULL, 0xffffffffffffffffULL, 0x80df80c800dd8140ULL}) {
        FakeRegisterAccessor acc;
        acc.msrs_[MSR_PKG_RAPL_POWER_LIMIT] = current;

        auto result = MsrReconciler(acc).reconcile();
        if (!acc.writes().empty()) {
            LOG_ERROR("Unexpected write for MSR {:#018x}", current);
            return false;
        }
        if (result.outcome != MsrOutcome::ALREADY_ENABLED || result.image != current) {
            return false;
        }
    }
    return true;
}

bool test_msr_access_error_propagates()
{
    FakeRegisterAccessor acc;
    acc.msrs_[MSR_PKG_RAPL_POWER_LIMIT] = 0x0;
    acc.failOn_ = AccessKind::MSR_WRITE;
    try {
        MsrReconciler(acc).reconcile();
    }
    catch (const AccessError&) {
        return true;
    }
    LOG_ERROR("AccessError was not propagated");
    return false;
}

bool test_mchbar_disabled()
{
    FakeRegisterAccessor acc;
    acc.pciConfig_[std::make_tuple(0u, 0u, 0u, 0x48u)] = 0xfedc0000;
    try {
        MchbarResolver(acc).resolveBase();
    }
    catch (const BaseRegisterDisabled&) {
        return acc.count(AccessKind::MEM_READ) == 0;
    }
    LOG_ERROR("Expected BaseRegisterDisabled");
    return false;
}

bool test_mchbar_enabled()
{
    FakeRegisterAccessor acc;
    acc.pciConfig_[std::make_tuple(0u, 0u, 0u, 0x48u)] = 0xfedc0001;
    MchbarResolver resolver(acc);
    if (resolver.resolveBase() != 0xfedc0000) {
        return false;
    }
    return resolver.resolvePowerLimitRegisterAddress() == RAPL_LIMIT_ADDR;
}

// Scenario B
bool test_mmio_disable_unlocked()
{
    FakeRegisterAccessor acc;
    setMmio(acc, 0x0, 0x0);

    auto result = MmioReconciler(acc, MmioPolicy::DISABLE).reconcile(RAPL_LIMIT_ADDR, 0x0000800000008000ULL);

    auto writes = acc.writes();
    if (writes.size() != 2) {
        LOG_ERROR("Expected two MMIO writes, got {}", writes.size());
        return false;
    }
    // LOW first, HIGH (with LOCK) last
    if (writes[0].address != RAPL_LIMIT_ADDR || writes[0].value != 0x0) {
        return false;
    }
    if (writes[1].address != RAPL_LIMIT_ADDR + 4 || writes[1].value != 0x80000000) {
        return false;
    }
    return result.outcome == MmioOutcome::WRITTEN &&
           result.entryLockState == LockState::UNLOCKED &&
           result.writtenImage.has_value() && result.writtenImage.value() == 0x8000000000000000ULL;
}

bool test_mmio_disable_clears_enabled_limits()
{
    FakeRegisterAccessor acc;
    setMmio(acc, 0x000dc8c8, 0x00438118);

    MmioReconciler(acc, MmioPolicy::DISABLE).reconcile(RAPL_LIMIT_ADDR, 0x0);

    return acc.memory_[RAPL_LIMIT_ADDR] == 0x0 && acc.memory_[RAPL_LIMIT_ADDR + 4] == 0x80000000;
}

bool test_mmio_mirror_unlocked()
{
    const uint64_t msrImage = 0x00df80c800dd8140ULL;
    FakeRegisterAccessor acc;
    setMmio(acc, 0x000dc8c8, 0x00438118);

    auto result = MmioReconciler(acc, MmioPolicy::MIRROR).reconcile(RAPL_LIMIT_ADDR, msrImage);

    if (acc.memory_[RAPL_LIMIT_ADDR] != 0x00dd8140) {
        LOG_ERROR("Unexpected LOW {:#010x}", acc.memory_[RAPL_LIMIT_ADDR]);
        return false;
    }
    if (acc.memory_[RAPL_LIMIT_ADDR + 4] != 0x80df80c8) {
        LOG_ERROR("Unexpected HIGH {:#010x}", acc.memory_[RAPL_LIMIT_ADDR + 4]);
        return false;
    }
    return result.outcome == MmioOutcome::WRITTEN;
}

// Scenario C
bool test_mmio_locked_and_disabled()
{
    for (auto policy : {MmioPolicy::DISABLE, MmioPolicy::MIRROR}) {
        FakeRegisterAccessor acc;
        setMmio(acc, 0x0, 0x80000000);

        auto result = MmioReconciler(acc, policy).reconcile(RAPL_LIMIT_ADDR, 0x0000800000008000ULL);

        if (!acc.writes().empty()) {
            LOG_ERROR("Locked register was written with policy {}", toString(policy));
            return false;
        }
        const auto expected = (policy == MmioPolicy::DISABLE) ? MmioOutcome::ALREADY_RECONCILED
                                                               : MmioOutcome::LOCKED_CANNOT_MIRROR;
        if (result.outcome != expected || result.writtenImage.has_value()) {
            LOG_ERROR("Expected {}, got {}", toString(expected), toString(result.outcome));
            return false;
        }
    }
    return true;
}

// Scenario D and every other locked enable-bit combination
bool test_mmio_locked_with_limits_active()
{
    const std::vector<std::pair<uint32_t, uint32_t>> lockedActive {
        {0x00000000, 0x80008000},
        {0x00008000, 0x80000000},
        {0x00008000, 0x80008000},
        {0x000dc8c8, 0x80438118}
    };
    for (auto policy : {MmioPolicy::DISABLE, MmioPolicy::MIRROR}) {
        for (auto&& words : lockedActive) {
            FakeRegisterAccessor acc;
            setMmio(acc, words.first, words.second);

            auto result = MmioReconciler(acc, policy).reconcile(RAPL_LIMIT_ADDR, 0x0);

            if (!acc.writes().empty()) {
                LOG_ERROR("Locked register {:#010x}:{:#010x} was written", words.second, words.first);
                return false;
            }
            if (result.outcome != MmioOutcome::LOCKED_WITH_LIMITS_ACTIVE || !result.isWarning()) {
                return false;
            }
        }
    }
    return true;
}

bool test_mmio_rerun_after_write_is_noop()
{
    FakeRegisterAccessor acc;
    setMmio(acc, 0x0, 0x0);
    MmioReconciler reconciler(acc, MmioPolicy::DISABLE);

    reconciler.reconcile(RAPL_LIMIT_ADDR, 0x0);
    const auto writesAfterFirst = acc.writes().size();
    auto second = reconciler.reconcile(RAPL_LIMIT_ADDR, 0x0);

    return writesAfterFirst == 2 &&
           acc.writes().size() == 2 &&
           second.outcome == MmioOutcome::ALREADY_RECONCILED &&
           second.entryLockState == LockState::LOCKED;
}

// HIGH write fails after LOW landed, the register stays unlocked so a rerun completes it
bool test_mmio_mirror_partial_write_recovers()
{
    const uint64_t msrImage = 0x00df80c800dd8140ULL;
    FakeRegisterAccessor acc;
    setMmio(acc, 0x000dc8c8, 0x00438118);
    acc.failOn_ = AccessKind::MEM_WRITE;
    acc.failOnOccurrence_ = 2;
    MmioReconciler reconciler(acc, MmioPolicy::MIRROR);

    try {
        reconciler.reconcile(RAPL_LIMIT_ADDR, msrImage);
        LOG_ERROR("HIGH write failure was not propagated");
        return false;
    }
    catch (const AccessError& e) {
        LOG_DEBUG("First run failed as expected: {}", e.what());
    }
    if (acc.memory_[RAPL_LIMIT_ADDR] != 0x00dd8140 || acc.memory_[RAPL_LIMIT_ADDR + 4] != 0x00438118) {
        LOG_ERROR("Unexpected partial state {:#010x}:{:#010x}",
                  acc.memory_[RAPL_LIMIT_ADDR + 4], acc.memory_[RAPL_LIMIT_ADDR]);
        return false;
    }

    auto rerun = reconciler.reconcile(RAPL_LIMIT_ADDR, msrImage);

    return rerun.outcome == MmioOutcome::WRITTEN &&
           rerun.entryLockState == LockState::UNLOCKED &&
           acc.memory_[RAPL_LIMIT_ADDR] == 0x00dd8140 &&
           acc.memory_[RAPL_LIMIT_ADDR + 4] == 0x80df80c8 &&
           acc.count(AccessKind::MEM_WRITE) == 3;
}

bool test_mmio_target_image()
{
    return MmioReconciler::targetImage(MmioPolicy::DISABLE, 0xffffffffffffffffULL) == 0x8000000000000000ULL &&
           MmioReconciler::targetImage(MmioPolicy::MIRROR, 0x0000800000008000ULL) == 0x8000800000008000ULL;
}

int main()
{
    LOAD_ENV_LEVELS()

    CHECK(test_msr_enables_both_limits());
    CHECK(test_msr_keeps_other_bits());
    CHECK(test_msr_already_enabled());
    CHECK(test_msr_access_error_propagates());
    CHECK(test_mchbar_disabled());
    CHECK(test_mchbar_enabled());
    CHECK(test_mmio_disable_unlocked());
    CHECK(test_mmio_disable_clears_enabled_limits());
    CHECK(test_mmio_mirror_unlocked());
    CHECK(test_mmio_locked_and_disabled());
    CHECK(test_mmio_locked_with_limits_active());
    CHECK(test_mmio_rerun_after_write_is_noop());
    CHECK(test_mmio_mirror_partial_write_recovers());
    CHECK(test_mmio_target_image());

    return 0;
}
