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

#include "reconcilers/mmio_reconciler.hpp"
#include "power_interface/bit_field.hpp"
#include "power_interface/msr_offsets.hpp"
#include "logging/logging.hpp"

MmioReconciler::MmioReconciler(RegisterAccessor& accessor, MmioPolicy policy) :
    accessor_(accessor), policy_(policy)
{
}

uint64_t MmioReconciler::readImage(uint64_t registerAddress)
{
    const uint32_t low = accessor_.readPhysicalMemoryWord(registerAddress);
    const uint32_t high = accessor_.readPhysicalMemoryWord(registerAddress + MMIO_HIGH_WORD_OFFSET);
    return composeWords(low, high);
}

void MmioReconciler::writeImage(uint64_t registerAddress, uint64_t image)
{
    // LOCK lives in HIGH, so HIGH has to be the last write
    accessor_.writePhysicalMemoryWord(registerAddress, lowWord(image));
    accessor_.writePhysicalMemoryWord(registerAddress + MMIO_HIGH_WORD_OFFSET, highWord(image));
}

uint64_t MmioReconciler::targetImage(MmioPolicy policy, uint64_t msrImage)
{
    const uint64_t image = (policy == MmioPolicy::MIRROR) ? msrImage : 0;
    return withField(image, MMIO_LOCK_BIT, true);
}

MmioOutcome MmioReconciler::classifyLocked(uint64_t entryImage) const
{
    const bool anyEnabled = isFieldEnabled(entryImage, MMIO_PL1_ENABLE_BIT) ||
                            isFieldEnabled(entryImage, MMIO_PL2_ENABLE_BIT);
    if (anyEnabled) {
        return MmioOutcome::LOCKED_WITH_LIMITS_ACTIVE;
    }
    // disabled and locked, most likely by an earlier run in this power-on session
    return policy_ == MmioPolicy::DISABLE ? MmioOutcome::ALREADY_RECONCILED
                                          : MmioOutcome::LOCKED_CANNOT_MIRROR;
}

MmioReconcileResult MmioReconciler::reconcile(uint64_t registerAddress, uint64_t msrImage)
{
    MmioReconcileResult result;
    result.entryImage = readImage(registerAddress);
    result.entryLockState = lockStateOf(result.entryImage);
    LOG_INFO("Current value of PACKAGE_RAPL_LIMIT_0_0_0_MCHBAR_PCU = {:#010x}:{:#010x}",
             highWord(result.entryImage), lowWord(result.entryImage));

    if (result.entryLockState == LockState::LOCKED) {
        result.outcome = classifyLocked(result.entryImage);
        switch (result.outcome) {
            case MmioOutcome::LOCKED_WITH_LIMITS_ACTIVE :
                LOG_WARN("MMIO limit reg already locked but with PL1 and/or PL2 enabled, can't change it until power-off");
                break;
            case MmioOutcome::LOCKED_CANNOT_MIRROR :
                LOG_WARN("MMIO limit reg already locked so can't set PL1/PL2 values in it");
                break;
            default :
                LOG_INFO("MMIO limit reg locked with PL1/PL2 disabled on previous invocation (expected)");
                break;
        }
        return result;
    }

    const uint64_t image = targetImage(policy_, msrImage);
    LOG_INFO("Setting PACKAGE_RAPL_LIMIT_0_0_0_MCHBAR_PCU = {:#010x}:{:#010x} (policy: {})",
             highWord(image), lowWord(image), toString(policy_));
    writeImage(registerAddress, image);
    result.writtenImage = image;
    result.outcome = MmioOutcome::WRITTEN;
    return result;
}
