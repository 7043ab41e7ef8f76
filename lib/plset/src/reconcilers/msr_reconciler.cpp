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

#include "reconcilers/msr_reconciler.hpp"
#include "power_interface/bit_field.hpp"
#include "power_interface/msr_offsets.hpp"
#include "logging/logging.hpp"

MsrReconciler::MsrReconciler(RegisterAccessor& accessor) :
    accessor_(accessor)
{
}

uint64_t MsrReconciler::requiredMask()
{
    return fieldMask(MSR_PL1_ENABLE_BIT) | fieldMask(MSR_PL2_ENABLE_BIT);
}

MsrReconcileResult MsrReconciler::reconcile()
{
    const uint64_t current = accessor_.readModelSpecificRegister(MSR_PKG_RAPL_POWER_LIMIT);
    LOG_DEBUG("MSR_PKG_POWER_LIMIT = {:#018x}", current);

    if (isFieldEnabled(current, MSR_LOCK_BIT)) {
        LOG_WARN("MSR_PKG_POWER_LIMIT is locked by BIOS, enable bits may not be changeable");
    }

    const uint64_t mask = requiredMask();
    if ((current & mask) == mask) {
        LOG_INFO("PL1 and PL2 already enabled in MSR_PKG_POWER_LIMIT");
        return {MsrOutcome::ALREADY_ENABLED, current, current};
    }

    const uint64_t updated = current | mask;
    LOG_INFO("Enabling PL1 and PL2 in MSR_PKG_POWER_LIMIT ({:#018x} -> {:#018x})", current, updated);
    accessor_.writeModelSpecificRegister(MSR_PKG_RAPL_POWER_LIMIT, updated);
    return {MsrOutcome::ENABLED, current, updated};
}
