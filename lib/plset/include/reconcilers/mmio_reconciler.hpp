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

#include <cstdint>
#include <optional>

struct MmioReconcileResult {
    MmioOutcome outcome {MmioOutcome::WRITTEN};
    LockState entryLockState {LockState::UNLOCKED};
    uint64_t entryImage {0};
    std::optional<uint64_t> writtenImage;

    bool isWarning() const {
        return outcome == MmioOutcome::LOCKED_WITH_LIMITS_ACTIVE ||
               outcome == MmioOutcome::LOCKED_CANNOT_MIRROR;
    }
};

/*
  MmioReconciler - brings PACKAGE_RAPL_LIMIT (MMIO mirror of
  MSR_PKG_POWER_LIMIT) in line with the selected policy and locks it.

  The register has a one-way LOCK bit which the hardware keeps until the next
  power cycle. The register state is read fresh on every call:

    UNLOCKED --(write LOW, then HIGH with LOCK set)--> LOCKED

  In LOCKED state no write is ever issued, whatever the enable bits say.
  Policies:
    DISABLE - LOW and HIGH cleared, so the MMIO limits are not enforced
    MIRROR  - LOW and HIGH copied from the MSR image
*/
class MmioReconciler
{
public:
    MmioReconciler(RegisterAccessor& accessor, MmioPolicy policy);

    MmioReconcileResult reconcile(uint64_t registerAddress, uint64_t msrImage);
    uint64_t readImage(uint64_t registerAddress);

    // image written on an unlocked register, LOCK always set
    static uint64_t targetImage(MmioPolicy policy, uint64_t msrImage);

private:
    RegisterAccessor& accessor_;
    MmioPolicy policy_;

    MmioOutcome classifyLocked(uint64_t entryImage) const;
    void writeImage(uint64_t registerAddress, uint64_t image);
};
