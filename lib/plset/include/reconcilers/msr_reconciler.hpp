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

struct MsrReconcileResult {
    MsrOutcome outcome;
    uint64_t entryImage;
    uint64_t image; // MSR_PKG_POWER_LIMIT after the step
};

/*
  MsrReconciler - sets PL1 and PL2 enable bits of MSR_PKG_POWER_LIMIT

  At most one write is issued, and only when an enable bit is missing.
  All other bits (limits and time windows written by powercap just before)
  are written back unchanged.
*/
class MsrReconciler
{
public:
    explicit MsrReconciler(RegisterAccessor& accessor);
    MsrReconcileResult reconcile();

    static uint64_t requiredMask();

private:
    RegisterAccessor& accessor_;
};
