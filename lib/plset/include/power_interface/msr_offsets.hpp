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

#include <cstdint>

/* Package RAPL Domain */
#ifndef MSR_PKG_RAPL_POWER_LIMIT
#    define MSR_PKG_RAPL_POWER_LIMIT    0x610
#endif

/*
 * MSR_PKG_POWER_LIMIT layout (only the enable bits are ever touched here,
 * power/time-window/clamp sub-fields are opaque):
 *   bit 15 - PL1 (long term) enable
 *   bit 47 - PL2 (short term) enable
 *   bit 63 - lock, set by BIOS
 */
static constexpr unsigned MSR_PL1_ENABLE_BIT {15};
static constexpr unsigned MSR_PL2_ENABLE_BIT {47};
static constexpr unsigned MSR_LOCK_BIT {63};

/* Host bridge (00:00.0) config space holding the MCHBAR base */
static constexpr unsigned MCHBAR_PCI_BUS {0};
static constexpr unsigned MCHBAR_PCI_DEVICE {0};
static constexpr unsigned MCHBAR_PCI_FUNCTION {0};
static constexpr unsigned MCHBAR_PCI_OFFSET {0x48};
static constexpr unsigned MCHBAR_ENABLE_BIT {0};

/*
 * PACKAGE_RAPL_LIMIT_0_0_0_MCHBAR_PCU, the MMIO mirror of MSR_PKG_POWER_LIMIT.
 * Stored as two 32-bit words: LOW at +0, HIGH at +4. Bit positions below are
 * given in the 64-bit image composed from both words.
 */
static constexpr uint64_t MCHBAR_PKG_RAPL_LIMIT_OFFSET {0x59a0};
static constexpr uint64_t MMIO_HIGH_WORD_OFFSET {4};
static constexpr unsigned MMIO_PL1_ENABLE_BIT {15};    // bit 15 of LOW
static constexpr unsigned MMIO_PL2_ENABLE_BIT {47};    // bit 15 of HIGH
static constexpr unsigned MMIO_LOCK_BIT {63};          // bit 31 of HIGH
