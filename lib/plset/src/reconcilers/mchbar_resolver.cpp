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

#include "reconcilers/mchbar_resolver.hpp"
#include "power_interface/bit_field.hpp"
#include "power_interface/msr_offsets.hpp"
#include "errors.hpp"
#include "logging/logging.hpp"

MchbarResolver::MchbarResolver(RegisterAccessor& accessor) :
    accessor_(accessor)
{
}

uint64_t MchbarResolver::resolveBase()
{
    const uint32_t mchbar = accessor_.readPciConfigDword(MCHBAR_PCI_BUS,
                                                         MCHBAR_PCI_DEVICE,
                                                         MCHBAR_PCI_FUNCTION,
                                                         MCHBAR_PCI_OFFSET);
    LOG_INFO("MCHBAR is {:#x}", mchbar);
    if (!isFieldEnabled(mchbar, MCHBAR_ENABLE_BIT)) {
        throw BaseRegisterDisabled("MCHBAR is not enabled");
    }
    return withField(mchbar, MCHBAR_ENABLE_BIT, false);
}

uint64_t MchbarResolver::resolvePowerLimitRegisterAddress()
{
    const uint64_t address = resolveBase() + MCHBAR_PKG_RAPL_LIMIT_OFFSET;
    LOG_DEBUG("PACKAGE_RAPL_LIMIT_0_0_0_MCHBAR_PCU at {:#x}", address);
    return address;
}
