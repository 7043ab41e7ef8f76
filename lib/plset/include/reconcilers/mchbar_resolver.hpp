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

#include "power_interface/register_accessor.hpp"

#include <cstdint>

// Finds the MCHBAR window from host bridge config space.
class MchbarResolver
{
public:
    explicit MchbarResolver(RegisterAccessor& accessor);

    // throws BaseRegisterDisabled when the MCHBAR enable bit is clear
    uint64_t resolveBase();
    // physical address of PACKAGE_RAPL_LIMIT (MCHBAR + 0x59a0)
    uint64_t resolvePowerLimitRegisterAddress();

private:
    RegisterAccessor& accessor_;
};
