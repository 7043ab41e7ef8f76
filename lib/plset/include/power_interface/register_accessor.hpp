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

/*
  RegisterAccessor - privileged hardware access used by the reconcilers

  Every call is a single blocking operation on a machine-wide resource.
  A failing read or write throws AccessError, there is no partial result.
  The reconcilers only depend on this interface, so they can be exercised
  against an in-memory fake.
*/
class RegisterAccessor
{
public:
    RegisterAccessor() {}
    virtual ~RegisterAccessor() = default;
    virtual uint64_t readModelSpecificRegister(uint32_t index) = 0;
    virtual void writeModelSpecificRegister(uint32_t index, uint64_t value) = 0;
    virtual uint32_t readPhysicalMemoryWord(uint64_t address) = 0;
    virtual void writePhysicalMemoryWord(uint64_t address, uint32_t value) = 0;
    virtual uint32_t readPciConfigDword(unsigned bus, unsigned device, unsigned function, unsigned offset) = 0;
};
