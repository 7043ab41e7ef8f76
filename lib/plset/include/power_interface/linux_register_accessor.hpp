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

#include "register_accessor.hpp"

/*
  RegisterAccessor backed by Linux kernel interfaces:
    MSR       - /dev/cpu/<core>/msr (msr driver)
    phys. mem - /dev/mem
    PCI cfg   - /sys/bus/pci/devices/.../config
  Device files are opened per access, nothing is kept open between steps.
*/
class LinuxRegisterAccessor : public RegisterAccessor
{
public:
    explicit LinuxRegisterAccessor(int msrCore = 0);
    virtual ~LinuxRegisterAccessor() = default;

    uint64_t readModelSpecificRegister(uint32_t index) override;
    void writeModelSpecificRegister(uint32_t index, uint64_t value) override;
    uint32_t readPhysicalMemoryWord(uint64_t address) override;
    void writePhysicalMemoryWord(uint64_t address, uint32_t value) override;
    uint32_t readPciConfigDword(unsigned bus, unsigned device, unsigned function, unsigned offset) override;

private:
    int msrCore_;
};
