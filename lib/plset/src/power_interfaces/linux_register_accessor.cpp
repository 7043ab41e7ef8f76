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

#include "power_interface/linux_register_accessor.hpp"
#include "power_interface/msr.hpp"
#include "power_interface/phys_mem.hpp"
#include "power_interface/pci_config.hpp"

LinuxRegisterAccessor::LinuxRegisterAccessor(int msrCore) :
    msrCore_(msrCore)
{
}

uint64_t LinuxRegisterAccessor::readModelSpecificRegister(uint32_t index)
{
    MSR msr(msrCore_);
    return msr.readMSR(index);
}

void LinuxRegisterAccessor::writeModelSpecificRegister(uint32_t index, uint64_t value)
{
    MSR msr(msrCore_);
    msr.writeMSR(index, value);
}

uint32_t LinuxRegisterAccessor::readPhysicalMemoryWord(uint64_t address)
{
    PhysicalMemory mem;
    return mem.readWord(address);
}

void LinuxRegisterAccessor::writePhysicalMemoryWord(uint64_t address, uint32_t value)
{
    PhysicalMemory mem;
    mem.writeWord(address, value);
}

uint32_t LinuxRegisterAccessor::readPciConfigDword(unsigned bus, unsigned device, unsigned function, unsigned offset)
{
    return PciConfig::readDword(bus, device, function, offset);
}
