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

#include "power_interface/phys_mem.hpp"
#include "errors.hpp"
#include "logging/logging.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <sys/mman.h>
#include <cerrno>
#include <cstring>
#include <sstream>

static inline std::string hexAddress(uint64_t address) {
    std::stringstream ss;
    ss << "0x" << std::hex << address;
    return ss.str();
}

PhysicalMemory::PhysicalMemory() : pageSize_(sysconf(_SC_PAGESIZE)) {
    fileDescriptor_ = open(PHYS_MEM_DEVICE, O_RDWR | O_SYNC);
    if (fileDescriptor_ < 0) {
        fileDescriptor_ = -1;
        throw AccessError(std::string("cannot open ") + PHYS_MEM_DEVICE + ": " + strerror(errno));
    }
}

PhysicalMemory::~PhysicalMemory() {
    if (fileDescriptor_ >= 0) {
        close(fileDescriptor_);
    }
}

volatile uint32_t* PhysicalMemory::mapWord(uint64_t address, void*& pageBase) {
    if (address % sizeof(uint32_t) != 0) {
        throw AccessError("unaligned physical memory word " + hexAddress(address));
    }
    const uint64_t pageMask = ~(uint64_t(pageSize_) - 1);
    const uint64_t pageAddress = address & pageMask;
    pageBase = mmap(nullptr, pageSize_, PROT_READ | PROT_WRITE, MAP_SHARED,
                    fileDescriptor_, static_cast<off_t>(pageAddress));
    if (pageBase == MAP_FAILED) {
        pageBase = nullptr;
        throw AccessError("cannot map physical address " + hexAddress(address) + ": " + strerror(errno));
    }
    auto* bytes = static_cast<volatile uint8_t*>(pageBase);
    return reinterpret_cast<volatile uint32_t*>(bytes + (address - pageAddress));
}

void PhysicalMemory::unmapPage(void* pageBase) {
    if (munmap(pageBase, pageSize_) != 0) {
        LOG_WARN("munmap of physical memory page failed: {}", strerror(errno));
    }
}

uint32_t PhysicalMemory::readWord(uint64_t address) {
    void* pageBase = nullptr;
    volatile uint32_t* word = mapWord(address, pageBase);
    uint32_t value = *word;
    unmapPage(pageBase);
    LOG_TRACE("Value at address {:#x}: {:#010x}", address, value);
    return value;
}

void PhysicalMemory::writeWord(uint64_t address, uint32_t value) {
    void* pageBase = nullptr;
    volatile uint32_t* word = mapWord(address, pageBase);
    *word = value;
    unmapPage(pageBase);
    LOG_TRACE("Written {:#010x} to address {:#x}", value, address);
}
