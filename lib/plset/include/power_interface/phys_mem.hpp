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

static constexpr char PHYS_MEM_DEVICE[] = "/dev/mem";

/*
  32-bit word access to physical memory through /dev/mem. The page holding
  the word is mapped for the duration of one access only.
*/
class PhysicalMemory {
public:
    PhysicalMemory();
    PhysicalMemory(const PhysicalMemory&) = delete;
    PhysicalMemory& operator=(const PhysicalMemory&) = delete;
    ~PhysicalMemory();
    uint32_t readWord(uint64_t address);
    void writeWord(uint64_t address, uint32_t value);

private:
    int fileDescriptor_ {-1};
    long pageSize_;
    volatile uint32_t* mapWord(uint64_t address, void*& pageBase);
    void unmapPage(void* pageBase);
};
