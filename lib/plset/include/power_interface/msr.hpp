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
#include <string>

static constexpr int UNDEFINED_FD {-1};

// Access to model-specific registers of one core through the msr driver.
class MSR {
public:
    MSR() = delete;
    MSR(int core);
    MSR(const MSR&) = delete;
    MSR& operator=(const MSR&) = delete;
    ~MSR();
    uint64_t readMSR(uint32_t offset);
    void writeMSR(uint32_t offset, uint64_t value);

    static std::string devicePath(int core);

private:
    int fileDescriptor_ {UNDEFINED_FD};
    int core_;
    void openMSR(int core);
};
