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

#include "power_interface/msr.hpp"
#include "errors.hpp"
#include "logging/logging.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <sstream>

MSR::MSR(int core) : core_(core) {
    openMSR(core);
}

MSR::~MSR() {
    if (fileDescriptor_ != UNDEFINED_FD) {
        close(fileDescriptor_);
    }
}

std::string MSR::devicePath(int core) {
    std::stringstream filenameStream;
    filenameStream << "/dev/cpu/" << core << "/msr";
    return filenameStream.str();
}

void MSR::openMSR(int core) {
    const auto filename = devicePath(core);
    fileDescriptor_ = open(filename.c_str(), O_RDWR);
    if (fileDescriptor_ < 0) {
        fileDescriptor_ = UNDEFINED_FD;
        if (errno == ENXIO) {
            throw AccessError("rdmsr: No CPU " + std::to_string(core));
        } else if (errno == EIO) {
            throw AccessError("rdmsr: CPU " + std::to_string(core) + " doesn't support MSRs");
        } else {
            throw AccessError("rdmsr: cannot open " + filename + ": " + strerror(errno));
        }
    }
    LOG_DEBUG("Opened {}", filename);
}

uint64_t MSR::readMSR(uint32_t offset) {
    uint64_t data;
    if (pread(fileDescriptor_, &data, sizeof(data), offset) != sizeof(data)) {
        std::stringstream ss;
        ss << "rdmsr: CPU " << core_ << " cannot read MSR 0x" << std::hex << offset
           << ": " << strerror(errno);
        throw AccessError(ss.str());
    }
    return data;
}

void MSR::writeMSR(uint32_t offset, uint64_t value) {
    if (pwrite(fileDescriptor_, (const void *)&value, sizeof(uint64_t), offset) != sizeof(value)) {
        std::stringstream ss;
        ss << "wrmsr: CPU " << core_ << " cannot write MSR 0x" << std::hex << offset
           << ": " << strerror(errno);
        throw AccessError(ss.str());
    }
}
