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

#include "power_interface/pci_config.hpp"
#include "errors.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <sstream>

std::string PciConfig::configPath(unsigned bus, unsigned device, unsigned function) {
    std::stringstream ss;
    ss << "/sys/bus/pci/devices/0000:"
       << std::hex << std::setfill('0')
       << std::setw(2) << bus << ":"
       << std::setw(2) << device << "."
       << std::setw(1) << function << "/config";
    return ss.str();
}

uint32_t PciConfig::readDword(unsigned bus, unsigned device, unsigned function, unsigned offset) {
    const auto path = configPath(bus, device, function);
    int fd = open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw AccessError("cannot open " + path + ": " + strerror(errno));
    }
    uint32_t value = 0;
    auto bytesRead = pread(fd, &value, sizeof(value), offset);
    int readErrno = errno;
    close(fd);
    if (bytesRead != sizeof(value)) {
        std::stringstream ss;
        ss << "cannot read config dword 0x" << std::hex << offset << " of " << path;
        if (bytesRead < 0) {
            ss << ": " << strerror(readErrno);
        } else {
            ss << ": short read (root privileges are needed beyond the first 64 bytes)";
        }
        throw AccessError(ss.str());
    }
    return value;
}
