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

// Reads of PCI configuration space through sysfs (domain 0000 only).
class PciConfig {
public:
    static std::string configPath(unsigned bus, unsigned device, unsigned function);
    static uint32_t readDword(unsigned bus, unsigned device, unsigned function, unsigned offset);
};
