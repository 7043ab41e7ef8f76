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

#include "plset_constants.hpp"

#include <cstdint>
#include <string>

static constexpr char DEFAULT_POWERCAP_DIR[] = "/sys/class/powercap/intel-rapl/intel-rapl:0/";

class PowerCapInterface
{
public:
    PowerCapInterface() {}
    virtual ~PowerCapInterface() = default;
    virtual void writePowerCapLimit(PowerCapConstraint constraint, uint64_t limitInMicroW) = 0;
    virtual uint64_t readPowerCapLimit(PowerCapConstraint constraint) = 0;
};

// Package power limits through the intel-rapl powercap sysfs tree.
class SysfsPowerCap : public PowerCapInterface
{
public:
    explicit SysfsPowerCap(std::string raplDir = DEFAULT_POWERCAP_DIR);
    virtual ~SysfsPowerCap() = default;

    void writePowerCapLimit(PowerCapConstraint constraint, uint64_t limitInMicroW) override;
    uint64_t readPowerCapLimit(PowerCapConstraint constraint) override;
    std::string constraintFile(PowerCapConstraint constraint) const;

private:
    std::string raplDir_;
};
