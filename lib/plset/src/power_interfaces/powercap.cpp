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

#include "power_interface/powercap.hpp"
#include "errors.hpp"

#include <fstream>
#include <sstream>
#include <utility>

SysfsPowerCap::SysfsPowerCap(std::string raplDir) :
    raplDir_(std::move(raplDir))
{
    if (!raplDir_.empty() && raplDir_.back() != '/') {
        raplDir_ += "/";
    }
}

std::string SysfsPowerCap::constraintFile(PowerCapConstraint constraint) const
{
    return raplDir_ + "constraint_" + std::to_string(static_cast<int>(constraint)) + "_power_limit_uw";
}

void SysfsPowerCap::writePowerCapLimit(PowerCapConstraint constraint, uint64_t limitInMicroW)
{
    const auto fileName = constraintFile(constraint);
    std::ofstream outfile (fileName.c_str(), std::ios::out | std::ios::trunc);
    if (!outfile.is_open()) {
        throw AccessError("cannot write the limit to file " + fileName + ": file not open");
    }
    outfile << limitInMicroW;
    outfile.close();
    // sysfs reports a rejected value on flush/close
    if (outfile.fail()) {
        throw AccessError("cannot write the limit " + std::to_string(limitInMicroW) + " to file " + fileName);
    }
}

uint64_t SysfsPowerCap::readPowerCapLimit(PowerCapConstraint constraint)
{
    const auto fileName = constraintFile(constraint);
    std::ifstream limitFile (fileName.c_str());
    if (!limitFile.is_open()) {
        throw AccessError("cannot read the limit file: " + fileName + ": file not open");
    }
    uint64_t limit = 0;
    if (!(limitFile >> limit)) {
        throw AccessError("cannot parse the limit file: " + fileName);
    }
    return limit;
}
