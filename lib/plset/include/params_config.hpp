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
#include "power_interface/powercap.hpp"

#include <iostream>
#include <string>

class ParamsConfig {
public:
    explicit ParamsConfig(const std::string& configFileName = "config.yaml");
    const std::string configFileName_;
    MmioPolicy mmioPolicy_ {MmioPolicy::DISABLE};
    int msrCore_ {0};
    std::string powercapDir_ {DEFAULT_POWERCAP_DIR};
    int telemetry_ {1};
    int logLevel_ {2}; // 0 - trace ... 6 - off
    void printConfigExplained(std::ostream& os = std::cout);

    static MmioPolicy parseMmioPolicy(const std::string& name);
    // same keys as the YAML file, used by loadConfig()
    void loadFromString(const std::string& yamlText);
private:
    void loadConfig();
};
