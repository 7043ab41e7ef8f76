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

#include <iostream>
#include "params_config.hpp"
#include "errors.hpp"
#include "logging/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <boost/filesystem.hpp>

static void applyConfigNode(ParamsConfig& cfg, const YAML::Node& config)
{
    if (!config || config.IsNull()) {
        return;
    }
    if (!config.IsMap()) {
        throw ConfigError("configuration root has to be a map");
    }
    try {
        if (config["mmioPolicy"]) {
            cfg.mmioPolicy_ = ParamsConfig::parseMmioPolicy(config["mmioPolicy"].as<std::string>());
        }
        if (config["msrCore"]) {
            cfg.msrCore_ = config["msrCore"].as<int>();
        }
        if (config["powercapDir"]) {
            cfg.powercapDir_ = config["powercapDir"].as<std::string>();
        }
        if (config["telemetry"]) {
            cfg.telemetry_ = config["telemetry"].as<int>();
        }
        if (config["logLevel"]) {
            cfg.logLevel_ = config["logLevel"].as<int>();
        }
    }
    catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }
    if (cfg.msrCore_ < 0) {
        throw ConfigError("msrCore has to be a non-negative core index");
    }
    if (cfg.logLevel_ < 0 || cfg.logLevel_ > 6) {
        throw ConfigError("logLevel has to be in range 0-6");
    }
}

ParamsConfig::ParamsConfig(const std::string& configFileName) :
    configFileName_(configFileName)
{
    loadConfig();
}

MmioPolicy ParamsConfig::parseMmioPolicy(const std::string& name)
{
    if (name == "disable") {
        return MmioPolicy::DISABLE;
    }
    if (name == "mirror") {
        return MmioPolicy::MIRROR;
    }
    throw ConfigError("unknown mmioPolicy '" + name + "', expected 'disable' or 'mirror'");
}

void ParamsConfig::printConfigExplained(std::ostream& os)
{
    os << "\tMMIO power limit register policy '" << mmioPolicy_ << "': it will be "
       << (mmioPolicy_ == MmioPolicy::DISABLE ? "cleared (PL1/PL2 disabled)"
                                              : "set to the same PL1/PL2 values as the MSR")
       << " and locked.\n";
    os << "\tMSR_PKG_POWER_LIMIT accessed through core " << msrCore_ << ".\n";
    os << "\tPower limits written to " << powercapDir_ << ".\n";
    os << "\tPower limit telemetry from turbostat "
       << (telemetry_ ? "ENABLED" : "DISABLED") << ".\n";
}

void ParamsConfig::loadFromString(const std::string& yamlText)
{
    try {
        applyConfigNode(*this, YAML::Load(yamlText));
    }
    catch (const YAML::ParserException& e) {
        throw ConfigError(std::string("cannot parse configuration: ") + e.what());
    }
}

void ParamsConfig::loadConfig()
{
    if (!boost::filesystem::exists(configFileName_)) {
        LOG_DEBUG("No {} found, using default configuration", configFileName_);
        return;
    }
    try {
        applyConfigNode(*this, YAML::LoadFile(configFileName_));
    }
    catch (const YAML::ParserException& e) {
        throw ConfigError("cannot parse " + configFileName_ + ": " + e.what());
    }
    catch (const YAML::BadFile& e) {
        throw ConfigError("cannot open " + configFileName_ + ": " + e.what());
    }
}
