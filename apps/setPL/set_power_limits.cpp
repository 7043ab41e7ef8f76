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

/*
  setPL - sets Intel package power limits PL1/PL2 and keeps the MMIO copy of
  the power limit register (PACKAGE_RAPL_LIMIT in MCHBAR) from enforcing
  lower ones.

  The processor applies the lower of the MSR and MMIO limits, and firmware may
  lower the MMIO ones dynamically. The MMIO register is therefore cleared (or
  mirrored from the MSR) and locked, which holds until the next power-on.

  Usage: setPL <PL1 watts> <PL2 watts>
*/

#include "params_config.hpp"
#include "environment_check.hpp"
#include "errors.hpp"
#include "power_limit_setter.hpp"
#include "power_interface/linux_register_accessor.hpp"
#include "power_interface/powercap.hpp"
#include "power_interface/telemetry.hpp"
#include "logging/logging.hpp"

#include <boost/program_options.hpp>
#include <iostream>
#include <memory>
#include <optional>

namespace po = boost::program_options;

struct CommandLine {
    PowerLimitRequest request;
    std::string configFile;
    std::optional<MmioPolicy> policyOverride;
    bool noTelemetry;
};

static void printUsage(const po::options_description& desc)
{
    std::cout << "Usage: setPL <PL1 watts> <PL2 watts> [options]\n"
              << "Example: setPL 25 25\n\n"
              << desc << "\n";
}

// returns std::nullopt when only help was requested
static std::optional<CommandLine> parseArgs(int argc, char* argv[])
{
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "print this message")
        ("config,c", po::value<std::string>()->default_value("config.yaml"), "YAML configuration file")
        ("mirror", "set the MMIO register to the MSR PL1/PL2 values instead of clearing it")
        ("disable", "clear the MMIO register (PL1/PL2 disabled), the default")
        ("no-telemetry", "do not report limits from turbostat");

    po::options_description hidden("Hidden");
    hidden.add_options()
        ("pl1", po::value<std::string>(), "PL1 in watts")
        ("pl2", po::value<std::string>(), "PL2 in watts");

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("pl1", 1).add("pl2", 1);

    po::variables_map map;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), map);
        po::notify(map);
    }
    catch (const po::error& e) {
        printUsage(desc);
        throw UsageError(e.what());
    }

    if (map.count("help")) {
        printUsage(desc);
        return std::nullopt;
    }
    if (!map.count("pl1") || !map.count("pl2")) {
        printUsage(desc);
        throw UsageError("both PL1 and PL2 have to be given");
    }
    if (map.count("mirror") && map.count("disable")) {
        throw UsageError("--mirror and --disable are mutually exclusive");
    }

    CommandLine cmd;
    cmd.request.pl1InWatts = PowerLimitSetter::parseWatts(map["pl1"].as<std::string>());
    cmd.request.pl2InWatts = PowerLimitSetter::parseWatts(map["pl2"].as<std::string>());
    cmd.configFile = map["config"].as<std::string>();
    if (map.count("mirror")) {
        cmd.policyOverride = MmioPolicy::MIRROR;
    } else if (map.count("disable")) {
        cmd.policyOverride = MmioPolicy::DISABLE;
    }
    cmd.noTelemetry = map.count("no-telemetry") > 0;
    return cmd;
}

static void reportSummary(const PowerLimitSummary& summary)
{
    LOG_INFO("PL1 = {} uW, PL2 = {} uW", summary.pl1InMicroWatts, summary.pl2InMicroWatts);
    LOG_INFO("MSR_PKG_POWER_LIMIT: {} ({:#018x})", toString(summary.msr.outcome), summary.msr.image);
    LOG_INFO("PACKAGE_RAPL_LIMIT at {:#x}: {}", summary.mmioRegisterAddress, toString(summary.mmio.outcome));
}

int main(int argc, char* argv[])
{
    try {
        auto cmd = parseArgs(argc, argv);
        if (!cmd.has_value()) {
            return 0;
        }

        ParamsConfig cfg(cmd->configFile);
        SET_LOG_LEVEL(cfg.logLevel_)
        LOAD_ENV_LEVELS()
        if (cmd->policyOverride.has_value()) {
            cfg.mmioPolicy_ = cmd->policyOverride.value();
        }
        if (cmd->noTelemetry) {
            cfg.telemetry_ = 0;
        }
        cfg.printConfigExplained();

        checkRootPrivileges();
        checkDependencies(cfg);

        LinuxRegisterAccessor accessor(cfg.msrCore_);
        SysfsPowerCap powerCap(cfg.powercapDir_);
        std::unique_ptr<PowerLimitTelemetry> telemetry;
        if (cfg.telemetry_) {
            telemetry = std::make_unique<TurbostatTelemetry>();
        }

        PowerLimitSetter setter(accessor, powerCap, telemetry.get(), cfg.mmioPolicy_);
        auto summary = setter.apply(cmd->request);
        reportSummary(summary);
    }
    catch (const UsageError& e) {
        LOG_ERROR("Usage error: {}", e.what());
        return 1;
    }
    catch (const PowerLimitError& e) {
        LOG_ERROR("{}", e.what());
        return 1;
    }
    catch (const std::exception& e) {
        LOG_CRITICAL("Unexpected error: {}", e.what());
        return 1;
    }
    FLUSH_LOGGER()
    return 0;
}
