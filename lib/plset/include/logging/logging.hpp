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

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

static constexpr char LOGGER_CONSOLE[] = "setpl_console";

inline std::shared_ptr<spdlog::logger> getLogger()
{
  auto log = spdlog::get(LOGGER_CONSOLE);
  if (log == nullptr)
  {
    log = spdlog::stdout_color_mt(LOGGER_CONSOLE);
    spdlog::set_pattern("[%l] %v");
  }

  return log;
}

#define GET_LOGGER() ::getLogger()

#define LOG_TRACE(msg, ...) GET_LOGGER()->trace(msg, ##__VA_ARGS__);
#define LOG_DEBUG(msg, ...) GET_LOGGER()->debug(msg, ##__VA_ARGS__);
#define LOG_INFO(msg, ...) GET_LOGGER()->info(msg, ##__VA_ARGS__);
#define LOG_WARN(msg, ...) GET_LOGGER()->warn(msg, ##__VA_ARGS__);
#define LOG_ERROR(msg, ...) GET_LOGGER()->error(msg, ##__VA_ARGS__);
#define LOG_CRITICAL(msg, ...) GET_LOGGER()->critical(msg, ##__VA_ARGS__);

// SPDLOG_LEVEL from the environment, e.g. SPDLOG_LEVEL=debug
#define LOAD_ENV_LEVELS() spdlog::cfg::load_env_levels();

// 0 - trace ... 6 - off, matches the logLevel key of config.yaml
#define SET_LOG_LEVEL(loglevel)                       \
  switch (loglevel)                                   \
  {                                                   \
  case 0:                                             \
    GET_LOGGER()->set_level(spdlog::level::trace);    \
    break;                                            \
  case 1:                                             \
    GET_LOGGER()->set_level(spdlog::level::debug);    \
    break;                                            \
  case 2:                                             \
    GET_LOGGER()->set_level(spdlog::level::info);     \
    break;                                            \
  case 3:                                             \
    GET_LOGGER()->set_level(spdlog::level::warn);     \
    break;                                            \
  case 4:                                             \
    GET_LOGGER()->set_level(spdlog::level::err);      \
    break;                                            \
  case 5:                                             \
    GET_LOGGER()->set_level(spdlog::level::critical); \
    break;                                            \
  case 6:                                             \
    GET_LOGGER()->set_level(spdlog::level::off);      \
    break;                                            \
  default:                                            \
    LOG_WARN("No such log level: {}", loglevel);      \
    break;                                            \
  };

#define FLUSH_LOGGER() GET_LOGGER()->flush();
