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

#include <stdexcept>
#include <string>

/*
  Every error below is fatal for the run. Conditions that still allow the run
  to finish (e.g. a locked MMIO register) are reported as MmioOutcome values.
*/
class PowerLimitError : public std::runtime_error
{
public:
    explicit PowerLimitError(const std::string& what) : std::runtime_error(what) {}
};

class UsageError : public PowerLimitError
{
public:
    using PowerLimitError::PowerLimitError;
};

class PrivilegeError : public PowerLimitError
{
public:
    using PowerLimitError::PowerLimitError;
};

class DependencyMissing : public PowerLimitError
{
public:
    using PowerLimitError::PowerLimitError;
};

class ConfigError : public PowerLimitError
{
public:
    using PowerLimitError::PowerLimitError;
};

// Any failed read or write of a register, physical memory word, PCI config
// field or powercap file.
class AccessError : public PowerLimitError
{
public:
    using PowerLimitError::PowerLimitError;
};

class BaseRegisterDisabled : public PowerLimitError
{
public:
    using PowerLimitError::PowerLimitError;
};
