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
#include "msr_offsets.hpp"

#include <cstdint>

/*
  Register images are always handled as one 64-bit value, also when the
  hardware stores them as two 32-bit words. Bit positions are 0..63.
*/
static constexpr uint32_t MAX_WORD = ~((uint32_t) 0);

constexpr uint64_t fieldMask(unsigned bit)
{
    return uint64_t(1) << bit;
}

constexpr bool isFieldEnabled(uint64_t value, unsigned bit)
{
    return (value & fieldMask(bit)) != 0;
}

constexpr uint64_t withField(uint64_t value, unsigned bit, bool enabled)
{
    return enabled ? (value | fieldMask(bit)) : (value & ~fieldMask(bit));
}

constexpr uint64_t composeWords(uint32_t low, uint32_t high)
{
    return (uint64_t(high) << 32) | low;
}

constexpr uint32_t lowWord(uint64_t value)
{
    return uint32_t(value & MAX_WORD);
}

constexpr uint32_t highWord(uint64_t value)
{
    return uint32_t((value >> 32) & MAX_WORD);
}

constexpr LockState lockStateOf(uint64_t mmioImage)
{
    return isFieldEnabled(mmioImage, MMIO_LOCK_BIT) ? LockState::LOCKED : LockState::UNLOCKED;
}
