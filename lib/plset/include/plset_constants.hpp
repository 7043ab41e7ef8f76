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
#include <iostream>

static constexpr uint64_t MICRO_W_PER_W {1000000};

enum class MmioPolicy {
    DISABLE,
    MIRROR
};

enum class LockState {
    UNLOCKED,
    LOCKED
};

enum class MsrOutcome {
    ALREADY_ENABLED,
    ENABLED
};

enum class MmioOutcome {
    WRITTEN,
    ALREADY_RECONCILED,
    LOCKED_WITH_LIMITS_ACTIVE,
    LOCKED_CANNOT_MIRROR
};

enum PowerCapConstraint {
    LONG_TERM  = 0, // PL1
    SHORT_TERM = 1  // PL2
};

inline const char* toString(MmioPolicy p) {
    switch (p) {
        case MmioPolicy::DISABLE :
            return "disable";
        case MmioPolicy::MIRROR :
            return "mirror";
        default :
            return "undefined policy";
    }
}

inline const char* toString(LockState s) {
    switch (s) {
        case LockState::UNLOCKED :
            return "unlocked";
        case LockState::LOCKED :
            return "locked";
        default :
            return "undefined lock state";
    }
}

inline const char* toString(MsrOutcome o) {
    switch (o) {
        case MsrOutcome::ALREADY_ENABLED :
            return "already-enabled";
        case MsrOutcome::ENABLED :
            return "enabled";
        default :
            return "undefined outcome";
    }
}

inline const char* toString(MmioOutcome o) {
    switch (o) {
        case MmioOutcome::WRITTEN :
            return "written";
        case MmioOutcome::ALREADY_RECONCILED :
            return "already-reconciled";
        case MmioOutcome::LOCKED_WITH_LIMITS_ACTIVE :
            return "locked-with-limits-active";
        case MmioOutcome::LOCKED_CANNOT_MIRROR :
            return "locked-but-cannot-mirror";
        default :
            return "undefined outcome";
    }
}

template <class Stream>
Stream& operator<<(Stream& os, const MmioPolicy& p) {
    os << toString(p);
    return os;
}
