#pragma once

#include <string>

namespace nestsh {

const bool PRE_RELEASE = false;
constexpr const char* c_version_base = "1.2.0";

inline std::string get_version() {
    static std::string cached_version =
        std::string(c_version_base) + (PRE_RELEASE ? " (pre-release)" : "");
    return cached_version;
}

}  // namespace nestsh

#ifndef NESTSH_GIT_HASH
#define NESTSH_GIT_HASH "unknown"
#endif
