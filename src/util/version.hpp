#ifndef _HC_UTIL_VERSION_
#define _HC_UTIL_VERSION_

#include "../pchheader.hpp"

namespace version
{
    // hotcon version. Written to new configs.
    constexpr const char *HC_VERSION = "0.1.0";

    // Minimum compatible config version (this will be used to validate configs).
    constexpr const char *MIN_CONFIG_VERSION = "0.1.0";

    int version_compare(const std::string &x, const std::string &y);

}

#endif
