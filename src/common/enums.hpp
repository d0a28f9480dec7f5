#pragma once

namespace hostprobe {

enum class OsFamily {
    MacOS,
    Windows,
    FreeBSD,
    Linux
};

} // namespace hostprobe
