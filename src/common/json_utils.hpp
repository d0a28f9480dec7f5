#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace hostprobe {

inline std::string toOsFamilyString(OsFamily family)
{
    switch (family) {
    case OsFamily::MacOS:
        return "macOS";
    case OsFamily::Windows:
        return "Windows";
    case OsFamily::FreeBSD:
        return "FreeBSD";
    case OsFamily::Linux:
        return "Linux";
    }
    return "Linux";
}

inline OsFamily parseOsFamilyString(const std::string &value)
{
    if (value == "macOS") {
        return OsFamily::MacOS;
    }
    if (value == "Windows") {
        return OsFamily::Windows;
    }
    if (value == "FreeBSD") {
        return OsFamily::FreeBSD;
    }
    return OsFamily::Linux;
}

inline void to_json(nlohmann::json &j, const OsFamily &family)
{
    j = toOsFamilyString(family);
}

inline void from_json(const nlohmann::json &j, OsFamily &family)
{
    if (j.is_string()) {
        family = parseOsFamilyString(j.get<std::string>());
    } else {
        family = OsFamily::Linux;
    }
}

inline void to_json(nlohmann::json &j, const SystemSnapshot &snapshot)
{
    j = nlohmann::json{
        {"runtimeVersion", snapshot.runtimeVersion},
        {"platformVersion", snapshot.platformVersion},
        {"coreCount", snapshot.coreCount},
        {"osFamily", snapshot.osFamily},
        {"cpuModel", snapshot.cpuModel},
        {"availableMemory", snapshot.availableMemory}
    };
}

inline void from_json(const nlohmann::json &j, SystemSnapshot &snapshot)
{
    snapshot.runtimeVersion = j.value("runtimeVersion", std::string(kNotAvailable));
    snapshot.platformVersion = j.value("platformVersion", std::string(kNotAvailable));
    if (j.contains("coreCount") && j.at("coreCount").is_number_integer()) {
        snapshot.coreCount = j.at("coreCount").get<int>();
    } else {
        snapshot.coreCount = 1;
    }
    if (j.contains("osFamily")) {
        snapshot.osFamily = j.at("osFamily").get<OsFamily>();
    } else {
        snapshot.osFamily = OsFamily::Linux;
    }
    snapshot.cpuModel = j.value("cpuModel", std::string(kNotAvailable));
    snapshot.availableMemory = j.value("availableMemory", std::string(kNotAvailable));
}

} // namespace hostprobe
