#include "probe/cpu_info_parser.hpp"

#include <regex>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/models.hpp"
#include "common/string_utils.hpp"

namespace hostprobe {

namespace {

std::string parseWindowsCpu(const std::string &rawOutput)
{
    static const std::string header = "Name";
    if (rawOutput.rfind(header, 0) != 0) {
        // WMIC localizes or reformats its header on some hosts; keep the text.
        HLOG_WARN(QStringLiteral("CpuInfoParser"),
                  QStringLiteral("parseWindowsCpu"),
                  QStringLiteral("cpu_name_header_missing"),
                  (nlohmann::json{{"output", rawOutput}}));
        return trim(rawOutput);
    }
    return trim(rawOutput.substr(header.size()));
}

std::string parseLinuxCpu(const std::string &rawOutput)
{
    static const std::regex pattern(R"(model name.*:([\w \(\)\-@\.]*))",
                                    std::regex::ECMAScript | std::regex::icase);

    std::smatch match;
    if (!std::regex_search(rawOutput, match, pattern)) {
        return kUnrecognizedProcessor;
    }
    return trim(match[1].str());
}

} // namespace

std::string parseCpuModel(OsFamily family, const std::string &rawOutput)
{
    if (rawOutput == kNotAvailable) {
        return kNotAvailable;
    }

    switch (family) {
    case OsFamily::Windows:
        return parseWindowsCpu(rawOutput);
    case OsFamily::MacOS:
    case OsFamily::FreeBSD:
        return trim(rawOutput);
    case OsFamily::Linux:
        return parseLinuxCpu(rawOutput);
    }
    return parseLinuxCpu(rawOutput);
}

} // namespace hostprobe
