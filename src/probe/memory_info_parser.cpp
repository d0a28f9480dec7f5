#include "probe/memory_info_parser.hpp"

#include <cctype>
#include <exception>
#include <limits>
#include <regex>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "common/string_utils.hpp"
#include "probe/memory_formatter.hpp"

namespace hostprobe {

namespace {

std::optional<std::uint64_t> toUnsigned(const std::string &digits)
{
    if (digits.empty()) {
        return std::nullopt;
    }

    try {
        return static_cast<std::uint64_t>(std::stoull(digits));
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

std::optional<std::uint64_t> parseFirstNumber(const std::string &rawOutput)
{
    static const std::regex digits(R"(\d+)");

    std::smatch match;
    if (!std::regex_search(rawOutput, match, digits)) {
        return std::nullopt;
    }
    return toUnsigned(match[0].str());
}

std::optional<std::uint64_t> parseLeadingNumber(const std::string &rawOutput)
{
    const std::string value = trim(rawOutput);
    size_t end = 0;
    while (end < value.size()
           && std::isdigit(static_cast<unsigned char>(value[end]))) {
        ++end;
    }
    return toUnsigned(value.substr(0, end));
}

std::optional<std::uint64_t> parseMemTotal(const std::string &rawOutput)
{
    static const std::regex pattern(R"(MemTotal:\s*(\d+)\s*kB)");

    std::smatch match;
    if (!std::regex_search(rawOutput, match, pattern)) {
        return std::nullopt;
    }

    const auto kilobytes = toUnsigned(match[1].str());
    if (!kilobytes.has_value()
        || *kilobytes > std::numeric_limits<std::uint64_t>::max() / 1024) {
        return std::nullopt;
    }
    return *kilobytes * 1024;
}

} // namespace

std::optional<std::uint64_t> parseMemoryBytes(OsFamily family,
                                              const std::string &rawOutput)
{
    if (rawOutput == kNotAvailable) {
        return std::nullopt;
    }

    switch (family) {
    case OsFamily::Windows:
        return parseFirstNumber(rawOutput);
    case OsFamily::MacOS:
    case OsFamily::FreeBSD:
        return parseLeadingNumber(rawOutput);
    case OsFamily::Linux:
        return parseMemTotal(rawOutput);
    }
    return parseMemTotal(rawOutput);
}

std::string parseAvailableMemory(OsFamily family, const std::string &rawOutput)
{
    if (rawOutput == kNotAvailable) {
        return kNotAvailable;
    }

    const auto bytes = parseMemoryBytes(family, rawOutput);
    if (!bytes.has_value()) {
        HLOG_WARN(QStringLiteral("MemoryInfoParser"),
                  QStringLiteral("parseAvailableMemory"),
                  QStringLiteral("memory_output_unrecognized"),
                  (nlohmann::json{{"osFamily", family},
                                  {"output", rawOutput}}));
        return kNotAvailable;
    }

    return formatMemory(*bytes);
}

} // namespace hostprobe
