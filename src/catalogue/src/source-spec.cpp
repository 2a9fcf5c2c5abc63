#include "fortune/catalogue/source-spec.h"
#include "fortune/core/logger.h"

#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fortune::catalogue {

std::optional<PercentPrefix>
parse_percent_prefix(const std::string& token)
{
    size_t idx = 0;
    while (idx < token.size() &&
           (std::isdigit(static_cast<unsigned char>(token[idx])) ||
            token[idx] == '.'))
    {
        idx++;
    }

    if (idx == 0 || idx == token.size())
        return std::nullopt;

    if (std::isspace(static_cast<unsigned char>(token[idx])))
    {
        throw InvalidWeightError(
            "Weight '" + token.substr(0, idx) +
            "' must be followed by '%' in '" + token + "'");
    }
    if (token[idx] != '%')
        return std::nullopt;

    std::string number = token.substr(0, idx);
    double percent = 0.0;
    size_t consumed = 0;
    try
    {
        percent = std::stod(number, &consumed);
    }
    catch (const std::exception&)
    {
        consumed = 0;
    }
    if (consumed != number.size())
    {
        throw InvalidWeightError("Invalid percentage '" + number + "%'");
    }
    if (percent < 0.0 || percent > 100.0)
    {
        throw InvalidWeightError(
            "Percentage out of range 0-100: '" + number + "%'");
    }

    size_t rest_start = idx + 1;
    while (rest_start < token.size() &&
           std::isspace(static_cast<unsigned char>(token[rest_start])))
    {
        rest_start++;
    }
    return PercentPrefix{percent / 100.0, token.substr(rest_start)};
}

std::vector<SourceSpec>
parse_source_specs(const std::vector<std::string>& tokens)
{
    std::vector<SourceSpec> specs;
    for (size_t i = 0; i < tokens.size(); ++i)
    {
        const std::string& token = tokens[i];
        auto prefix = parse_percent_prefix(token);
        if (!prefix)
        {
            specs.push_back({token, std::nullopt});
            continue;
        }

        if (prefix->rest.empty())
        {
            if (i + 1 >= tokens.size())
            {
                throw InvalidWeightError(
                    "Percentage '" + token + "' is not followed by a path");
            }
            specs.push_back({tokens[++i], prefix->fraction});
        }
        else
        {
            specs.push_back({prefix->rest, prefix->fraction});
        }
    }

    LOGD("Parsed ", specs.size(), " source spec(s)");
    return specs;
}

}  // namespace fortune::catalogue
