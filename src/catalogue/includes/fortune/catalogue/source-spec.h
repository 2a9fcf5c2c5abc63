#pragma once

#include "fortune/catalogue/catalogue-errors.h"
#include <optional>
#include <string>
#include <vector>

namespace fortune::catalogue {

/**
 * One path token from the command line with its optional weight
 */
struct SourceSpec
{
    std::string path;

    /** Explicit weight as a fraction in [0, 1] ("25%" -> 0.25) */
    std::optional<double> weight;

    bool
    operator==(const SourceSpec&) const = default;
};

struct PercentPrefix
{
    double fraction = 0.0;

    /** Remainder of the token after '%' with leading blanks removed */
    std::string rest;
};

/**
 * Split a leading "N%" off a token
 *
 * A token that does not start with a number, or is a bare number, is a plain
 * path and yields nullopt.
 *
 * @throws InvalidWeightError if the number is malformed, out of [0, 100], or
 * followed by whitespace instead of '%'
 */
std::optional<PercentPrefix>
parse_percent_prefix(const std::string& token);

/**
 * Parse path tokens, accepting "N%path", "N% path" and "N%" "path"
 *
 * @throws InvalidWeightError for a bad prefix or a trailing "N%" with no
 * path after it
 */
std::vector<SourceSpec>
parse_source_specs(const std::vector<std::string>& tokens);

}  // namespace fortune::catalogue
