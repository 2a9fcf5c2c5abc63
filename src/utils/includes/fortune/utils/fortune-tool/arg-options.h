#pragma once

#include "fortune/catalogue/catalogue.h"
#include "fortune/selector/selection-request.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#ifndef FORTUNE_TOOLS_VERSION
#define FORTUNE_TOOLS_VERSION "0.0.0"
#endif

namespace fortune::utils::fortune_tool {

/**
 * Type-safe structure for command line options
 */
struct CommandLineOptions
{
    /** Positional source tokens, each optionally prefixed with "N%" */
    std::vector<std::string> sources;

    /** -a: both regular and offensive corpora */
    bool all_fortunes = false;

    /** -o: offensive corpora only */
    bool offensive_only = false;

    /** -e: every unweighted source gets the same share */
    bool equal_probability = false;

    /** -f: print sources and probabilities instead of a quotation */
    bool list_files = false;

    bool long_only = false;
    bool short_only = false;

    /** -n: boundary between short and long entries */
    size_t length_threshold = selector::DEFAULT_LENGTH_THRESHOLD;

    /** -m: print every entry matching this pattern */
    std::optional<std::string> pattern;

    bool ignore_case = false;

    /** -c: show the source file before the quotation */
    bool show_source = false;

    /** -w: pause after printing, proportional to the quotation length */
    bool wait = false;

    bool show_version = false;

    /** Log verbosity level */
    std::string log_level = "error";

    /** Whether to display help information */
    bool show_help = false;

    /** Whether parsing completed successfully */
    bool valid = true;

    /** Any error message to display */
    std::optional<std::string> error_message;

    /** Pre-formatted help text */
    std::string help_text;
};

/**
 * Parse command line arguments into a structured options object
 *
 * @param argc Argument count from main
 * @param argv Argument values from main
 * @return A populated CommandLineOptions structure
 */
CommandLineOptions
parse_argv(int argc, char* argv[]);

catalogue::OffensiveMode
offensive_mode(const CommandLineOptions& options);

// Selection request described by the parsed flags
selector::SelectionRequest
to_selection_request(const CommandLineOptions& options);

}  // namespace fortune::utils::fortune_tool
