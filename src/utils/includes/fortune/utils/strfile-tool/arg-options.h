#pragma once

#include "fortune/strfile/strfile-structs.h"
#include <optional>
#include <string>

namespace fortune::utils::strfile_tool {

/**
 * Type-safe structure for command line options
 */
struct CommandLineOptions
{
    /** Corpus text to index */
    std::optional<std::string> input_file;

    /** Where to write the index, "<input>.dat" when absent */
    std::optional<std::string> output_file;

    /** Byte that, alone on a line, separates entries */
    char delimiter = strfile::DEFAULT_DELIMITER;

    /** -r: shuffle the offset table */
    bool randomize = false;

    /** -x: mark the corpus as ROT13-encoded */
    bool rotated = false;

    /** -s: suppress the summary */
    bool silent = false;

    /** Keep empty entries between consecutive delimiter lines */
    bool allow_empty = false;

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

}  // namespace fortune::utils::strfile_tool
