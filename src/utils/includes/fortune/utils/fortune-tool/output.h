#pragma once

#include "fortune/selector/selection-request.h"
#include <boost/filesystem.hpp>
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace fortune::utils::fortune_tool {

// Shortest pause for -w, in seconds
static constexpr size_t MIN_WAIT_SECONDS = 6;

// Reading speed assumed by -w
static constexpr size_t CHARS_PER_SECOND = 20;

/**
 * Canonical form of path when it exists, otherwise path made absolute
 * against the working directory
 */
boost::filesystem::path
absolute_display_path(const boost::filesystem::path& path);

/**
 * Write the source listing
 *
 * Ungrouped sources print as "NN.NN% <absolute path>". Consecutive sources
 * discovered through the same directory print under a "NN.NN% <directory>"
 * line, each indented with its share of that group.
 */
void
print_probabilities(
    const std::vector<selector::SourceProbability>& sources,
    std::ostream& out);

// Write text, adding a final newline if it lacks one
void
print_record(const std::string& text, std::ostream& out);

/**
 * Seconds to pause after printing text: one per CHARS_PER_SECOND characters
 * (rounded up), never less than MIN_WAIT_SECONDS. UTF-8 continuation bytes
 * do not count as characters.
 */
size_t
wait_seconds_for_text(const std::string& text);

}  // namespace fortune::utils::fortune_tool
