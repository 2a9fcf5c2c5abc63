#pragma once

#include "fortune/catalogue/catalogue-errors.h"
#include "fortune/catalogue/source-entry.h"
#include "fortune/catalogue/source-spec.h"
#include <boost/filesystem.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#ifndef FORTUNE_DEFAULT_PATH
#define FORTUNE_DEFAULT_PATH                                         \
    "/usr/share/games/fortunes:/usr/share/fortune:"                  \
    "/usr/local/share/games/fortunes:/usr/local/share/fortune"
#endif

namespace fortune::catalogue {

// Name of the subdirectory that holds offensive corpora
static constexpr const char* OFFENSIVE_DIR = "off";

// Token that expands to every directory on the search path
static constexpr const char* ALL_SOURCES_TOKEN = "all";

enum class OffensiveMode {
    Exclude,  // default: skip offensive corpora
    Only,     // -o
    All       // -a
};

// Default boundary between short and long entries, in bytes
static constexpr size_t DEFAULT_LENGTH_THRESHOLD = 160;

enum class LengthFilter {
    All,
    LongOnly,  // length >= threshold
    ShortOnly  // length < threshold
};

/**
 * Entry length restriction of one invocation (-l / -s / -n)
 */
struct LengthLimit
{
    LengthFilter filter = LengthFilter::All;
    size_t threshold = DEFAULT_LENGTH_THRESHOLD;

    bool
    accepts(size_t length) const
    {
        switch (filter)
        {
            case LengthFilter::LongOnly:
                return length >= threshold;
            case LengthFilter::ShortOnly:
                return length < threshold;
            case LengthFilter::All:
                break;
        }
        return true;
    }
};

enum class WeightMode {
    Proportional,  // unweighted sources share by entry count
    Equal          // -e: unweighted sources share equally
};

/**
 * What to do with on-disk .dat sidecars
 */
struct IndexPolicy
{
    /** Regenerate every index even if the .dat looks fresh */
    bool rebuild = false;

    /** Write regenerated indexes back to disk */
    bool write_back = true;
};

/**
 * Inputs of the discovery pass
 */
struct DiscoveryConfig
{
    /** Directories probed when no source is given, and expanded by "all" */
    std::vector<boost::filesystem::path> search_path;

    /** Locale list in LANG syntax, e.g. "de_DE.UTF-8:en_US" */
    std::optional<std::string> lang;

    OffensiveMode offensive = OffensiveMode::Exclude;

    IndexPolicy index_policy;

    /**
     * Search path from FORTUNE_PATH (falling back to FORTUNE_DEFAULT_PATH),
     * locale from LANG
     */
    static DiscoveryConfig
    from_env();
};

/**
 * Ordered set of sources for one invocation
 */
class Catalogue
{
public:
    Catalogue() = default;

    explicit Catalogue(std::vector<SourceEntry> entries, bool normalized = false)
        : entries_(std::move(entries)), normalized_(normalized)
    {
    }

    const std::vector<SourceEntry>&
    entries() const
    {
        return entries_;
    }

    const SourceEntry&
    operator[](size_t i) const
    {
        return entries_[i];
    }

    size_t
    size() const
    {
        return entries_.size();
    }

    bool
    empty() const
    {
        return entries_.empty();
    }

    /** True once normalize_weights has assigned probabilities */
    bool
    normalized() const
    {
        return normalized_;
    }

private:
    std::vector<SourceEntry> entries_;
    bool normalized_ = false;
};

// Split a colon-separated search path, dropping empty components
std::vector<boost::filesystem::path>
split_search_path(const std::string& value);

/**
 * Locale subdirectories of base to probe, most specific first
 * ("de_DE.UTF-8" -> base/de_DE, base/de)
 */
std::vector<boost::filesystem::path>
locale_candidates(
    const boost::filesystem::path& base,
    const std::optional<std::string>& lang);

// "name-o" files and anything inside an "off" directory
bool
is_offensive_path(const boost::filesystem::path& path);

/**
 * Regular corpus files directly inside dir, sorted by name. Hidden files and
 * .dat/.u8/.tmp sidecars are skipped.
 *
 * @throws CatalogueError if the directory cannot be listed
 */
std::vector<boost::filesystem::path>
list_corpus_files(const boost::filesystem::path& dir);

/**
 * Resolve path tokens into an indexed catalogue
 *
 * With no tokens the search path is probed (see DiscoveryConfig). Weights are
 * recorded but not yet normalized.
 *
 * @throws InvalidWeightError for a malformed "N%" prefix
 * @throws NoSourcesFoundError if a named path does not exist or nothing
 * usable was found
 */
Catalogue
discover(const std::vector<std::string>& tokens, const DiscoveryConfig& config);

/**
 * Load the .dat for entry, regenerating it when missing, stale or
 * inconsistent with the text
 *
 * Write-back failures are logged and the in-memory index is kept.
 *
 * @throws CatalogueError if the corpus text cannot be read
 */
SourceEntry
ensure_index(SourceEntry entry, const IndexPolicy& policy = {});

// Number of entries of source whose stored length passes limit
uint32_t
count_within_length(const SourceEntry& source, const LengthLimit& limit);

/**
 * Assign each source its selection probability
 *
 * Sources with no entry passing limit are dropped. Explicit weights are kept;
 * the remaining mass goes to unweighted sources by the number of entries
 * passing limit (Proportional) or evenly (Equal). Probabilities sum to 1.
 *
 * @throws WeightOverflowError if explicit weights exceed 100%
 * @throws NoSourcesFoundError if no source is left or none carries any mass
 */
Catalogue
normalize_weights(
    const Catalogue& catalogue,
    WeightMode mode,
    const LengthLimit& limit = {});

}  // namespace fortune::catalogue
