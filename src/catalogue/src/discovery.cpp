#include "fortune/catalogue/catalogue.h"
#include "fortune/core/logger.h"

#include <algorithm>
#include <boost/filesystem.hpp>
#include <cstdlib>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = boost::filesystem;

namespace fortune::catalogue {

namespace {

// A corpus file picked by discovery, before its index is loaded
struct ResolvedSource
{
    fs::path path;
    std::optional<double> weight;
    std::optional<fs::path> group;
};

bool
ends_with(const std::string& value, const std::string& suffix)
{
    return value.size() >= suffix.size() &&
        value.compare(value.size() - suffix.size(), suffix.size(), suffix) ==
        0;
}

bool
wanted(const fs::path& path, OffensiveMode mode)
{
    bool offensive = is_offensive_path(path);
    switch (mode)
    {
        case OffensiveMode::Exclude:
            return !offensive;
        case OffensiveMode::Only:
            return offensive;
        case OffensiveMode::All:
            return true;
    }
    return true;
}

bool
directory_exists(const fs::path& path)
{
    boost::system::error_code ec;
    return fs::is_directory(path, ec);
}

bool
regular_file_exists(const fs::path& path)
{
    boost::system::error_code ec;
    return fs::is_regular_file(path, ec);
}

// Files of a directory (plus its "off" subdirectory when offensive corpora
// are requested) that pass the offensive filter
std::vector<fs::path>
collect_group(const fs::path& dir, OffensiveMode mode)
{
    std::vector<fs::path> files = list_corpus_files(dir);
    fs::path off_dir = dir / OFFENSIVE_DIR;
    if (mode != OffensiveMode::Exclude && directory_exists(off_dir))
    {
        auto off_files = list_corpus_files(off_dir);
        files.insert(files.end(), off_files.begin(), off_files.end());
    }

    std::erase_if(
        files, [mode](const fs::path& file) { return !wanted(file, mode); });
    return files;
}

// An explicit weight on a group is split evenly across its files
void
append_group(
    std::vector<ResolvedSource>& out,
    const std::vector<fs::path>& files,
    const fs::path& dir,
    std::optional<double> weight)
{
    std::optional<double> share;
    if (weight && !files.empty())
        share = *weight / static_cast<double>(files.size());
    for (const auto& file : files)
        out.push_back({file, share, dir});
}

// "name-o" <-> "name"
std::optional<fs::path>
offensive_alternate(const fs::path& path)
{
    std::string name = path.filename().string();
    if (name.empty())
        return std::nullopt;
    if (ends_with(name, "-o"))
        return path.parent_path() / name.substr(0, name.size() - 2);
    return path.parent_path() / (name + "-o");
}

void
resolve_spec(
    std::vector<ResolvedSource>& out,
    const SourceSpec& spec,
    const DiscoveryConfig& config)
{
    if (spec.path == ALL_SOURCES_TOKEN)
    {
        std::vector<ResolvedSource> all;
        std::set<fs::path> seen;
        for (const auto& dir : config.search_path)
        {
            if (!directory_exists(dir))
                continue;
            std::vector<fs::path> files;
            for (auto& file : collect_group(dir, config.offensive))
            {
                if (seen.insert(file).second)
                    files.push_back(file);
            }
            append_group(all, files, dir, std::nullopt);
        }
        if (spec.weight && !all.empty())
        {
            double share = *spec.weight / static_cast<double>(all.size());
            for (auto& source : all)
                source.weight = share;
        }
        LOGD("Expanded '", ALL_SOURCES_TOKEN, "' to ", all.size(), " file(s)");
        out.insert(out.end(), all.begin(), all.end());
        return;
    }

    fs::path path(spec.path);
    if (directory_exists(path))
    {
        std::vector<fs::path> files = list_corpus_files(path);
        std::erase_if(files, [&](const fs::path& file) {
            return !wanted(file, config.offensive);
        });
        LOGD("Directory ", path.string(), " holds ", files.size(), " file(s)");
        append_group(out, files, path, spec.weight);
        return;
    }

    if (!regular_file_exists(path))
    {
        auto alternate = offensive_alternate(path);
        if (alternate && regular_file_exists(*alternate))
        {
            LOGD(
                "Using offensive alternate ",
                alternate->string(),
                " for ",
                path.string());
            path = *alternate;
        }
        else
        {
            throw NoSourcesFoundError(
                spec.path + ": No such file or directory");
        }
    }

    if (!wanted(path, config.offensive))
    {
        LOGI("Skipping ", path.string(), " (offensive mode excludes it)");
        return;
    }
    out.push_back({path, spec.weight, std::nullopt});
}

std::vector<ResolvedSource>
resolve_default(const DiscoveryConfig& config)
{
    for (const auto& base : config.search_path)
    {
        std::vector<fs::path> candidates = locale_candidates(base, config.lang);
        candidates.push_back(base);

        for (const auto& candidate : candidates)
        {
            if (!directory_exists(candidate))
                continue;
            std::vector<fs::path> files =
                collect_group(candidate, config.offensive);
            if (files.empty())
            {
                LOGD("No usable corpora in ", candidate.string());
                continue;
            }
            LOGI("Using default fortune directory ", candidate.string());
            std::vector<ResolvedSource> out;
            append_group(out, files, candidate, std::nullopt);
            return out;
        }
    }

    std::ostringstream searched;
    for (size_t i = 0; i < config.search_path.size(); ++i)
        searched << (i ? ":" : "") << config.search_path[i].string();
    throw NoSourcesFoundError(
        "No fortunes found in search path '" + searched.str() + "'");
}

}  // namespace

DiscoveryConfig
DiscoveryConfig::from_env()
{
    DiscoveryConfig config;
    const char* path_env = std::getenv("FORTUNE_PATH");
    config.search_path =
        split_search_path(path_env ? path_env : FORTUNE_DEFAULT_PATH);
    if (const char* lang = std::getenv("LANG"))
        config.lang = std::string(lang);
    return config;
}

std::vector<fs::path>
split_search_path(const std::string& value)
{
    std::vector<fs::path> out;
    std::istringstream stream(value);
    std::string part;
    while (std::getline(stream, part, ':'))
    {
        if (!part.empty())
            out.emplace_back(part);
    }
    return out;
}

std::vector<fs::path>
locale_candidates(const fs::path& base, const std::optional<std::string>& lang)
{
    std::vector<fs::path> out;
    if (!lang)
        return out;

    auto add = [&](const std::string& name) {
        if (name.empty() || name == "C" || name == "POSIX")
            return;
        fs::path candidate = base / name;
        if (std::find(out.begin(), out.end(), candidate) == out.end())
            out.push_back(candidate);
    };

    std::istringstream stream(*lang);
    std::string entry;
    while (std::getline(stream, entry, ':'))
    {
        // Strip codeset and modifier: de_DE.UTF-8@euro -> de_DE
        std::string locale = entry.substr(0, entry.find_first_of(".@"));
        add(locale);
        size_t underscore = locale.find('_');
        if (underscore != std::string::npos)
            add(locale.substr(0, underscore));
    }
    return out;
}

bool
is_offensive_path(const fs::path& path)
{
    return ends_with(path.filename().string(), "-o") ||
        path.parent_path().filename() == OFFENSIVE_DIR;
}

std::vector<fs::path>
list_corpus_files(const fs::path& dir)
{
    std::vector<fs::path> files;
    try
    {
        for (const auto& item : fs::directory_iterator(dir))
        {
            const fs::path& path = item.path();
            std::string name = path.filename().string();
            if (name.empty() || name[0] == '.' || ends_with(name, ".dat") ||
                ends_with(name, ".u8") || ends_with(name, ".tmp"))
            {
                continue;
            }
            if (regular_file_exists(path))
                files.push_back(path);
        }
    }
    catch (const fs::filesystem_error& e)
    {
        throw CatalogueError(
            "Failed reading fortune directory " + dir.string() + ": " +
            e.what());
    }
    std::sort(files.begin(), files.end());
    return files;
}

Catalogue
discover(const std::vector<std::string>& tokens, const DiscoveryConfig& config)
{
    std::vector<SourceSpec> specs = parse_source_specs(tokens);

    std::vector<ResolvedSource> resolved;
    if (specs.empty())
    {
        resolved = resolve_default(config);
    }
    else
    {
        for (const auto& spec : specs)
            resolve_spec(resolved, spec, config);
    }

    if (resolved.empty())
    {
        throw NoSourcesFoundError("No fortunes found");
    }

    std::vector<SourceEntry> entries;
    entries.reserve(resolved.size());
    for (auto& source : resolved)
    {
        SourceEntry entry;
        entry.path = std::move(source.path);
        entry.explicit_weight = source.weight;
        entry.group = std::move(source.group);
        entry.is_offensive = is_offensive_path(entry.path);
        entries.push_back(ensure_index(std::move(entry), config.index_policy));
    }

    LOGI("Discovered ", entries.size(), " fortune source(s)");
    return Catalogue(std::move(entries));
}

}  // namespace fortune::catalogue
