// test-utils.cpp
#include "fortune/test-utils/test-utils.h"

#include <boost/filesystem.hpp>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = boost::filesystem;

std::string
make_corpus_text(const std::vector<std::string>& entries, char delimiter)
{
    std::string out;
    for (const auto& entry : entries)
    {
        out += entry;
        if (entry.empty() || entry.back() != '\n')
            out += '\n';
        out += delimiter;
        out += '\n';
    }
    return out;
}

std::string
make_numbered_corpus(const std::string& prefix, size_t count)
{
    std::vector<std::string> entries;
    entries.reserve(count);
    for (size_t i = 0; i < count; ++i)
        entries.push_back(prefix + " " + std::to_string(i));
    return make_corpus_text(entries);
}

TempCorpusDir::TempCorpusDir()
    : root_(fs::temp_directory_path() / fs::unique_path("fortune-test-%%%%-%%%%"))
{
    fs::create_directories(root_);
}

TempCorpusDir::~TempCorpusDir()
{
    boost::system::error_code ec;
    fs::remove_all(root_, ec);
}

fs::path
TempCorpusDir::write_file(
    const std::string& relative,
    const std::string& contents) const
{
    fs::path target = root_ / relative;
    fs::create_directories(target.parent_path());
    std::ofstream out(target.string(), std::ios::binary | std::ios::trunc);
    if (!out)
    {
        throw std::runtime_error("Could not create file: " + target.string());
    }
    out << contents;
    return target;
}

fs::path
TempCorpusDir::write_corpus(
    const std::string& relative,
    const std::vector<std::string>& entries) const
{
    return write_file(relative, make_corpus_text(entries));
}

fs::path
TempCorpusDir::make_dir(const std::string& relative) const
{
    fs::path target = root_ / relative;
    fs::create_directories(target);
    return target;
}

fortune::catalogue::DiscoveryConfig
isolated_config(const fs::path& search_dir)
{
    fortune::catalogue::DiscoveryConfig config;
    config.search_path = {search_dir};
    return config;
}

fortune::catalogue::Catalogue
load_catalogue(
    const std::vector<std::string>& tokens,
    const fortune::catalogue::DiscoveryConfig& config,
    fortune::catalogue::WeightMode mode,
    const fortune::catalogue::LengthLimit& limit)
{
    return fortune::catalogue::normalize_weights(
        fortune::catalogue::discover(tokens, config), mode, limit);
}
