#include "fortune/catalogue/catalogue.h"
#include "fortune/core/logger.h"
#include "fortune/strfile/strfile-codec.h"

#include <boost/filesystem.hpp>
#include <ctime>
#include <optional>
#include <string>
#include <utility>

namespace fs = boost::filesystem;

namespace fortune::catalogue {

namespace {

bool
index_older_than_text(const fs::path& dat_path, const fs::path& text_path)
{
    boost::system::error_code ec;
    std::time_t dat_time = fs::last_write_time(dat_path, ec);
    if (ec)
        return true;
    std::time_t text_time = fs::last_write_time(text_path, ec);
    if (ec)
        return true;
    return dat_time < text_time;
}

}  // namespace

SourceEntry
ensure_index(SourceEntry entry, const IndexPolicy& policy)
{
    if (!entry.text.is_open())
        entry.text = CorpusText::open(entry.path);
    if (entry.dat_path.empty())
        entry.dat_path = strfile::dat_path_for(entry.path);

    // Header of an unusable index, kept to preserve its delimiter and flags
    std::optional<strfile::IndexHeader> stale_header;

    boost::system::error_code ec;
    bool dat_exists = fs::exists(entry.dat_path, ec);

    if (policy.rebuild)
    {
        LOGI("Rebuilding index for ", entry.path.string(), " on request");
    }
    else if (!dat_exists)
    {
        LOGI("No index for ", entry.path.string(), ", building one");
    }
    else
    {
        try
        {
            strfile::StrfileIndex index =
                strfile::read_index_file(entry.dat_path);
            stale_header = index.header;

            if (index_older_than_text(entry.dat_path, entry.path))
            {
                LOGI(
                    "Index ",
                    entry.dat_path.string(),
                    " is older than its text, rebuilding");
            }
            else
            {
                strfile::validate_against_text(index, entry.text.size());
                entry.index = std::move(index);
                LOGD(
                    "Loaded index ",
                    entry.dat_path.string(),
                    " (",
                    entry.index.header.num_strings,
                    " strings)");
                return entry;
            }
        }
        catch (const strfile::StrfileError& e)
        {
            LOGI("Discarding index ", entry.dat_path.string(), ": ", e.what());
        }
    }

    strfile::BuildOptions options;
    if (stale_header)
    {
        options.delimiter = stale_header->delim_char;
        options.rotated = stale_header->is_rotated();
    }
    entry.index = strfile::build_index(entry.text.view(), options);

    if (policy.write_back)
    {
        try
        {
            strfile::write_index_file(entry.dat_path, entry.index);
            LOGI("Wrote index ", entry.dat_path.string());
        }
        catch (const strfile::StrfileError& e)
        {
            LOGW(
                "Could not write index for ",
                entry.path.string(),
                ", using in-memory index: ",
                e.what());
        }
    }
    return entry;
}

}  // namespace fortune::catalogue
