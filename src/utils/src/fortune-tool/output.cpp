#include "fortune/utils/fortune-tool/output.h"
#include "fortune/common/utils.h"

#include <algorithm>
#include <boost/filesystem.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace fs = boost::filesystem;

namespace fortune::utils::fortune_tool {

fs::path
absolute_display_path(const fs::path& path)
{
    boost::system::error_code ec;
    fs::path canonical = fs::canonical(path, ec);
    if (!ec)
        return canonical;
    return fs::absolute(path);
}

void
print_probabilities(
    const std::vector<selector::SourceProbability>& sources,
    std::ostream& out)
{
    size_t i = 0;
    while (i < sources.size())
    {
        const auto& source = sources[i];
        if (!source.group)
        {
            out << common::format_percentage(source.percentage) << " "
                << absolute_display_path(source.path).string() << "\n";
            i++;
            continue;
        }

        size_t group_end = i;
        double group_total = 0.0;
        while (group_end < sources.size() &&
               sources[group_end].group == source.group)
        {
            group_total += sources[group_end].percentage;
            group_end++;
        }

        out << common::format_percentage(group_total) << " "
            << absolute_display_path(*source.group).string() << "\n";
        for (; i < group_end; ++i)
        {
            double relative = group_total > 0.0
                ? sources[i].percentage / group_total * 100.0
                : 0.0;
            out << "    " << common::format_percentage(relative) << " "
                << sources[i].path.filename().string() << "\n";
        }
    }
    out.flush();
}

void
print_record(const std::string& text, std::ostream& out)
{
    out << text;
    if (text.empty() || text.back() != '\n')
        out << "\n";
}

size_t
wait_seconds_for_text(const std::string& text)
{
    size_t chars = std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    });
    size_t seconds = (chars + CHARS_PER_SECOND - 1) / CHARS_PER_SECOND;
    return std::max(seconds, MIN_WAIT_SECONDS);
}

}  // namespace fortune::utils::fortune_tool
