#include "fortune/catalogue/corpus-text.h"
#include "fortune/catalogue/catalogue-errors.h"
#include "fortune/core/logger.h"

#include <boost/filesystem.hpp>
#include <exception>
#include <ios>
#include <string>
#include <string_view>

namespace fs = boost::filesystem;

namespace fortune::catalogue {

CorpusText
CorpusText::open(const fs::path& path)
{
    CorpusText text;
    try
    {
        if (!fs::is_regular_file(path))
        {
            throw CatalogueError("Corpus file does not exist: " + path.string());
        }

        boost::uintmax_t file_size = fs::file_size(path);
        if (file_size > 0)
        {
            text.mapping_.open(path.string());
            if (!text.mapping_.is_open())
            {
                throw CatalogueError(
                    "Failed to memory map corpus: " + path.string());
            }
        }
        text.size_ = static_cast<size_t>(file_size);
        text.opened_ = true;
    }
    catch (const fs::filesystem_error& e)
    {
        throw CatalogueError(
            "Filesystem error on " + path.string() + ": " + e.what());
    }
    catch (const std::ios_base::failure& e)
    {
        throw CatalogueError(
            "I/O error mapping " + path.string() + ": " + e.what());
    }

    LOGD("Mapped corpus ", path.string(), " (", text.size_, " bytes)");
    return text;
}

std::string_view
CorpusText::view() const
{
    if (size_ == 0)
        return {};
    return {mapping_.data(), size_};
}

}  // namespace fortune::catalogue
