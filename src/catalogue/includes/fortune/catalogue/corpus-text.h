#pragma once

#include <boost/filesystem.hpp>
#include <boost/iostreams/device/mapped_file.hpp>
#include <cstddef>
#include <string_view>

namespace fortune::catalogue {

/**
 * Read-only, memory-mapped view of a corpus text file
 *
 * Copies share the same mapping. An empty file is represented without a
 * mapping since zero-length files cannot be mapped.
 */
class CorpusText
{
public:
    CorpusText() = default;

    /**
     * Map the file at path
     *
     * @throws CatalogueError if the file does not exist or cannot be mapped
     */
    static CorpusText
    open(const boost::filesystem::path& path);

    std::string_view
    view() const;

    size_t
    size() const
    {
        return size_;
    }

    bool
    is_open() const
    {
        return opened_;
    }

private:
    boost::iostreams::mapped_file_source mapping_;
    size_t size_ = 0;
    bool opened_ = false;
};

}  // namespace fortune::catalogue
