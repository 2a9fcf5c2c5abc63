#include "fortune/catalogue/source-entry.h"
#include "fortune/common/utils.h"
#include "fortune/strfile/strfile-codec.h"

#include <string>
#include <string_view>

namespace fortune::catalogue {

strfile::EntrySpan
SourceEntry::entry_span(uint32_t i) const
{
    return strfile::entry_span(text.view(), index, i);
}

std::string_view
SourceEntry::entry_bytes(uint32_t i) const
{
    strfile::EntrySpan span = entry_span(i);
    return text.view().substr(span.start, span.size());
}

std::string
SourceEntry::entry_text(uint32_t i) const
{
    std::string_view bytes = entry_bytes(i);
    if (index.header.is_rotated())
        return common::rot13(bytes);
    return std::string(bytes);
}

}  // namespace fortune::catalogue
