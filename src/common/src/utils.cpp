#include "fortune/common/utils.h"

#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace fortune::common {

std::string
rot13(std::string_view text)
{
    std::string out(text);
    for (char& c : out)
    {
        if (c >= 'a' && c <= 'z')
            c = static_cast<char>('a' + (c - 'a' + 13) % 26);
        else if (c >= 'A' && c <= 'Z')
            c = static_cast<char>('A' + (c - 'A' + 13) % 26);
    }
    return out;
}

std::string
format_percentage(double percent)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << percent << "%";
    return oss.str();
}

}  // namespace fortune::common
