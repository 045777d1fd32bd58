#include "schema/FixedString.hpp"
#include "Errors.hpp"

#include <algorithm>

namespace exodus::schema
{

FixedString::FixedString(std::size_t width) : buf_(width, '\0')
{
    if (width == 0)
        throw ValidationError("[schema] fixed-width text slot needs a nonzero width");
}

FixedString FixedString::encode(std::string_view text, std::size_t width)
{
    FixedString out(width);
    if (text.size() > out.capacity())
        throw ValidationError("[schema] text '" + std::string(text) + "' is " +
                              std::to_string(text.size()) + " characters, slot holds at most " +
                              std::to_string(out.capacity()));
    std::copy(text.begin(), text.end(), out.buf_.begin());
    return out;
}

std::string FixedString::decode(std::span<const char> slot)
{
    auto end = std::find(slot.begin(), slot.end(), '\0');
    std::string s(slot.begin(), end);
    const auto last = s.find_last_not_of(" \t\r\n");
    s.erase(last == std::string::npos ? 0 : last + 1);
    return s;
}

std::vector<std::string> decode_rows(std::span<const char> flat, std::size_t width)
{
    std::vector<std::string> out;
    if (width == 0)
        return out;
    out.reserve(flat.size() / width);
    for (std::size_t off = 0; off + width <= flat.size(); off += width)
        out.push_back(FixedString::decode(flat.subspan(off, width)));
    return out;
}

} // namespace exodus::schema
