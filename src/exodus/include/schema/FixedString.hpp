#pragma once
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file FixedString.hpp
 * @brief Zero-padded fixed-width text slot as stored in Exodus name / line arrays.
 *
 * @details
 * A slot of `width` bytes holds at most `width - 1` characters, left-aligned and followed by NUL
 * padding (`len_name` = 33 holds a 32-character name). Encoding rejects longer text with a
 * :cpp:class:`ValidationError`; nothing is ever truncated.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto slot = FixedString::encode("stress", schema::kLenName);
 *   c.write_slab<char>("name_glo_var", {0, 0}, {1, slot.width()}, slot.bytes());
 *   std::string back = FixedString::decode(row);   // "stress"
 * @endrst
 */

namespace exodus::schema
{

class FixedString
{
  public:
    explicit FixedString(std::size_t width);

    static FixedString encode(std::string_view text, std::size_t width);
    static std::string decode(std::span<const char> slot);

    std::size_t width() const noexcept { return buf_.size(); }
    std::size_t capacity() const noexcept { return buf_.empty() ? 0 : buf_.size() - 1; }
    std::span<const char> bytes() const noexcept { return buf_; }
    std::string str() const { return decode(buf_); }

  private:
    std::vector<char> buf_;
};

// Splits a (rows x width) char array into decoded strings, one per row.
std::vector<std::string> decode_rows(std::span<const char> flat, std::size_t width);

} // namespace exodus::schema
