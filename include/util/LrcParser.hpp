#pragma once

#include "model/Catalog.hpp"
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lorchestre::util {

class LrcParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Synchronized lyrics in the LRC format.
 *
 *   [00:12.34]first line
 *   [01:02.5][01:40.00]repeated chorus
 *
 * Minutes and seconds are required, the fraction may have one to three
 * digits and may be introduced by '.' or ':'. A line carrying several
 * timestamps yields one LyricLine per timestamp. The result is ordered by
 * start time; lines with equal timestamps keep their file order.
 */
class LrcParser {
public:
    // Throws LrcParseError on a malformed timestamp
    [[nodiscard]] static std::vector<model::LyricLine> parse(std::string_view text);

    // Keeps only lines beginning with '[' followed by a digit (drops
    // [ar:], [ti:], [offset:] and friends, blank lines and plain text)
    [[nodiscard]] static std::string strip_untimed_lines(std::string_view text);

private:
    // Parses the inside of one bracket pair, e.g. "01:02.50"
    static int64_t parse_timestamp(std::string_view stamp);
};

}  // namespace lorchestre::util
