#pragma once

#include <string>
#include <vector>

namespace devwatch::common
{
    std::string Trim(const std::string &s);
    std::string ToLower(std::string s);

    std::vector<std::string> SplitLines(const std::string &text);
    std::vector<std::string> SplitWhitespace(const std::string &line);

    bool EndsWithIgnoreCase(const std::string &s, const std::string &suffix);

    // True for a dotted-quad IPv4 literal.
    bool IsIpv4Literal(const std::string &s);
}
