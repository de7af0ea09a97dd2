#include "TextUtil.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <sstream>

namespace devwatch::common
{
    std::string Trim(const std::string &s)
    {
        auto notSpace = [](unsigned char c)
        { return !std::isspace(c); };

        auto begin = std::find_if(s.begin(), s.end(), notSpace);
        auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
        if (begin >= end)
            return "";
        return std::string(begin, end);
    }

    std::string ToLower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::vector<std::string> SplitLines(const std::string &text)
    {
        std::vector<std::string> lines;
        std::stringstream ss(text);
        std::string line;
        while (std::getline(ss, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            lines.push_back(line);
        }
        return lines;
    }

    std::vector<std::string> SplitWhitespace(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::stringstream ss(line);
        std::string token;
        while (ss >> token)
            tokens.push_back(token);
        return tokens;
    }

    bool EndsWithIgnoreCase(const std::string &s, const std::string &suffix)
    {
        if (suffix.size() > s.size())
            return false;
        return ToLower(s.substr(s.size() - suffix.size())) == ToLower(suffix);
    }

    bool IsIpv4Literal(const std::string &s)
    {
        struct in_addr addr;
        return inet_pton(AF_INET, s.c_str(), &addr) == 1;
    }
}
