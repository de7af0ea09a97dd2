#include "CommandParsers.hpp"
#include "../common/TextUtil.hpp"
#include <cctype>
#include <regex>
#include <vector>

namespace devwatch::engine::parsers
{
    namespace
    {
        const std::regex &HostnameLabel()
        {
            static const std::regex re(R"(Hostname\s*:\s*([A-Za-z0-9._\-]+))", std::regex::icase);
            return re;
        }

        const std::regex &BareToken()
        {
            static const std::regex re(R"(^[A-Za-z0-9._\-]+$)");
            return re;
        }

        const std::regex &HostnameDirective()
        {
            static const std::regex re(R"(^\s*hostname\s+([A-Za-z0-9._\-]+)\s*$)");
            return re;
        }

        const std::regex &ModelToken()
        {
            static const std::regex re(R"(^[A-Za-z0-9][A-Za-z0-9._\-+/]*$)");
            return re;
        }

        const std::regex &ProductFamily()
        {
            static const std::regex re(
                R"(\b(N[0-9]K-[A-Z0-9][A-Z0-9\-]*|C9[0-9]{3}[A-Z0-9\-]*|WS-C[0-9][A-Z0-9\-]*|ISR[0-9]{4}[A-Z0-9\-/]*|ASR[0-9]{3,4}[A-Z0-9\-]*)\b)");
            return re;
        }

        std::string FirstCapture(const std::string &output, const std::regex &re)
        {
            std::smatch m;
            if (std::regex_search(output, m, re))
                return m[1].str();
            return "";
        }

        bool IsSupervisorOrFabric(const std::string &line)
        {
            std::string lower = common::ToLower(line);
            return lower.find("supervisor") != std::string::npos ||
                   lower.find("fabric") != std::string::npos;
        }

        bool StartsWithDigit(const std::string &s)
        {
            return !s.empty() && std::isdigit(static_cast<unsigned char>(s.front()));
        }
    }

    std::string ShowHostname(const std::string &output)
    {
        std::vector<std::string> lines;
        for (const auto &raw : common::SplitLines(output))
        {
            std::string line = common::Trim(raw);
            if (!line.empty())
                lines.push_back(line);
        }

        for (const auto &line : lines)
        {
            std::smatch m;
            if (std::regex_search(line, m, HostnameLabel()))
                return m[1].str();
        }

        if (lines.size() == 1 && std::regex_match(lines.front(), BareToken()))
            return lines.front();

        return "";
    }

    std::string RunningConfigHostname(const std::string &output)
    {
        for (const auto &line : common::SplitLines(output))
        {
            std::smatch m;
            if (std::regex_match(line, m, HostnameDirective()))
                return m[1].str();
        }
        return "";
    }

    std::string ModelNumberField(const std::string &output)
    {
        static const std::regex re(R"(Model\s+Number\s*:\s*([A-Za-z0-9._\-+/]+))", std::regex::icase);
        return FirstCapture(output, re);
    }

    std::string ModelNumberIs(const std::string &output)
    {
        static const std::regex re(R"(Model\s+number\s+is\s+([A-Za-z0-9._\-+/]+))", std::regex::icase);
        return FirstCapture(output, re);
    }

    std::string ModuleTableModel(const std::string &output)
    {
        const auto lines = common::SplitLines(output);

        std::size_t i = 0;
        std::size_t column = std::string::npos;
        for (; i < lines.size(); ++i)
        {
            std::string trimmed = common::Trim(lines[i]);
            if (trimmed.rfind("Mod", 0) == 0)
            {
                column = lines[i].find("Model");
                if (column != std::string::npos)
                    break;
            }
        }
        if (column == std::string::npos)
            return "";

        for (++i; i < lines.size(); ++i)
        {
            const std::string &line = lines[i];
            std::string trimmed = common::Trim(line);

            if (trimmed.empty() || trimmed.rfind("Mod", 0) == 0)
                break;
            if (!StartsWithDigit(trimmed) || IsSupervisorOrFabric(line))
                continue;
            if (line.size() <= column)
                continue;

            auto tokens = common::SplitWhitespace(line.substr(column));
            if (!tokens.empty() && std::regex_match(tokens.front(), ModelToken()))
                return tokens.front();
        }
        return "";
    }

    std::string ProductFamilyCode(const std::string &output)
    {
        for (const auto &line : common::SplitLines(output))
        {
            if (IsSupervisorOrFabric(line))
                continue;

            std::smatch m;
            if (std::regex_search(line, m, ProductFamily()))
                return m[1].str();
        }
        return "";
    }

    std::string ModuleListing(const std::string &output)
    {
        std::string model = ModuleTableModel(output);
        if (!model.empty())
            return model;
        return ProductFamilyCode(output);
    }
}
