#pragma once

#include <string>

// Each parser returns the extracted value, or an empty string when the output does not
// match so the caller can fall through to the next command.
namespace devwatch::engine::parsers
{
    // "Hostname: CORE-SW-1" on any line, or output that is one bare token.
    std::string ShowHostname(const std::string &output);

    // A "hostname <token>" configuration line.
    std::string RunningConfigHostname(const std::string &output);

    // "Model Number : C9300-48P" (show version).
    std::string ModelNumberField(const std::string &output);

    // "Model number is N9K-C93180YC-EX" (show hardware).
    std::string ModelNumberIs(const std::string &output);

    // Model column of the first non supervisor/fabric row of a "show module" table,
    // located by the header's "Model" offset.
    std::string ModuleTableModel(const std::string &output);

    // First product-family code (N9K-..., C9300-..., WS-C..., ISR..., ASR...) outside
    // supervisor/fabric lines.
    std::string ProductFamilyCode(const std::string &output);

    // ModuleTableModel, then ProductFamilyCode.
    std::string ModuleListing(const std::string &output);
}
