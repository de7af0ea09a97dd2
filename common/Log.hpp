#pragma once

#include <mutex>
#include <string>

namespace devwatch::common
{
    void SetVerbose(bool enabled);
    bool IsVerbose();

    // Guards std::cout / std::cerr so whole lines from worker threads do not interleave.
    std::mutex &OutputMutex();

    void LogInfo(const std::string &tag, const std::string &message);
    void LogError(const std::string &tag, const std::string &message);

    // Only printed with --verbose.
    void LogDebug(const std::string &tag, const std::string &message);
}
