#include "Log.hpp"
#include <atomic>
#include <iostream>

namespace devwatch::common
{
    namespace
    {
        std::atomic<bool> g_verbose{false};
    }

    void SetVerbose(bool enabled)
    {
        g_verbose = enabled;
    }

    bool IsVerbose()
    {
        return g_verbose;
    }

    std::mutex &OutputMutex()
    {
        static std::mutex mutex;
        return mutex;
    }

    void LogInfo(const std::string &tag, const std::string &message)
    {
        std::lock_guard<std::mutex> lock(OutputMutex());
        std::cout << "[" << tag << "] " << message << "\n";
    }

    void LogError(const std::string &tag, const std::string &message)
    {
        std::lock_guard<std::mutex> lock(OutputMutex());
        std::cerr << "[" << tag << "] ERROR: " << message << "\n";
    }

    void LogDebug(const std::string &tag, const std::string &message)
    {
        if (!g_verbose)
            return;
        std::lock_guard<std::mutex> lock(OutputMutex());
        std::cout << "[" << tag << "] " << message << "\n";
    }
}
