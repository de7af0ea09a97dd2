#include "RemoteShell.hpp"
#include "../common/Fallback.hpp"
#include "../common/Log.hpp"
#include <exception>

namespace devwatch::engine
{
    std::vector<LoginAttempt> ExpandCredentials(const std::vector<common::Credential> &credentials)
    {
        std::vector<LoginAttempt> logins;
        for (const auto &credential : credentials)
        {
            for (const auto &password : credential.passwords)
                logins.push_back({credential.username, password});
        }
        return logins;
    }

    CredentialedRunner::CredentialedRunner(std::shared_ptr<SessionOpener> opener, std::vector<LoginAttempt> logins)
        : m_opener(std::move(opener)), m_logins(std::move(logins))
    {
    }

    std::optional<std::string> CredentialedRunner::Run(const std::string &address, const std::string &command,
                                                       const std::atomic<bool> *cancel)
    {
        auto cancelled = [cancel]
        { return cancel && cancel->load(); };

        auto attempt = [&](const LoginAttempt &login) -> std::unique_ptr<RemoteSession>
        {
            if (cancelled())
                return nullptr;

            std::unique_ptr<RemoteSession> opened;
            try
            {
                opened = m_opener->Open(address, login);
            }
            catch (const std::exception &e)
            {
                common::LogDebug("SshSession", address + ": " + e.what());
                opened.reset();
            }

            if (!opened)
                common::LogDebug("SshSession", address + ": login as '" + login.username + "' failed");
            return opened;
        };

        std::unique_ptr<RemoteSession> session = common::FirstSuccess(m_logins, attempt);

        if (!session)
        {
            if (!cancelled())
                common::LogDebug("SshSession", address + ": all credentials failed for '" + command + "'");
            return std::nullopt;
        }
        if (cancelled())
            return std::nullopt;

        try
        {
            return session->Execute(command);
        }
        catch (const std::exception &e)
        {
            common::LogDebug("SshSession", address + ": '" + command + "' failed: " + e.what());
            return std::nullopt;
        }
    }
}
