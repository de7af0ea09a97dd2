#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../common/Config.hpp"

namespace devwatch::engine
{
    struct LoginAttempt
    {
        std::string username;
        std::string password;
    };

    // One attempt per (user, password) pair, in configuration order.
    std::vector<LoginAttempt> ExpandCredentials(const std::vector<common::Credential> &credentials);

    class RemoteSession
    {
    public:
        virtual ~RemoteSession() = default;

        // Command output, or nullopt if the channel failed or the command timed out.
        virtual std::optional<std::string> Execute(const std::string &command) = 0;
    };

    class SessionOpener
    {
    public:
        virtual ~SessionOpener() = default;

        // Authenticated session, or nullptr on connect, banner or auth failure.
        virtual std::unique_ptr<RemoteSession> Open(const std::string &address, const LoginAttempt &login) = 0;
    };

    class CommandRunner
    {
    public:
        virtual ~CommandRunner() = default;

        // Returns nullopt without touching the network once *cancel is set.
        virtual std::optional<std::string> Run(const std::string &address, const std::string &command,
                                               const std::atomic<bool> *cancel = nullptr) = 0;
    };

    // Opens a fresh session per command, trying each login in order; the first one that
    // authenticates runs the command. The session is closed before Run() returns. The cancel
    // flag is checked before every login attempt and before the command itself.
    class CredentialedRunner : public CommandRunner
    {
    public:
        CredentialedRunner(std::shared_ptr<SessionOpener> opener, std::vector<LoginAttempt> logins);

        std::optional<std::string> Run(const std::string &address, const std::string &command,
                                       const std::atomic<bool> *cancel = nullptr) override;

    private:
        std::shared_ptr<SessionOpener> m_opener;
        std::vector<LoginAttempt> m_logins;
    };

    class SshSessionOpener : public SessionOpener
    {
    public:
        SshSessionOpener(int port, std::chrono::milliseconds connectTimeout, std::chrono::milliseconds commandTimeout);

        std::unique_ptr<RemoteSession> Open(const std::string &address, const LoginAttempt &login) override;

    private:
        int m_port;
        std::chrono::milliseconds m_connectTimeout;
        std::chrono::milliseconds m_commandTimeout;
    };
}
