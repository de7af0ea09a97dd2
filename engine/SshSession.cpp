#include "RemoteShell.hpp"
#include "../common/Log.hpp"
#include "../common/TextUtil.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <libssh2.h>
#include <mutex>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace devwatch::engine
{
    namespace
    {
        using Clock = std::chrono::steady_clock;

        struct Libssh2Runtime
        {
            bool ok = false;

            Libssh2Runtime()
            {
                int rc = libssh2_init(0);
                ok = (rc == 0);
                if (!ok)
                    common::LogError("SshSession", "libssh2 initialization failed (" + std::to_string(rc) + ")");
            }

            ~Libssh2Runtime()
            {
                if (ok)
                    libssh2_exit();
            }
        };

        // libssh2_init is not thread safe; the first opener thread runs it for everyone.
        bool EnsureLibssh2()
        {
            static Libssh2Runtime runtime;
            return runtime.ok;
        }

        long RemainingMs(Clock::time_point deadline)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
            return std::max<long>(1, static_cast<long>(left));
        }

        std::string LastError(LIBSSH2_SESSION *session)
        {
            char *message = nullptr;
            int len = 0;
            libssh2_session_last_error(session, &message, &len, 0);
            return message ? std::string(message, static_cast<std::size_t>(len)) : "unknown error";
        }

        // Non-blocking connect bounded by the deadline, then back to blocking mode.
        int ConnectWithTimeout(const std::string &address, int port, Clock::time_point deadline)
        {
            sockaddr_in addr;
            std::memset(&addr, 0, sizeof(addr));
            addr.sin_family = AF_INET;
            addr.sin_port = htons(static_cast<uint16_t>(port));
            if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1)
                return -1;

            int fd = socket(AF_INET, SOCK_STREAM, 0);
            if (fd < 0)
                return -1;

            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
            if (rc < 0 && errno != EINPROGRESS)
            {
                close(fd);
                return -1;
            }

            if (rc != 0)
            {
                pollfd pfd{};
                pfd.fd = fd;
                pfd.events = POLLOUT;
                if (poll(&pfd, 1, static_cast<int>(RemainingMs(deadline))) <= 0)
                {
                    close(fd);
                    return -1;
                }

                int err = 0;
                socklen_t len = sizeof(err);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0 || err != 0)
                {
                    close(fd);
                    return -1;
                }
            }

            fcntl(fd, F_SETFL, flags);
            return fd;
        }

        class SshSession : public RemoteSession
        {
        public:
            SshSession(int socketFd, LIBSSH2_SESSION *session, std::chrono::milliseconds commandTimeout)
                : m_socket(socketFd), m_session(session), m_commandTimeout(commandTimeout)
            {
            }

            ~SshSession() override
            {
                if (m_session)
                {
                    if (m_established)
                    {
                        libssh2_session_set_timeout(m_session, 1000);
                        libssh2_session_disconnect(m_session, "devwatch done");
                    }
                    libssh2_session_free(m_session);
                }
                if (m_socket >= 0)
                    close(m_socket);
            }

            SshSession(const SshSession &) = delete;
            SshSession &operator=(const SshSession &) = delete;

            // Key exchange done; the peer expects a disconnect message on close.
            void MarkEstablished() { m_established = true; }

            std::optional<std::string> Execute(const std::string &command) override
            {
                const auto deadline = Clock::now() + m_commandTimeout;
                libssh2_session_set_timeout(m_session, RemainingMs(deadline));

                LIBSSH2_CHANNEL *channel = libssh2_channel_open_session(m_session);
                if (!channel)
                {
                    common::LogDebug("SshSession", "channel open failed: " + LastError(m_session));
                    return std::nullopt;
                }

                std::string output;
                bool ok = libssh2_channel_exec(channel, command.c_str()) == 0;

                char buffer[4096];
                while (ok)
                {
                    libssh2_session_set_timeout(m_session, RemainingMs(deadline));
                    ssize_t n = libssh2_channel_read(channel, buffer, sizeof(buffer));
                    if (n == 0)
                        break;
                    if (n < 0 || Clock::now() >= deadline)
                    {
                        ok = false;
                        break;
                    }
                    output.append(buffer, static_cast<std::size_t>(n));
                }

                if (!ok)
                    common::LogDebug("SshSession", "'" + command + "' failed: " + LastError(m_session));

                libssh2_session_set_timeout(m_session, 1000);
                libssh2_channel_close(channel);
                libssh2_channel_free(channel);

                if (!ok)
                    return std::nullopt;
                return common::Trim(output);
            }

        private:
            int m_socket;
            LIBSSH2_SESSION *m_session;
            std::chrono::milliseconds m_commandTimeout;
            bool m_established = false;
        };
    }

    SshSessionOpener::SshSessionOpener(int port, std::chrono::milliseconds connectTimeout,
                                       std::chrono::milliseconds commandTimeout)
        : m_port(port), m_connectTimeout(connectTimeout), m_commandTimeout(commandTimeout)
    {
    }

    std::unique_ptr<RemoteSession> SshSessionOpener::Open(const std::string &address, const LoginAttempt &login)
    {
        if (!EnsureLibssh2())
            return nullptr;

        // One budget for connect, banner and authentication.
        const auto deadline = Clock::now() + m_connectTimeout;

        int fd = ConnectWithTimeout(address, m_port, deadline);
        if (fd < 0)
        {
            common::LogDebug("SshSession", address + ":" + std::to_string(m_port) + " connect failed");
            return nullptr;
        }

        LIBSSH2_SESSION *raw = libssh2_session_init();
        if (!raw)
        {
            close(fd);
            common::LogError("SshSession", "failed to create SSH session");
            return nullptr;
        }

        // From here the session object owns both the socket and the libssh2 handle.
        auto session = std::make_unique<SshSession>(fd, raw, m_commandTimeout);

        libssh2_session_set_blocking(raw, 1);
        libssh2_session_set_timeout(raw, RemainingMs(deadline));

        if (libssh2_session_handshake(raw, fd) != 0)
        {
            common::LogDebug("SshSession", address + ": handshake failed: " + LastError(raw));
            return nullptr;
        }
        session->MarkEstablished();

        libssh2_session_set_timeout(raw, RemainingMs(deadline));
        if (libssh2_userauth_password(raw, login.username.c_str(), login.password.c_str()) != 0)
        {
            common::LogDebug("SshSession", address + ": authentication failed for '" + login.username + "'");
            return nullptr;
        }

        return session;
    }
}
