#include "Prober.hpp"
#include "../common/Log.hpp"
#include <memory>
#include <mutex>
#include <tins/tins.h>
#include <unistd.h>

namespace devwatch::engine
{
    namespace
    {
        void WarnIfNotRoot()
        {
            static std::once_flag once;
            std::call_once(once, []
                           {
                if (geteuid() != 0)
                    common::LogError("Prober", "not running as root; ICMP probes need raw sockets and will report DOWN"); });
        }
    }

    IcmpProbe::IcmpProbe() : m_nextId(static_cast<std::uint16_t>(getpid()))
    {
        WarnIfNotRoot();
    }

    bool IcmpProbe::Probe(const std::string &address, std::chrono::milliseconds timeout)
    {
        try
        {
            const auto seconds = static_cast<uint32_t>(timeout.count() / 1000);
            const auto usec = static_cast<uint32_t>((timeout.count() % 1000) * 1000);

            Tins::PacketSender sender(Tins::NetworkInterface::default_interface(), seconds, usec);

            Tins::IP ip = Tins::IP(Tins::IPv4Address(address)) / Tins::ICMP();
            Tins::ICMP &icmp = ip.rfind_pdu<Tins::ICMP>();
            icmp.type(Tins::ICMP::ECHO_REQUEST);
            icmp.id(m_nextId++);
            icmp.sequence(1);

            std::unique_ptr<Tins::PDU> reply(sender.send_recv(ip));
            if (!reply)
                return false;

            const Tins::ICMP *answer = reply->find_pdu<Tins::ICMP>();
            return answer && answer->type() == Tins::ICMP::ECHO_REPLY;
        }
        catch (const std::exception &e)
        {
            common::LogDebug("Prober", "ICMP to " + address + ": " + e.what());
            return false;
        }
    }
}
