/**
 * NetworkMonitor.cpp
 */

#include "NetworkMonitor.hpp"
#include "../Logger.hpp"

#include <ifaddrs.h>
#include <net/if.h>
#include <sys/socket.h>

namespace surge::core::downloader {

bool InterfaceConnectivityProbe::isConnected() {
    struct ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) != 0) {
        Logger::instance().warn("getifaddrs failed, assuming connectivity");
        return true;
    }

    bool connected = false;
    for (struct ifaddrs* addr = addrs; addr != nullptr; addr = addr->ifa_next) {
        if (addr->ifa_addr == nullptr) {
            continue;
        }

        int family = addr->ifa_addr->sa_family;
        if (family != AF_INET && family != AF_INET6) {
            continue;
        }

        unsigned int flags = addr->ifa_flags;
        if ((flags & IFF_LOOPBACK) != 0) {
            continue;
        }
        if ((flags & IFF_UP) != 0 && (flags & IFF_RUNNING) != 0) {
            connected = true;
            break;
        }
    }

    freeifaddrs(addrs);
    return connected;
}

NetworkMonitor::NetworkMonitor(std::shared_ptr<ConnectivityProbe> probe, bool initiallyConnected)
    : m_probe(std::move(probe))
    , m_connected(initiallyConnected) {
}

NetworkMonitor::~NetworkMonitor() {
    stop();
}

void NetworkMonitor::setHandler(Handler handler) {
    std::lock_guard<std::mutex> dispatch(m_dispatchMutex);
    m_handler = std::move(handler);
}

bool NetworkMonitor::setConnected(bool connected) {
    std::lock_guard<std::mutex> dispatch(m_dispatchMutex);

    if (m_connected.exchange(connected) == connected) {
        return false;
    }

    Logger::instance().info("Network {}", connected ? "connected" : "disconnected");

    if (m_handler) {
        try {
            m_handler(connected);
        } catch (const std::exception& e) {
            Logger::instance().error("Connectivity handler threw: {}", e.what());
        }
    }
    return true;
}

void NetworkMonitor::poll() {
    if (m_probe) {
        setConnected(m_probe->isConnected());
    }
}

void NetworkMonitor::start(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(m_pollMutex);

    if (m_polling || !m_probe) {
        return;
    }

    m_polling = true;
    m_pollThread = std::thread([this, interval] { pollLoop(interval); });
    Logger::instance().debug("Polling connectivity every {} ms", interval.count());
}

void NetworkMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(m_pollMutex);
        if (!m_polling) {
            return;
        }
        m_polling = false;
    }

    m_pollCondition.notify_all();
    if (m_pollThread.joinable()) {
        m_pollThread.join();
    }
}

bool NetworkMonitor::isPolling() const {
    std::lock_guard<std::mutex> lock(m_pollMutex);
    return m_polling;
}

void NetworkMonitor::pollLoop(std::chrono::milliseconds interval) {
    while (true) {
        poll();

        std::unique_lock<std::mutex> lock(m_pollMutex);
        if (m_pollCondition.wait_for(lock, interval, [this] { return !m_polling; })) {
            return;
        }
    }
}

} // namespace surge::core::downloader
