#pragma once

/**
 * NetworkMonitor.hpp
 *
 * Connectivity observation. Transitions are reported to one handler, which
 * the orchestrator uses for bulk pause and resume.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace surge::core::downloader {

/**
 * Source of the current connectivity state
 */
class ConnectivityProbe {
public:
    virtual ~ConnectivityProbe() = default;
    virtual bool isConnected() = 0;
};

/**
 * Connected when a non-loopback interface is up, running and has an
 * IPv4 or IPv6 address
 */
class InterfaceConnectivityProbe : public ConnectivityProbe {
public:
    bool isConnected() override;
};

/**
 * NetworkMonitor - edge-triggered connectivity state
 *
 * setConnected() is the single transition entry; the optional polling
 * thread feeds it from a probe. The handler runs only on an actual change,
 * on the thread that observed it, one transition at a time.
 */
class NetworkMonitor {
public:
    using Handler = std::function<void(bool connected)>;

    explicit NetworkMonitor(std::shared_ptr<ConnectivityProbe> probe = nullptr,
                            bool initiallyConnected = true);
    ~NetworkMonitor();

    NetworkMonitor(const NetworkMonitor&) = delete;
    NetworkMonitor& operator=(const NetworkMonitor&) = delete;

    /**
     * Replace the handler. Waits for a handler call in progress, so the old
     * handler is never running once this returns. Must not be called from
     * inside the handler.
     */
    void setHandler(Handler handler);

    /**
     * Report the current state
     * @return true if this was a transition
     */
    bool setConnected(bool connected);

    bool isConnected() const { return m_connected.load(); }

    /**
     * Probe once and report the result
     */
    void poll();

    /**
     * Start polling the probe every `interval`
     */
    void start(std::chrono::milliseconds interval);
    void stop();
    bool isPolling() const;

private:
    void pollLoop(std::chrono::milliseconds interval);

private:
    std::shared_ptr<ConnectivityProbe> m_probe;
    std::atomic<bool> m_connected;

    std::mutex m_dispatchMutex;      // guards m_handler and serializes transitions
    Handler m_handler;

    mutable std::mutex m_pollMutex;
    std::condition_variable m_pollCondition;
    std::thread m_pollThread;
    bool m_polling{false};
};

} // namespace surge::core::downloader
