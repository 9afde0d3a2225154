/**
 * @file InotifyDirectoryWatcher.hpp
 * @brief Watches one directory for new files using Linux inotify.
 */

#pragma once

#include "domain/FileEventHandler.hpp"

#include <atomic>
#include <string>
#include <thread>

namespace scansorter::infrastructure {

/**
 * @class InotifyDirectoryWatcher
 * @brief Non-recursive watcher that forwards file arrivals to a FileEventHandler.
 *
 * Events are delivered sequentially on a single background thread, in the order
 * the kernel reports them. An exception thrown by the handler is logged and the
 * watcher moves on to the next event.
 */
class InotifyDirectoryWatcher {
public:
    /**
     * @param directory Directory to watch. Must exist when start() is called.
     * @param handler Receives one call per created or moved-in file. Must outlive the watcher.
     */
    InotifyDirectoryWatcher(std::string directory, domain::FileEventHandler& handler);
    ~InotifyDirectoryWatcher();

    InotifyDirectoryWatcher(const InotifyDirectoryWatcher&) = delete;
    InotifyDirectoryWatcher& operator=(const InotifyDirectoryWatcher&) = delete;

    /**
     * @brief Subscribes to the directory and starts the event thread.
     * @param errorMsg Receives the reason on failure.
     * @return True if watching started.
     */
    bool start(std::string& errorMsg);

    /** @brief Requests stop, waits for the current file to finish and unsubscribes. */
    void stop();

    /** @brief False once the event loop has exited, for any reason. */
    bool isRunning() const { return m_active.load(); }

    const std::string& directory() const { return m_directory; }

private:
    void eventLoop();
    void dispatch(const std::string& path);
    void closeWatch();

    std::string m_directory;
    domain::FileEventHandler& m_handler;

    int m_fd = -1; ///< inotify instance.
    int m_wd = -1; ///< Watch descriptor for m_directory.

    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_active{false};
    std::thread m_thread;
};

} // namespace scansorter::infrastructure
