/**
 * @file InotifyDirectoryWatcher.cpp
 * @brief Implementation of InotifyDirectoryWatcher.
 */

#include "infrastructure/InotifyDirectoryWatcher.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <utility>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace scansorter::infrastructure {

namespace {

constexpr int kPollTimeoutMs = 200;
constexpr uint32_t kWatchMask = IN_CREATE | IN_MOVED_TO;

} // namespace

InotifyDirectoryWatcher::InotifyDirectoryWatcher(std::string directory, domain::FileEventHandler& handler)
    : m_directory(std::move(directory))
    , m_handler(handler) {}

InotifyDirectoryWatcher::~InotifyDirectoryWatcher() {
    stop();
}

bool InotifyDirectoryWatcher::start(std::string& errorMsg) {
    if (m_thread.joinable()) {
        errorMsg = "Watcher already started for " + m_directory;
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(m_directory, ec)) {
        errorMsg = "Not a directory: " + m_directory;
        return false;
    }

    m_fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (m_fd < 0) {
        errorMsg = std::string("inotify_init1 failed: ") + std::strerror(errno);
        return false;
    }

    m_wd = ::inotify_add_watch(m_fd, m_directory.c_str(), kWatchMask);
    if (m_wd < 0) {
        errorMsg = "inotify_add_watch failed for " + m_directory + ": " + std::strerror(errno);
        closeWatch();
        return false;
    }

    m_stopRequested = false;
    m_active = true;
    m_thread = std::thread(&InotifyDirectoryWatcher::eventLoop, this);
    return true;
}

void InotifyDirectoryWatcher::stop() {
    m_stopRequested = true;
    if (m_thread.joinable()) {
        m_thread.join();
    }
    closeWatch();
}

void InotifyDirectoryWatcher::closeWatch() {
    if (m_fd >= 0) {
        if (m_wd >= 0) {
            ::inotify_rm_watch(m_fd, m_wd);
        }
        ::close(m_fd);
    }
    m_fd = -1;
    m_wd = -1;
}

void InotifyDirectoryWatcher::eventLoop() {
    alignas(struct inotify_event) char buffer[16 * 1024];

    while (!m_stopRequested.load()) {
        pollfd pfd{m_fd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[InotifyDirectoryWatcher] poll failed: " << std::strerror(errno) << std::endl;
            break;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t length = ::read(m_fd, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            std::cerr << "[InotifyDirectoryWatcher] read failed: " << std::strerror(errno) << std::endl;
            break;
        }

        bool watchGone = false;
        for (char* ptr = buffer; ptr < buffer + length;) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(ptr);
            ptr += sizeof(struct inotify_event) + event->len;

            if (event->mask & IN_Q_OVERFLOW) {
                std::cerr << "[InotifyDirectoryWatcher] WARNING: event queue overflowed, some arrivals were lost in "
                          << m_directory << std::endl;
                continue;
            }
            if (event->mask & IN_IGNORED) {
                std::cerr << "[InotifyDirectoryWatcher] Watched directory was removed or unmounted: "
                          << m_directory << std::endl;
                m_wd = -1;
                watchGone = true;
                break;
            }
            if ((event->mask & IN_ISDIR) || event->len == 0) {
                continue;
            }
            // Stop is honoured between files only.
            if (m_stopRequested.load()) {
                break;
            }
            dispatch((std::filesystem::path(m_directory) / event->name).string());
        }

        if (watchGone) {
            break;
        }
    }

    m_active = false;
}

void InotifyDirectoryWatcher::dispatch(const std::string& path) {
    try {
        m_handler.onFileCreated(domain::IntakeEvent::Now(path));
    } catch (const std::exception& e) {
        std::cerr << "[InotifyDirectoryWatcher] Error while processing " << path << ": " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "[InotifyDirectoryWatcher] Unknown error while processing " << path << std::endl;
    }
}

} // namespace scansorter::infrastructure
