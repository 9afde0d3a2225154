/**
 * @file ReadinessGate.cpp
 * @brief Implementation of ReadinessGate.
 */

#include "infrastructure/ReadinessGate.hpp"

#include <cerrno>
#include <filesystem>
#include <iostream>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace scansorter::infrastructure {

namespace {

enum class ProbeState { Ready, NotReady, Missing };

ProbeState ProbeFile(const std::string& path) {
    std::error_code ec;
    const fs::file_status st = fs::status(path, ec);
    if (st.type() == fs::file_type::not_found) {
        return ProbeState::Missing;
    }
    if (ec || !fs::is_regular_file(st)) {
        return ProbeState::NotReady;
    }

    const auto size = fs::file_size(path, ec);
    if (ec || size == 0) {
        return ProbeState::NotReady;
    }

    const int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
    if (fd < 0) {
        return errno == ENOENT ? ProbeState::Missing : ProbeState::NotReady;
    }

    const bool locked = ::flock(fd, LOCK_SH | LOCK_NB) != 0;
    if (!locked) {
        ::flock(fd, LOCK_UN);
    }
    ::close(fd);
    return locked ? ProbeState::NotReady : ProbeState::Ready;
}

} // namespace

ReadinessGate::ReadinessGate(Settings settings)
    : m_settings(settings) {}

GateResult ReadinessGate::waitUntilReady(const std::string& path, const StatusCallback& statusCallback) const {
    if (m_settings.settleDelay.count() > 0) {
        std::this_thread::sleep_for(m_settings.settleDelay);
    }

    // Ready and Missing both end the loop; nullopt means probe again.
    auto outcome = domain::RetryWithBackoff<GateStatus>(
        m_settings.probe,
        [&path](int) -> std::optional<GateStatus> {
            switch (ProbeFile(path)) {
                case ProbeState::Ready: return GateStatus::Ready;
                case ProbeState::Missing: return GateStatus::Missing;
                case ProbeState::NotReady: break;
            }
            return std::nullopt;
        },
        [&path, &statusCallback, this](int attempt) {
            const std::string message = "[INFO] Waiting for file access: " + path + " (" + std::to_string(attempt) +
                                        "/" + std::to_string(m_settings.probe.maxAttempts) + ")";
            if (statusCallback) {
                statusCallback(message);
            } else {
                std::cout << "[ReadinessGate] " << message << std::endl;
            }
        });

    GateResult result;
    result.attempts = outcome.attempts;
    result.status = outcome.value.value_or(GateStatus::LockTimeout);
    return result;
}

} // namespace scansorter::infrastructure
