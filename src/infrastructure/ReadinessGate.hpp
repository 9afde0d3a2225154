/**
 * @file ReadinessGate.hpp
 * @brief Waits until a newly created file is fully written and not locked.
 */

#pragma once

#include "domain/RetryPolicy.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace scansorter::infrastructure {

/**
 * @enum GateStatus
 * @brief Result of waiting on a file.
 */
enum class GateStatus {
    Ready,       ///< Non-empty and openable for append without lock contention.
    LockTimeout, ///< Still empty or locked after every probe.
    Missing      ///< The file disappeared while waiting.
};

struct GateResult {
    GateStatus status = GateStatus::LockTimeout;
    int attempts = 0;
};

/**
 * @class ReadinessGate
 * @brief Blocks, with bounded retries, until a file is safe to read.
 *
 * A file counts as ready when it is a non-empty regular file that can be opened
 * for append and on which a non-blocking shared flock succeeds, i.e. no other
 * process holds an exclusive lock on it.
 */
class ReadinessGate {
public:
    struct Settings {
        std::chrono::milliseconds settleDelay{3000}; ///< Pause before the first probe.
        domain::RetryPolicy probe{10, std::chrono::milliseconds(2000)};
    };

    /** @brief Receives one line per failed probe. */
    using StatusCallback = std::function<void(const std::string&)>;

    explicit ReadinessGate(Settings settings);

    /**
     * @brief Sleeps the settle delay, then probes until ready or the bound is hit.
     * @param path File to wait on. Never modified.
     * @param statusCallback Optional progress sink; stdout when empty.
     */
    GateResult waitUntilReady(const std::string& path, const StatusCallback& statusCallback = nullptr) const;

    const Settings& settings() const { return m_settings; }

private:
    Settings m_settings;
};

} // namespace scansorter::infrastructure
