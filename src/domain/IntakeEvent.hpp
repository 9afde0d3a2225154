/**
 * @file IntakeEvent.hpp
 * @brief Domain entity representing a file arrival in the intake directory.
 */

#pragma once
#include <chrono>
#include <string>

namespace scansorter::domain {

/**
 * @struct IntakeEvent
 * @brief A single file-creation notification. Consumed once, never persisted.
 */
struct IntakeEvent {
    std::string path;                                   ///< Absolute path of the new file.
    std::chrono::system_clock::time_point detectedAt;   ///< When the watcher observed it.

    /** @brief Builds an event stamped with the current time. */
    static IntakeEvent Now(const std::string& path) {
        return IntakeEvent{path, std::chrono::system_clock::now()};
    }
};

} // namespace scansorter::domain
