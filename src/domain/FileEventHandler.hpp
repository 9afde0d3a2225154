/**
 * @file FileEventHandler.hpp
 * @brief Interface receiving file arrivals from a directory watcher.
 */

#pragma once

#include "domain/IntakeEvent.hpp"

namespace scansorter::domain {

/**
 * @class FileEventHandler
 * @brief Decouples file processing from the notification mechanism.
 *
 * Implementations may be invoked directly with synthetic events.
 */
class FileEventHandler {
public:
    virtual ~FileEventHandler() = default;

    /** @brief Called once per observed file creation, in observation order. */
    virtual void onFileCreated(const IntakeEvent& event) = 0;
};

} // namespace scansorter::domain
