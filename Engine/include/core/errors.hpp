/**
 * @file errors.hpp
 * @brief Exception taxonomy for drift detection and corrective actions
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Driftwatch {

/**
 * @brief Base class of every error Driftwatch raises on purpose.
 */
class DriftwatchError : public std::runtime_error {
public:
    explicit DriftwatchError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief A log query failed (connectivity, SQL error, malformed rows).
 *
 * Never retried inside the core. The pipeline records the affected
 * monitor as failed and continues with the others.
 */
class DataSourceError : public DriftwatchError {
public:
    explicit DataSourceError(const std::string& message) : DriftwatchError(message) {}
};

/**
 * @brief Invalid configuration. Fatal before any monitor runs.
 */
class ConfigurationError : public DriftwatchError {
public:
    explicit ConfigurationError(const std::string& message) : DriftwatchError(message) {}
};

/**
 * @brief A corrective action could not be carried out.
 */
class ActionExecutionError : public DriftwatchError {
public:
    explicit ActionExecutionError(const std::string& message) : DriftwatchError(message) {}
};

} // namespace Driftwatch
