#pragma once

#include <stdexcept>
#include <string>

namespace exchange_sim {

/**
 * Failure reported by the persistence gateway.
 */
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Transient storage failure (connection lost, lock timeout). The core keeps
 * running in memory and retries on the next tick.
 */
class StorageUnavailable : public StorageError {
public:
    explicit StorageUnavailable(const std::string& what) : StorageError(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace exchange_sim
