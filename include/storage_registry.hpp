/**
 * @file storage_registry.hpp
 * @brief Name to constructor table for storage backends.
 *
 * Names are matched case-insensitively. The table is open: tests and extensions register
 * additional backends without touching the built-in ones.
 */

#ifndef STORAGE_REGISTRY_HPP
#define STORAGE_REGISTRY_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "storage_backend.hpp"

class Logger;

/**
 * @brief Creates initialized storage backends by name.
 */
class StorageRegistry {
public:
    using Factory = std::function<std::unique_ptr<StorageBackend>()>;

    /**
     * @brief Builds a registry holding the nine built-in backends.
     *
     * @param logger Logger handed to every backend created by the registry.
     */
    static StorageRegistry withDefaults(Logger& logger);

    /**
     * @brief Adds or replaces a backend constructor.
     *
     * @param name Backend name, stored lower-case.
     * @param factory Constructor returning an uninitialized backend.
     */
    void registerBackend(const std::string& name, Factory factory);

    /**
     * @brief Instantiates and initializes a backend.
     *
     * @param name Backend name, any case.
     * @param options Options forwarded to initialize().
     * @return Result<ScopedStorage> Ready handle owned by the caller, or ConfigurationError for
     * an unknown name (listing the valid ones) and any initialization failure.
     */
    Result<ScopedStorage> open(const std::string& name, const StorageOptions& options) const;

    bool contains(const std::string& name) const;

    /**
     * @brief Registered names in sorted order.
     */
    std::vector<std::string> names() const;

    static std::string normalizeName(const std::string& name);

private:
    std::map<std::string, Factory> factories_;
};

#endif // STORAGE_REGISTRY_HPP
