/**
 * @file http_storage.hpp
 * @brief Common base for storage backends that talk HTTP through libcurl.
 */

#ifndef HTTP_STORAGE_HPP
#define HTTP_STORAGE_HPP

#include <json/json.h>
#include <memory>
#include "http_client.hpp"
#include "storage_backend.hpp"

class Logger;

/**
 * @brief StorageBackend owning an HTTP session.
 *
 * The session is a libcurl HttpClient unless another transport is supplied. release()
 * closes it; the cancel flag is forwarded to every transfer.
 */
class HttpStorageBackend : public StorageBackend {
public:
    explicit HttpStorageBackend(Logger& logger, std::unique_ptr<HttpTransport> transport = std::make_unique<HttpClient>())
        : logger_(logger), http_(std::move(transport)) {}

    void release() override { http_->reset(); }

    void setCancelFlag(const std::atomic<bool>* flag) override {
        StorageBackend::setCancelFlag(flag);
        http_->setCancelFlag(flag);
    }

protected:
    /**
     * @brief Converts a non-2xx response into a typed error.
     *
     * 404 becomes NotFoundError, everything else TransferError. The body is truncated so
     * that large error documents do not flood the log.
     */
    BackupError httpError(const std::string& operation, const std::string& target, const HttpResponse& response) const;

    /**
     * @brief Parses a JSON response body.
     */
    static Result<Json::Value> parseJson(const std::string& body);

    /**
     * @brief Serializes JSON without indentation.
     */
    static std::string toJson(const Json::Value& value);

    Logger& logger_;
    std::unique_ptr<HttpTransport> http_;
};

#endif // HTTP_STORAGE_HPP
