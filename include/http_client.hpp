/**
 * @file http_client.hpp
 * @brief Minimal HTTP client over libcurl used by the cloud storage adapters.
 *
 * One HttpClient owns one curl easy handle, which plays the role of the backend session:
 * connections are reused across requests and closed by reset(). Request bodies can be
 * streamed from a file; response bodies can be streamed to a file, in which case the file
 * is only produced for a 2xx status.
 */

#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <atomic>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "backup_error.hpp"

/**
 * @brief Outgoing request description.
 */
struct HttpRequest {
    std::string method = "GET";                 ///< HTTP verb.
    std::string url;                            ///< Absolute URL, already encoded.
    std::vector<std::string> headers;           ///< "Name: value" lines.
    std::string body;                           ///< In-memory body, ignored if uploadFile is set.
    std::optional<std::string> uploadFile;      ///< Stream the request body from this file.
    std::optional<std::string> downloadFile;    ///< Stream a 2xx response body to this file.
};

/**
 * @brief Response status, headers (lower-case names) and body.
 *
 * When the request had a downloadFile and the status is 2xx, body is empty.
 */
struct HttpResponse {
    long status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
    std::optional<std::string> header(const std::string& lowerName) const;
};

/**
 * @brief Session that executes HTTP requests for a storage backend.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Executes a request.
     *
     * @return Result<HttpResponse> The response for any HTTP status; TransferError when the
     * exchange itself failed, CancelledError when the cancel flag stopped it.
     */
    virtual Result<HttpResponse> perform(const HttpRequest& request) = 0;

    /**
     * @brief Flag polled during transfers; a set flag aborts the transfer.
     */
    virtual void setCancelFlag(const std::atomic<bool>* flag) = 0;

    /**
     * @brief Closes the session. The next perform() opens a fresh one.
     */
    virtual void reset() = 0;
};

/**
 * @brief libcurl easy-handle wrapper.
 */
class HttpClient : public HttpTransport {
public:
    HttpClient();
    ~HttpClient() override;
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    Result<HttpResponse> perform(const HttpRequest& request) override;

    /**
     * @brief Flag polled by the progress callback.
     */
    void setCancelFlag(const std::atomic<bool>* flag) override { cancelFlag_ = flag; }

    void reset() override;

    /**
     * @brief Sets the per-request timeout in seconds (0 disables it).
     */
    void setTimeout(long seconds) { timeoutSeconds_ = seconds; }

    /**
     * @brief Encodes key/value pairs as application/x-www-form-urlencoded.
     */
    static std::string formEncode(const std::vector<std::pair<std::string, std::string>>& fields);

private:
    void* curl_ = nullptr;                      ///< CURL* owned by this client.
    const std::atomic<bool>* cancelFlag_ = nullptr;
    long timeoutSeconds_ = 0;
};

#endif // HTTP_CLIENT_HPP
