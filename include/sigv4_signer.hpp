/**
 * @file sigv4_signer.hpp
 * @brief AWS Signature Version 4 request signing and URL presigning.
 *
 * Shared by every S3-compatible backend (AWS S3, Backblaze B2, Google Cloud Storage
 * interoperability API). Time is passed in explicitly so signatures are reproducible.
 */

#ifndef SIGV4_SIGNER_HPP
#define SIGV4_SIGNER_HPP

#include <chrono>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Credentials and scope used to sign requests.
 */
struct SigV4Credentials {
    std::string accessKeyId;
    std::string secretAccessKey;
    std::string sessionToken;       ///< Optional STS token.
    std::string region;
    std::string service = "s3";
};

/**
 * @brief Produces SigV4 Authorization headers and presigned query strings.
 */
class SigV4Signer {
public:
    explicit SigV4Signer(SigV4Credentials credentials);

    /**
     * @brief Builds the headers that authorize a request.
     *
     * @param method HTTP verb.
     * @param host Host header value (host[:port]).
     * @param canonicalUri URI-encoded absolute path.
     * @param query Unencoded query parameters.
     * @param payloadHash Hex SHA-256 of the body, or "UNSIGNED-PAYLOAD".
     * @param now Signing time.
     * @return "Name: value" lines: Authorization, x-amz-date, x-amz-content-sha256 and the
     * session token header when present.
     */
    std::vector<std::string> signHeaders(const std::string& method,
                                         const std::string& host,
                                         const std::string& canonicalUri,
                                         const std::map<std::string, std::string>& query,
                                         const std::string& payloadHash,
                                         std::chrono::system_clock::time_point now) const;

    /**
     * @brief Builds a presigned query string (without leading '?') for a GET style URL.
     *
     * @param expires Validity, at most seven days on AWS.
     */
    std::string presignQuery(const std::string& method,
                             const std::string& host,
                             const std::string& canonicalUri,
                             std::chrono::seconds expires,
                             std::chrono::system_clock::time_point now) const;

    /**
     * @brief Encodes and sorts query parameters per SigV4 rules.
     */
    static std::string canonicalQueryString(const std::map<std::string, std::string>& query);

    static std::string amzDate(std::chrono::system_clock::time_point time);

private:
    std::string credentialScope(const std::string& date) const;
    std::string signature(const std::string& date, const std::string& stringToSign) const;

    SigV4Credentials credentials_;
};

#endif // SIGV4_SIGNER_HPP
