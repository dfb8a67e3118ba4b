#include "sigv4_signer.hpp"
#include "crypto_util.hpp"
#include <algorithm>
#include <ctime>
#include <utility>

namespace {

const char kAlgorithm[] = "AWS4-HMAC-SHA256";

} // namespace

SigV4Signer::SigV4Signer(SigV4Credentials credentials) : credentials_(std::move(credentials)) {}

std::string SigV4Signer::amzDate(std::chrono::system_clock::time_point time) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm tmUtc{};
    gmtime_r(&timeT, &tmUtc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tmUtc);
    return buf;
}

std::string SigV4Signer::canonicalQueryString(const std::map<std::string, std::string>& query) {
    std::vector<std::pair<std::string, std::string>> encoded;
    encoded.reserve(query.size());
    for (const auto& [key, value] : query) {
        encoded.emplace_back(uriEncode(key), uriEncode(value));
    }
    std::sort(encoded.begin(), encoded.end());

    std::string result;
    for (const auto& [key, value] : encoded) {
        if (!result.empty()) {
            result += '&';
        }
        result += key + "=" + value;
    }
    return result;
}

std::string SigV4Signer::credentialScope(const std::string& date) const {
    return date + "/" + credentials_.region + "/" + credentials_.service + "/aws4_request";
}

std::string SigV4Signer::signature(const std::string& date, const std::string& stringToSign) const {
    std::string kDate = hmacSha256("AWS4" + credentials_.secretAccessKey, date);
    std::string kRegion = hmacSha256(kDate, credentials_.region);
    std::string kService = hmacSha256(kRegion, credentials_.service);
    std::string kSigning = hmacSha256(kService, "aws4_request");
    return toHex(hmacSha256(kSigning, stringToSign));
}

std::vector<std::string> SigV4Signer::signHeaders(const std::string& method,
                                                  const std::string& host,
                                                  const std::string& canonicalUri,
                                                  const std::map<std::string, std::string>& query,
                                                  const std::string& payloadHash,
                                                  std::chrono::system_clock::time_point now) const {
    std::string timestamp = amzDate(now);
    std::string date = timestamp.substr(0, 8);

    // Canonical headers must be sorted by lower-case name.
    std::map<std::string, std::string> headers = {
        {"host", host},
        {"x-amz-content-sha256", payloadHash},
        {"x-amz-date", timestamp},
    };
    if (!credentials_.sessionToken.empty()) {
        headers["x-amz-security-token"] = credentials_.sessionToken;
    }

    std::string canonicalHeaders;
    std::string signedHeaders;
    for (const auto& [name, value] : headers) {
        canonicalHeaders += name + ":" + value + "\n";
        if (!signedHeaders.empty()) {
            signedHeaders += ';';
        }
        signedHeaders += name;
    }

    std::string canonicalRequest = method + "\n" + canonicalUri + "\n" + canonicalQueryString(query) + "\n" +
                                   canonicalHeaders + "\n" + signedHeaders + "\n" + payloadHash;
    std::string scope = credentialScope(date);
    std::string stringToSign = std::string(kAlgorithm) + "\n" + timestamp + "\n" + scope + "\n" + sha256Hex(canonicalRequest);

    std::vector<std::string> result;
    result.push_back("Authorization: " + std::string(kAlgorithm) + " Credential=" + credentials_.accessKeyId + "/" + scope +
                     ", SignedHeaders=" + signedHeaders + ", Signature=" + signature(date, stringToSign));
    result.push_back("x-amz-date: " + timestamp);
    result.push_back("x-amz-content-sha256: " + payloadHash);
    if (!credentials_.sessionToken.empty()) {
        result.push_back("x-amz-security-token: " + credentials_.sessionToken);
    }
    return result;
}

std::string SigV4Signer::presignQuery(const std::string& method,
                                      const std::string& host,
                                      const std::string& canonicalUri,
                                      std::chrono::seconds expires,
                                      std::chrono::system_clock::time_point now) const {
    std::string timestamp = amzDate(now);
    std::string date = timestamp.substr(0, 8);
    std::string scope = credentialScope(date);

    std::map<std::string, std::string> query = {
        {"X-Amz-Algorithm", kAlgorithm},
        {"X-Amz-Credential", credentials_.accessKeyId + "/" + scope},
        {"X-Amz-Date", timestamp},
        {"X-Amz-Expires", std::to_string(expires.count())},
        {"X-Amz-SignedHeaders", "host"},
    };
    if (!credentials_.sessionToken.empty()) {
        query["X-Amz-Security-Token"] = credentials_.sessionToken;
    }

    std::string canonicalQuery = canonicalQueryString(query);
    std::string canonicalRequest = method + "\n" + canonicalUri + "\n" + canonicalQuery + "\n" +
                                   "host:" + host + "\n\nhost\nUNSIGNED-PAYLOAD";
    std::string stringToSign = std::string(kAlgorithm) + "\n" + timestamp + "\n" + scope + "\n" + sha256Hex(canonicalRequest);
    return canonicalQuery + "&X-Amz-Signature=" + signature(date, stringToSign);
}
