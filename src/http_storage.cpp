#include "http_storage.hpp"
#include <memory>
#include <sstream>

BackupError HttpStorageBackend::httpError(const std::string& operation, const std::string& target, const HttpResponse& response) const {
    std::string body = response.body.substr(0, 512);
    std::string message = name() + " " + operation + " failed for '" + target + "' (HTTP " +
                          std::to_string(response.status) + ")";
    if (!body.empty()) {
        message += ": " + body;
    }
    ErrorKind kind = response.status == 404 ? ErrorKind::NotFound : ErrorKind::Transfer;
    return BackupError{kind, message, {}};
}

Result<Json::Value> HttpStorageBackend::parseJson(const std::string& body) {
    Json::Value value;
    Json::Reader reader;
    if (!reader.parse(body, value)) {
        return makeError(ErrorKind::Transfer, "Invalid JSON response: " + reader.getFormattedErrorMessages());
    }
    return value;
}

std::string HttpStorageBackend::toJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    std::ostringstream out;
    writer->write(value, &out);
    return out.str();
}
