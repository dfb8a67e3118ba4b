#include "http_client.hpp"
#include "crypto_util.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;

namespace {

std::once_flag gCurlInitFlag;

/**
 * @brief Routes the response body to a file for 2xx responses, to memory otherwise.
 */
struct ResponseSink {
    CURL* curl = nullptr;
    const std::string* filePath = nullptr;
    std::ofstream file;
    std::string* body = nullptr;
    enum class Mode { Undecided, File, Memory } mode = Mode::Undecided;
    bool writeFailed = false;
};

struct CancelState {
    const std::atomic<bool>* flag = nullptr;
};

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userp) {
    auto* sink = static_cast<ResponseSink*>(userp);
    size_t total = size * nmemb;
    if (sink->mode == ResponseSink::Mode::Undecided) {
        long status = 0;
        curl_easy_getinfo(sink->curl, CURLINFO_RESPONSE_CODE, &status);
        if (sink->filePath && status >= 200 && status < 300) {
            sink->file.open(*sink->filePath, std::ios::binary | std::ios::trunc);
            if (!sink->file) {
                sink->writeFailed = true;
                return 0;
            }
            sink->mode = ResponseSink::Mode::File;
        } else {
            sink->mode = ResponseSink::Mode::Memory;
        }
    }
    if (sink->mode == ResponseSink::Mode::File) {
        sink->file.write(ptr, static_cast<std::streamsize>(total));
        if (!sink->file) {
            sink->writeFailed = true;
            return 0;
        }
    } else {
        sink->body->append(ptr, total);
    }
    return total;
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);
    size_t total = size * nitems;
    std::string line(buffer, total);
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total;
    }
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        std::string value = line.substr(colon + 1);
        auto first = value.find_first_not_of(" \t");
        auto last = value.find_last_not_of(" \t\r\n");
        value = (first == std::string::npos) ? "" : value.substr(first, last - first + 1);
        (*headers)[name] = value;
    }
    return total;
}

size_t readCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* input = static_cast<std::ifstream*>(userp);
    input->read(buffer, static_cast<std::streamsize>(size * nitems));
    if (input->bad()) {
        return CURL_READFUNC_ABORT;
    }
    return static_cast<size_t>(input->gcount());
}

int progressCallback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<CancelState*>(userp);
    return (state->flag && state->flag->load()) ? 1 : 0;
}

bool hasHeader(const std::vector<std::string>& headers, const std::string& lowerName) {
    return std::any_of(headers.begin(), headers.end(), [&](const std::string& header) {
        if (header.size() < lowerName.size() + 1) return false;
        for (size_t i = 0; i < lowerName.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(header[i])) != lowerName[i]) return false;
        }
        return header[lowerName.size()] == ':';
    });
}

} // namespace

std::optional<std::string> HttpResponse::header(const std::string& lowerName) const {
    auto it = headers.find(lowerName);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

HttpClient::HttpClient() {
    std::call_once(gCurlInitFlag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpClient::~HttpClient() {
    reset();
}

void HttpClient::reset() {
    if (curl_) {
        curl_easy_cleanup(static_cast<CURL*>(curl_));
        curl_ = nullptr;
    }
}

Result<HttpResponse> HttpClient::perform(const HttpRequest& request) {
    if (!curl_) {
        curl_ = curl_easy_init();
        if (!curl_) {
            return makeError(ErrorKind::Transfer, "Failed to initialize CURL");
        }
    }
    CURL* curl = static_cast<CURL*>(curl_);
    curl_easy_reset(curl);

    HttpResponse response;
    std::string partPath;
    ResponseSink sink;
    sink.curl = curl;
    sink.body = &response.body;
    if (request.downloadFile) {
        fs::path target(*request.downloadFile);
        std::error_code ec;
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path(), ec);
            if (ec) {
                return makeError(ErrorKind::Io, "Failed to create directory " + target.parent_path().string() + ": " + ec.message());
            }
        }
        partPath = *request.downloadFile + ".part";
        sink.filePath = &partPath;
    }

    std::vector<std::string> headerLines = request.headers;
    std::ifstream uploadStream;
    if (request.uploadFile) {
        uploadStream.open(*request.uploadFile, std::ios::binary);
        if (!uploadStream) {
            return makeError(ErrorKind::Io, "Failed to open local file: " + *request.uploadFile);
        }
        std::error_code ec;
        auto fileSize = fs::file_size(*request.uploadFile, ec);
        if (ec) {
            return makeError(ErrorKind::Io, "Failed to stat local file: " + *request.uploadFile);
        }
        curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(curl, CURLOPT_READFUNCTION, readCallback);
        curl_easy_setopt(curl, CURLOPT_READDATA, &uploadStream);
        curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(fileSize));
        if (request.method != "PUT") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
        headerLines.push_back("Expect:");
    } else if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        if (request.method != "POST") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
        if (!hasHeader(headerLines, "content-type")) {
            // libcurl would otherwise send a form content type.
            headerLines.push_back("Content-Type:");
        }
    }

    struct curl_slist* headerList = nullptr;
    for (const auto& line : headerLines) {
        headerList = curl_slist_append(headerList, line.c_str());
    }

    CancelState cancelState{cancelFlag_};
    char errorBuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &cancelState);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuf);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "ReStore/1.0");
    if (timeoutSeconds_ > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
    }

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(headerList);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    if (sink.file.is_open()) {
        sink.file.close();
    }

    auto discardPart = [&partPath] {
        if (!partPath.empty()) {
            std::error_code ec;
            fs::remove(partPath, ec);
        }
    };

    if (res != CURLE_OK) {
        discardPart();
        if (res == CURLE_ABORTED_BY_CALLBACK && cancelFlag_ && cancelFlag_->load()) {
            return makeError(ErrorKind::Cancelled, "Transfer cancelled: " + request.url);
        }
        if (sink.writeFailed) {
            return makeError(ErrorKind::Io, "Failed to write downloaded data to " + partPath);
        }
        std::string detail = errorBuf[0] ? errorBuf : curl_easy_strerror(res);
        return makeError(ErrorKind::Transfer, "HTTP " + request.method + " failed: " + detail);
    }

    if (request.downloadFile) {
        if (!response.ok()) {
            discardPart();
            return response;
        }
        if (sink.mode == ResponseSink::Mode::Undecided) {
            std::ofstream empty(partPath, std::ios::binary | std::ios::trunc);
            if (!empty) {
                return makeError(ErrorKind::Io, "Failed to create " + partPath);
            }
        }
        std::error_code ec;
        fs::rename(partPath, *request.downloadFile, ec);
        if (ec) {
            discardPart();
            return makeError(ErrorKind::Io, "Failed to move download into place: " + ec.message());
        }
    }
    return response;
}

std::string HttpClient::formEncode(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string encoded;
    for (const auto& [key, value] : fields) {
        if (!encoded.empty()) {
            encoded += '&';
        }
        encoded += uriEncode(key) + "=" + uriEncode(value);
    }
    return encoded;
}
