#include <gtest/gtest.h>
#include <algorithm>
#include <ostream>
#include "azure_storage.hpp"
#include "drive_storage.hpp"
#include "dropbox_storage.hpp"
#include "github_storage.hpp"
#include "object_storage.hpp"
#include "test_support.hpp"

using testsupport::readFile;
using testsupport::writeFile;

namespace {

const char kObjectKey[] = "backups/docs/docs_20240101_000000.tar.gz";

/**
 * @brief Server behaviour shared by a test and its transport.
 */
struct HttpScript {
    bool missing = false;                       ///< The object under test does not exist.
    long writeStatus = 200;                     ///< Status answered to object writes.
    std::string content = "remote payload";
    std::vector<HttpRequest> requests;
    std::function<HttpResponse(const HttpRequest&, const HttpScript&)> respond;
};

/**
 * @brief Transport answering from an HttpScript instead of the network.
 *
 * Like HttpClient, a 2xx body is written to the request's downloadFile and dropped.
 */
class ScriptedTransport : public HttpTransport {
public:
    explicit ScriptedTransport(HttpScript& script) : script_(script) {}

    Result<HttpResponse> perform(const HttpRequest& request) override {
        script_.requests.push_back(request);
        HttpResponse response = script_.respond(request, script_);
        if (request.downloadFile && response.ok()) {
            writeFile(*request.downloadFile, response.body);
            response.body.clear();
        }
        return response;
    }

    void setCancelFlag(const std::atomic<bool>*) override {}
    void reset() override {}

private:
    HttpScript& script_;
};

HttpResponse reply(long status, std::string body = "") {
    HttpResponse response;
    response.status = status;
    response.body = std::move(body);
    return response;
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

bool hasHeader(const HttpRequest& request, const std::string& line) {
    return std::find(request.headers.begin(), request.headers.end(), line) != request.headers.end();
}

HttpResponse rejectedWrite(const HttpScript& script) {
    return reply(script.writeStatus, script.writeStatus >= 300 ? "write rejected" : "");
}

// S3, B2, GCS and Azure: container-level requests succeed, object requests follow the script.
HttpResponse objectStoreServer(const HttpRequest& request, const HttpScript& script) {
    if (!contains(request.url, "/backups/")) {
        return reply(request.method == "PUT" ? 201 : 200);
    }
    if (request.method == "PUT") {
        return rejectedWrite(script);
    }
    if (script.missing) {
        return reply(404, "<Error><Code>NoSuchKey</Code></Error>");
    }
    if (request.method == "GET") {
        return reply(200, script.content);
    }
    return reply(request.method == "DELETE" ? 204 : 200);
}

HttpResponse githubServer(const HttpRequest& request, const HttpScript& script) {
    if (!contains(request.url, "/contents/")) {
        return reply(200, R"({"full_name":"owner/repo"})");
    }
    if (request.method == "PUT") {
        return rejectedWrite(script);
    }
    if (script.missing) {
        return reply(404, R"({"message":"Not Found"})");
    }
    if (request.method == "GET") {
        if (hasHeader(request, "Accept: application/vnd.github.raw")) {
            return reply(200, script.content);
        }
        return reply(200, R"({"type":"file","sha":"3b18e512dba79e4c8300dd08aeb37f8e728b8dad"})");
    }
    return reply(200, R"({"commit":{}})");
}

HttpResponse driveServer(const HttpRequest& request, const HttpScript& script) {
    if (contains(request.url, "oauth2.googleapis.com")) {
        return reply(200, R"({"access_token":"drive-token","expires_in":3599})");
    }
    if (request.method == "GET" && contains(request.url, "?q=")) {
        // File lookups filter on "mimeType != folder", folder lookups on "mimeType = folder".
        bool fileLookup = contains(request.url, "%21%3D");
        if (!fileLookup) {
            return reply(200, R"({"files":[{"id":"folder-1","name":"folder"}]})");
        }
        if (script.missing) {
            return reply(200, R"({"files":[]})");
        }
        return reply(200, R"({"files":[{"id":"file-1","name":"file"}]})");
    }
    if (request.method == "POST") {
        return reply(200, R"({"id":"file-1"})");
    }
    if (request.method == "PATCH") {
        return rejectedWrite(script);
    }
    if (request.method == "DELETE") {
        return reply(204);
    }
    return reply(200, script.content);
}

HttpResponse dropboxServer(const HttpRequest& request, const HttpScript& script) {
    if (contains(request.url, "users/get_current_account")) {
        return reply(200, R"({"name":{"display_name":"Backup Account"}})");
    }
    if (contains(request.url, "files/upload")) {
        return rejectedWrite(script);
    }
    if (script.missing) {
        return reply(409, R"({"error_summary":"path/not_found/","error":{".tag":"path","path":{".tag":"not_found"}}})");
    }
    if (contains(request.url, "files/download")) {
        return reply(200, script.content);
    }
    return reply(200, R"({".tag":"file","name":"a"})");
}

using BackendMaker = std::function<std::unique_ptr<StorageBackend>(Logger&, std::unique_ptr<HttpTransport>)>;

template <typename Backend>
BackendMaker maker() {
    return [](Logger& logger, std::unique_ptr<HttpTransport> transport) -> std::unique_ptr<StorageBackend> {
        return std::make_unique<Backend>(logger, std::move(transport));
    };
}

struct BackendCase {
    std::string name;
    BackendMaker make;
    StorageOptions options;
    std::function<HttpResponse(const HttpRequest&, const HttpScript&)> server;
};

void PrintTo(const BackendCase& backendCase, std::ostream* os) {
    *os << backendCase.name;
}

std::vector<BackendCase> httpBackends() {
    return {
        {"s3", maker<S3Storage>(),
         {{"accessKeyId", "AKIDEXAMPLE"}, {"secretAccessKey", "secret"}, {"region", "us-east-1"}, {"bucketName", "bucket"}},
         objectStoreServer},
        {"b2", maker<B2Storage>(),
         {{"keyId", "key-id"}, {"applicationKey", "app-key"}, {"serviceUrl", "https://s3.us-west-004.backblazeb2.com"},
          {"bucketName", "bucket"}},
         objectStoreServer},
        {"gcp", maker<GcsStorage>(),
         {{"bucketName", "bucket"}, {"hmacAccessId", "GOOG1EXAMPLE"}, {"hmacSecret", "secret"}},
         objectStoreServer},
        {"azure", maker<AzureStorage>(),
         {{"connectionString", "DefaultEndpointsProtocol=https;AccountName=account;AccountKey=c2VjcmV0;EndpointSuffix=core.windows.net"},
          {"containerName", "container"}},
         objectStoreServer},
        {"github", maker<GitHubStorage>(),
         {{"token", "ghp_token"}, {"owner", "owner"}, {"repo", "repo"}},
         githubServer},
        {"gdrive", maker<DriveStorage>(),
         {{"client_id", "client"}, {"client_secret", "secret"}, {"refresh_token", "refresh"}},
         driveServer},
        {"dropbox", maker<DropboxStorage>(),
         {{"accessToken", "sl.token"}},
         dropboxServer},
    };
}

} // namespace

class HttpBackendContractTest : public testsupport::ScratchTest, public ::testing::WithParamInterface<BackendCase> {
protected:
    void SetUp() override {
        ScratchTest::SetUp();
        script_.respond = GetParam().server;
        storage_ = GetParam().make(*logger_, std::make_unique<ScriptedTransport>(script_));
        auto initialized = storage_->initialize(GetParam().options);
        ASSERT_TRUE(initialized.has_value()) << initialized.error().describe();
        writeFile(path("archive.tar.gz"), "local archive bytes");
    }

    HttpScript script_;
    std::unique_ptr<StorageBackend> storage_;
};

TEST_P(HttpBackendContractTest, DownloadOfMissingObjectIsNotFound) {
    script_.missing = true;
    auto downloaded = storage_->download(kObjectKey, path("out/archive.tar.gz").string());
    ASSERT_FALSE(downloaded.has_value());
    EXPECT_EQ(downloaded.error().kind, ErrorKind::NotFound) << downloaded.error().describe();
    EXPECT_FALSE(std::filesystem::exists(path("out/archive.tar.gz")));
}

TEST_P(HttpBackendContractTest, ExistsOfMissingObjectIsFalse) {
    script_.missing = true;
    auto found = storage_->exists(kObjectKey);
    ASSERT_TRUE(found.has_value()) << found.error().describe();
    EXPECT_FALSE(*found);
}

TEST_P(HttpBackendContractTest, RemoveOfMissingObjectSucceeds) {
    script_.missing = true;
    auto removed = storage_->remove(kObjectKey);
    EXPECT_TRUE(removed.has_value()) << removed.error().describe();
}

TEST_P(HttpBackendContractTest, RejectedUploadIsTransferError) {
    script_.writeStatus = 500;
    auto uploaded = storage_->upload(path("archive.tar.gz").string(), kObjectKey);
    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().kind, ErrorKind::Transfer);

    // A 404 answered to a write is still a failed transfer, not a missing object.
    script_.writeStatus = 404;
    uploaded = storage_->upload(path("archive.tar.gz").string(), kObjectKey);
    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().kind, ErrorKind::Transfer);
}

TEST_P(HttpBackendContractTest, AcceptedUploadSucceeds) {
    script_.writeStatus = 201;
    auto uploaded = storage_->upload(path("archive.tar.gz").string(), kObjectKey);
    EXPECT_TRUE(uploaded.has_value()) << uploaded.error().describe();
}

TEST_P(HttpBackendContractTest, ExistingObjectIsFoundAndDownloaded) {
    auto found = storage_->exists(kObjectKey);
    ASSERT_TRUE(found.has_value()) << found.error().describe();
    EXPECT_TRUE(*found);

    auto downloaded = storage_->download(kObjectKey, path("out/archive.tar.gz").string());
    ASSERT_TRUE(downloaded.has_value()) << downloaded.error().describe();
    EXPECT_EQ(readFile(path("out/archive.tar.gz")), "remote payload");
}

TEST_P(HttpBackendContractTest, UploadOfMissingLocalFileIsNotFound) {
    auto uploaded = storage_->upload(path("absent.tar.gz").string(), kObjectKey);
    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().kind, ErrorKind::NotFound);
}

INSTANTIATE_TEST_SUITE_P(HttpBackends, HttpBackendContractTest, ::testing::ValuesIn(httpBackends()),
                         [](const ::testing::TestParamInfo<BackendCase>& info) { return info.param.name; });

class DropboxStorageTest : public testsupport::ScratchTest {
protected:
    void SetUp() override {
        ScratchTest::SetUp();
        script_.respond = dropboxServer;
        storage_ = std::make_unique<DropboxStorage>(*logger_, std::make_unique<ScriptedTransport>(script_));
        ASSERT_TRUE(storage_->initialize({{"accessToken", "sl.token"}}).has_value());
    }

    HttpScript script_;
    std::unique_ptr<DropboxStorage> storage_;
};

TEST_F(DropboxStorageTest, ConflictOtherThanNotFoundIsTransferError) {
    script_.respond = [](const HttpRequest&, const HttpScript&) {
        return reply(409, R"({"error_summary":"path_lookup/restricted_content/"})");
    };
    auto removed = storage_->remove(kObjectKey);
    ASSERT_FALSE(removed.has_value());
    EXPECT_EQ(removed.error().kind, ErrorKind::Transfer);

    auto found = storage_->exists(kObjectKey);
    ASSERT_FALSE(found.has_value());
    EXPECT_EQ(found.error().kind, ErrorKind::Transfer);
}

TEST_F(DropboxStorageTest, PathsAreRootedAtSlash) {
    script_.requests.clear();
    ASSERT_TRUE(storage_->exists("backups/a.tar").has_value());
    ASSERT_EQ(script_.requests.size(), 1u);
    EXPECT_TRUE(contains(script_.requests[0].body, R"("path":"/backups/a.tar")"));
    EXPECT_TRUE(hasHeader(script_.requests[0], "Authorization: Bearer sl.token"));
}

TEST_F(DropboxStorageTest, RejectedTokenIsConfigurationError) {
    HttpScript script;
    script.respond = [](const HttpRequest&, const HttpScript&) { return reply(401, R"({"error_summary":"invalid_access_token/"})"); };
    DropboxStorage storage(*logger_, std::make_unique<ScriptedTransport>(script));
    auto initialized = storage.initialize({{"accessToken", "expired"}});
    ASSERT_FALSE(initialized.has_value());
    EXPECT_EQ(initialized.error().kind, ErrorKind::Configuration);
}

namespace {

/**
 * @brief Minimal HTTP backend exposing the status-to-error mapping.
 */
class StatusMappingBackend : public HttpStorageBackend {
public:
    using HttpStorageBackend::HttpStorageBackend;

    std::string name() const override { return "mapping"; }
    Result<void> initialize(const StorageOptions&) override { return {}; }
    Result<void> upload(const std::string&, const std::string&) override { return {}; }
    Result<void> download(const std::string&, const std::string&) override { return {}; }
    Result<bool> exists(const std::string&) override { return true; }
    Result<void> remove(const std::string&) override { return {}; }

    BackupError errorFor(long status, const std::string& body = "") const {
        return httpError("download", "backups/a.tar", reply(status, body));
    }
};

} // namespace

class HttpErrorMappingTest : public testsupport::ScratchTest {
protected:
    void SetUp() override {
        ScratchTest::SetUp();
        backend_ = std::make_unique<StatusMappingBackend>(*logger_, std::make_unique<ScriptedTransport>(script_));
    }

    HttpScript script_;
    std::unique_ptr<StatusMappingBackend> backend_;
};

TEST_F(HttpErrorMappingTest, NotFoundStatusMapsToNotFound) {
    EXPECT_EQ(backend_->errorFor(404).kind, ErrorKind::NotFound);
}

TEST_F(HttpErrorMappingTest, OtherStatusesMapToTransfer) {
    for (long status : {400L, 401L, 403L, 409L, 429L, 500L, 503L}) {
        EXPECT_EQ(backend_->errorFor(status).kind, ErrorKind::Transfer) << "HTTP " << status;
    }
}

TEST_F(HttpErrorMappingTest, MessageNamesBackendOperationAndStatus) {
    auto error = backend_->errorFor(503, "Slow Down");
    EXPECT_TRUE(contains(error.message, "mapping download failed for 'backups/a.tar'")) << error.message;
    EXPECT_TRUE(contains(error.message, "HTTP 503")) << error.message;
    EXPECT_TRUE(contains(error.message, "Slow Down")) << error.message;
    EXPECT_TRUE(error.stage.empty());
}

TEST_F(HttpErrorMappingTest, LongBodyIsTruncated) {
    auto error = backend_->errorFor(500, std::string(2000, 'x'));
    EXPECT_TRUE(contains(error.message, std::string(512, 'x')));
    EXPECT_FALSE(contains(error.message, std::string(513, 'x')));
}
