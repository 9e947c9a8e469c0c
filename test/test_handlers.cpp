#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include "nostrfs/server/server.hpp"
#include "nostrfs/server/storage/file_storage.hpp"
#include "test_utils.hpp"

using namespace nostrfs;
using namespace nostrfs::server;

namespace {

const std::string PUBKEY = "f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9";
const std::string OTHER = "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";

Request makeRequest(const std::string& method, const std::string& path,
                    const std::string& authorization = "", const std::string& body = "") {
    Request request;
    request.method = method;
    request.path = path;
    if (!authorization.empty()) {
        request.headers["Authorization"] = authorization;
    }
    request.bodyReader = test::StringBody(body);
    return request;
}

void requireCors(const Response& response) {
    REQUIRE(response.headers.at("Access-Control-Allow-Origin") == "*");
    REQUIRE(response.headers.at("Access-Control-Allow-Methods") == "GET, PUT, OPTIONS");
    REQUIRE(response.headers.at("Access-Control-Allow-Headers") == "Content-Type, Authorization");
}

// 基于临时目录的服务器
struct ServerFixture {
    test::TempDir dir;
    storage::FileStorageService storage{dir.String()};
    crypto::SchnorrVerifier verifier;
    std::unique_ptr<Server> server;

    ServerFixture() {
        Config config;
        config.addr = "127.0.0.1:0";
        config.rootDir = dir.String();
        config.logging.level = "error";
        config.verifier = &verifier;
        config.storageService = &storage;
        server = std::make_unique<Server>(config);
    }
};

// 在真实存储之上按需注入失败
class FaultyStorage : public StorageService {
public:
    explicit FaultyStorage(StorageService& inner) : inner_(inner) {}

    bool failMkdir = false;
    bool failOpen = false;
    bool failWrite = false;
    bool failCommit = false;

    Result<bool> EnsureParentDirectory(const std::string& requestPath) override {
        if (failMkdir) {
            return nostrfs::Error("mkdir: permission denied");
        }
        return inner_.EnsureParentDirectory(requestPath);
    }

    Result<std::shared_ptr<FileWriter>> OpenWriter(const std::string& requestPath) override {
        if (failOpen) {
            return nostrfs::Error("open: no space left on device");
        }
        auto writer = inner_.OpenWriter(requestPath);
        if (!writer.ok()) {
            return writer.error();
        }
        return std::shared_ptr<FileWriter>(std::make_shared<FaultyWriter>(writer.value(), *this));
    }

    Result<std::string> ReadFile(const std::string& requestPath) override {
        return inner_.ReadFile(requestPath);
    }

private:
    class FaultyWriter : public FileWriter {
    public:
        FaultyWriter(std::shared_ptr<FileWriter> inner, const FaultyStorage& owner)
            : inner_(std::move(inner)), owner_(owner) {}

        nostrfs::Error Write(const char* data, size_t length) override {
            if (owner_.failWrite) {
                return nostrfs::Error("write: I/O error");
            }
            return inner_->Write(data, length);
        }

        nostrfs::Error Commit() override {
            if (owner_.failCommit) {
                inner_->Abort();
                return nostrfs::Error("rename: I/O error");
            }
            return inner_->Commit();
        }

        void Abort() override { inner_->Abort(); }

    private:
        std::shared_ptr<FileWriter> inner_;
        const FaultyStorage& owner_;
    };

    StorageService& inner_;
};

} // namespace

TEST_CASE("Handlers - Upload and read back", "[handlers]") {
    ServerFixture fixture;
    std::string header = test::SignedHeader(test::SecretKey(3));
    REQUIRE_FALSE(header.empty());

    SECTION("Upload to own directory then read") {
        Response put = fixture.server->Dispatch(makeRequest("PUT", "/" + PUBKEY, header, "hello"));
        REQUIRE(put.status == 201);
        REQUIRE(put.body == "File created");
        requireCors(put);

        Response get = fixture.server->Dispatch(makeRequest("GET", "/" + PUBKEY));
        REQUIRE(get.status == 200);
        REQUIRE(get.body == "hello");
        REQUIRE(get.headers.at("Content-Type") == "application/octet-stream");
        requireCors(get);
    }

    SECTION("Header names are case-insensitive") {
        Request request = makeRequest("PUT", "/" + PUBKEY, "", "x");
        request.headers["authorization"] = header;
        REQUIRE(fixture.server->Dispatch(request).status == 201);
    }

    SECTION("Second upload overwrites") {
        REQUIRE(fixture.server->Dispatch(makeRequest("PUT", "/" + PUBKEY, header, "first")).status == 201);
        REQUIRE(fixture.server->Dispatch(makeRequest("PUT", "/" + PUBKEY, header, "second")).status == 201);
        Response get = fixture.server->Dispatch(makeRequest("GET", "/" + PUBKEY));
        REQUIRE(get.body == "second");
    }

    SECTION("Empty body upload") {
        REQUIRE(fixture.server->Dispatch(makeRequest("PUT", "/" + PUBKEY, header, "")).status == 201);
        Response get = fixture.server->Dispatch(makeRequest("GET", "/" + PUBKEY));
        REQUIRE(get.status == 200);
        REQUIRE(get.body.empty());
    }

    SECTION("Trailing slash") {
        REQUIRE(fixture.server->Dispatch(makeRequest("PUT", "/" + PUBKEY + "/", header, "x")).status == 201);
    }
}

TEST_CASE("Handlers - Rejected uploads", "[handlers]") {
    ServerFixture fixture;
    std::string header = test::SignedHeader(test::SecretKey(3));

    SECTION("Missing authorization header") {
        Response resp = fixture.server->Dispatch(makeRequest("PUT", "/" + PUBKEY, "", "hello"));
        REQUIRE(resp.status == 401);
        REQUIRE(resp.headers.at("Content-Type") == "text/plain");
        requireCors(resp);
    }

    SECTION("Invalid signature") {
        crypto::Event event;
        test::SignedHeader(test::SecretKey(3), &event);
        event.sig = std::string(128, 'a');
        Response resp = fixture.server->Dispatch(makeRequest("PUT", "/" + PUBKEY, test::EncodeHeader(event), "hello"));
        REQUIRE(resp.status == 401);
        REQUIRE_FALSE(std::filesystem::exists(fixture.dir.Path() / PUBKEY));
    }

    SECTION("Authorization header with other scheme") {
        Response resp = fixture.server->Dispatch(makeRequest("PUT", "/" + PUBKEY, "Bearer abc", "hello"));
        REQUIRE(resp.status == 401);
    }

    SECTION("Write to another identity's directory") {
        Response resp = fixture.server->Dispatch(makeRequest("PUT", "/" + OTHER, header, "hello"));
        REQUIRE(resp.status == 403);
        REQUIRE(resp.body == "Forbidden: wrong pubkey");
        requireCors(resp);
        REQUIRE_FALSE(std::filesystem::exists(fixture.dir.Path() / OTHER));
    }

    SECTION("Write to sub-path of own directory") {
        Response resp = fixture.server->Dispatch(makeRequest("PUT", "/" + PUBKEY + "/notes.json", header, "{}"));
        REQUIRE(resp.status == 403);
        REQUIRE(resp.body == "Forbidden: target directory structure is invalid");
        REQUIRE_FALSE(std::filesystem::exists(fixture.dir.Path() / PUBKEY));
    }

    SECTION("Client disconnects mid-upload") {
        Request request = makeRequest("PUT", "/" + PUBKEY, header);
        request.bodyReader = test::AbortedBody("partial");
        Response resp = fixture.server->Dispatch(request);
        REQUIRE(resp.status == 500);
        REQUIRE_FALSE(std::filesystem::exists(fixture.dir.Path() / PUBKEY));
        REQUIRE(std::filesystem::is_empty(fixture.dir.Path()));
    }

    SECTION("Disconnect keeps existing file") {
        REQUIRE(fixture.server->Dispatch(makeRequest("PUT", "/" + PUBKEY, header, "kept")).status == 201);
        Request request = makeRequest("PUT", "/" + PUBKEY, header);
        request.bodyReader = test::AbortedBody("partial");
        REQUIRE(fixture.server->Dispatch(request).status == 500);
        REQUIRE(fixture.server->Dispatch(makeRequest("GET", "/" + PUBKEY)).body == "kept");
    }
}

TEST_CASE("Handlers - Read", "[handlers]") {
    ServerFixture fixture;

    SECTION("Missing file") {
        Response resp = fixture.server->Dispatch(makeRequest("GET", "/missing"));
        REQUIRE(resp.status == 404);
        REQUIRE(resp.body == "File not found");
        requireCors(resp);
    }

    SECTION("Public read with content type by extension") {
        std::filesystem::create_directories(fixture.dir.Path() / "shared");
        {
            std::ofstream(fixture.dir.Path() / "shared" / "notes.json") << "{\"a\":1}";
            std::ofstream(fixture.dir.Path() / "shared" / "index.html") << "<p>hi</p>";
            std::ofstream(fixture.dir.Path() / "shared" / "readme.txt") << "text";
        }
        Response json = fixture.server->Dispatch(makeRequest("GET", "/shared/notes.json"));
        REQUIRE(json.status == 200);
        REQUIRE(json.body == "{\"a\":1}");
        REQUIRE(json.headers.at("Content-Type") == "application/json");
        REQUIRE(fixture.server->Dispatch(makeRequest("GET", "/shared/index.html")).headers.at("Content-Type") == "text/html");
        REQUIRE(fixture.server->Dispatch(makeRequest("GET", "/shared/readme.txt")).headers.at("Content-Type") == "text/plain");
    }

    SECTION("Cannot read outside storage root") {
        Response resp = fixture.server->Dispatch(makeRequest("GET", "/../etc/passwd"));
        REQUIRE(resp.status == 404);
    }

    SECTION("Directory is not readable as file") {
        std::filesystem::create_directories(fixture.dir.Path() / "somedir");
        REQUIRE(fixture.server->Dispatch(makeRequest("GET", "/somedir")).status == 404);
    }
}

TEST_CASE("Handlers - Preflight and unknown routes", "[handlers]") {
    ServerFixture fixture;

    SECTION("OPTIONS returns 204 with CORS headers") {
        Response resp = fixture.server->Dispatch(makeRequest("OPTIONS", "/anything/here"));
        REQUIRE(resp.status == 204);
        REQUIRE(resp.body.empty());
        requireCors(resp);
    }

    SECTION("OPTIONS on root path") {
        REQUIRE(fixture.server->Dispatch(makeRequest("OPTIONS", "/")).status == 204);
    }

    SECTION("Unsupported method") {
        Response resp = fixture.server->Dispatch(makeRequest("DELETE", "/" + PUBKEY));
        REQUIRE(resp.status == 404);
        requireCors(resp);
    }
}

TEST_CASE("Handlers - Missing storage service", "[handlers]") {
    crypto::SchnorrVerifier verifier;
    Config config;
    config.addr = "127.0.0.1:0";
    config.logging.level = "error";
    config.verifier = &verifier;
    config.storageService = nullptr;
    Server server(config);

    Response resp = server.Dispatch(makeRequest("GET", "/file"));
    REQUIRE(resp.status == 500);
    REQUIRE(resp.body == "Storage service unavailable");
}

TEST_CASE("Handlers - Storage failures during upload", "[handlers]") {
    test::TempDir dir;
    storage::FileStorageService realStorage(dir.String());
    FaultyStorage storage(realStorage);
    crypto::SchnorrVerifier verifier;

    Config config;
    config.addr = "127.0.0.1:0";
    config.logging.level = "error";
    config.verifier = &verifier;
    config.storageService = &storage;
    Server server(config);

    std::string header = test::SignedHeader(test::SecretKey(3));
    REQUIRE_FALSE(header.empty());

    SECTION("Directory creation fails") {
        storage.failMkdir = true;
        Response resp = server.Dispatch(makeRequest("PUT", "/" + PUBKEY, header, "hello"));
        REQUIRE(resp.status == 500);
        REQUIRE(resp.body == "Error creating directory");
        requireCors(resp);
        REQUIRE(std::filesystem::is_empty(dir.Path()));
    }

    SECTION("Opening the file fails") {
        storage.failOpen = true;
        Response resp = server.Dispatch(makeRequest("PUT", "/" + PUBKEY, header, "hello"));
        REQUIRE(resp.status == 500);
        REQUIRE(resp.body == "Error writing file");
        REQUIRE(std::filesystem::is_empty(dir.Path()));
    }

    SECTION("Write fails") {
        storage.failWrite = true;
        Response resp = server.Dispatch(makeRequest("PUT", "/" + PUBKEY, header, "hello"));
        REQUIRE(resp.status == 500);
        REQUIRE(resp.body == "Error writing file");
        requireCors(resp);
        REQUIRE(std::filesystem::is_empty(dir.Path()));
    }

    SECTION("Commit fails") {
        storage.failCommit = true;
        Response resp = server.Dispatch(makeRequest("PUT", "/" + PUBKEY, header, "hello"));
        REQUIRE(resp.status == 500);
        REQUIRE(resp.body == "Error writing file");
        REQUIRE(std::filesystem::is_empty(dir.Path()));
    }

    SECTION("Write failure keeps existing file") {
        REQUIRE(server.Dispatch(makeRequest("PUT", "/" + PUBKEY, header, "kept")).status == 201);
        storage.failWrite = true;
        REQUIRE(server.Dispatch(makeRequest("PUT", "/" + PUBKEY, header, "lost")).status == 500);
        REQUIRE(server.Dispatch(makeRequest("GET", "/" + PUBKEY)).body == "kept");
    }
}

TEST_CASE("Handlers - Unusual read paths", "[handlers]") {
    ServerFixture fixture;
    std::string header = test::SignedHeader(test::SecretKey(3));
    REQUIRE(fixture.server->Dispatch(makeRequest("PUT", "/" + PUBKEY, header, "hello")).status == 201);

    SECTION("Path with embedded NUL") {
        std::string path = "/" + PUBKEY + std::string(1, '\0') + ".json";
        Response resp = fixture.server->Dispatch(makeRequest("GET", path));
        REQUIRE(resp.status == 404);
        REQUIRE(resp.headers.at("Content-Type") == "text/plain");
    }

    SECTION("Upload in progress is not readable") {
        std::vector<std::string> tempNames;
        std::vector<int> tempStatuses;
        Request request = makeRequest("PUT", "/" + PUBKEY, header);
        request.bodyReader = [&](const ContentReceiver& receiver) {
            if (!receiver("partial", 7)) {
                return false;
            }
            for (const auto& entry : std::filesystem::directory_iterator(fixture.dir.Path())) {
                std::string name = entry.path().filename().string();
                if (name != PUBKEY) {
                    tempNames.push_back(name);
                    tempStatuses.push_back(fixture.server->Dispatch(makeRequest("GET", "/" + name)).status);
                }
            }
            return receiver(" upload", 7);
        };
        REQUIRE(fixture.server->Dispatch(request).status == 201);

        REQUIRE(tempNames.size() == 1);
        REQUIRE(storage::IsUploadTempName(tempNames[0]));
        REQUIRE(tempStatuses == std::vector<int>{404});
        REQUIRE(fixture.server->Dispatch(makeRequest("GET", "/" + PUBKEY)).body == "partial upload");
    }
}
