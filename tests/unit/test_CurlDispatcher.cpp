#include <gtest/gtest.h>

#include "client/Client.hpp"
#include "client/Object.hpp"
#include "http/CurlDispatcher.hpp"
#include "http/errors.hpp"
#include "support/LoopbackHttpServer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <fmt/core.h>

namespace fs = std::filesystem;
using namespace ais;
using namespace ais::http;
using test::CapturedRequest;
using test::LoopbackHttpServer;
using test::httpResponse;

namespace {

config::ClientConfig configFor(const std::string& endpoint) {
    config::ClientConfig cfg;
    cfg.endpoint = endpoint;
    cfg.connect_timeout_ms = 2000;
    cfg.read_timeout_ms = 2000;
    return cfg;
}

Request objectRequest(const Method method, const std::string& path, QueryParams params = {}) {
    Request req;
    req.method = method;
    req.path = path;
    req.params = std::move(params);
    return req;
}

}

TEST(CurlDispatcherTest, BuildsVersionedUrl) {
    const CurlDispatcher d(configFor("http://localhost:8080"));
    EXPECT_EQ(d.buildUrl(objectRequest(Method::Head, "objects/images/cat.png", {{"provider", "ais"}})),
              "http://localhost:8080/v1/objects/images/cat.png?provider=ais");
}

TEST(CurlDispatcherTest, StripsSlashesAroundPath) {
    const CurlDispatcher d(configFor("http://localhost:8080///"));
    EXPECT_EQ(d.buildUrl(objectRequest(Method::Put, "/objects/images/cat.png")),
              "http://localhost:8080/v1/objects/images/cat.png");
}

TEST(CurlDispatcherTest, EscapesSegmentsAndQuery) {
    const CurlDispatcher d(configFor("https://ais.example.com:51080"));
    EXPECT_EQ(d.buildUrl(objectRequest(Method::Get, "objects/images/my cat.tar",
                                       {{"provider", "ais"}, {"archpath", "inner/a b.png"}})),
              "https://ais.example.com:51080/v1/objects/images/my%20cat.tar?archpath=inner%2Fa%20b.png&provider=ais");
}

TEST(CurlDispatcherTest, RejectsEmptyEndpoint) {
    EXPECT_THROW(CurlDispatcher(configFor("")), std::invalid_argument);
}

TEST(CurlDispatcherTest, RejectsBodyOnNonPut) {
    CurlDispatcher d(configFor("http://127.0.0.1:1"));
    std::istringstream body("x");
    auto req = objectRequest(Method::Delete, "objects/b/o");
    req.body = &body;
    EXPECT_THROW((void)d.request(req), std::invalid_argument);
}

TEST(CurlDispatcherTest, RefusedConnectionIsConnectionError) {
    // Nothing listens on the tcpmux port
    CurlDispatcher d(configFor("http://127.0.0.1:1"));
    EXPECT_THROW((void)d.request(objectRequest(Method::Head, "objects/b/o")), ConnectionError);
}

TEST(CurlDispatcherTest, RefusedStreamIsConnectionError) {
    CurlDispatcher d(configFor("http://127.0.0.1:1"));
    auto req = objectRequest(Method::Get, "objects/b/o", {{"archpath", ""}});
    req.stream = true;
    EXPECT_THROW((void)d.request(req), ConnectionError);
}

// Same stack as the CLI (Client -> Bucket -> Object -> CurlDispatcher) against a loopback server

class CurlLoopbackTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / fmt::format("aisobj_curl_test_{}", ::getpid());
        fs::create_directories(test_dir);
    }

    void TearDown() override { fs::remove_all(test_dir); }
};

TEST_F(CurlLoopbackTest, StreamedGetReadsChunkedBody) {
    LoopbackHttpServer server([](const CapturedRequest&) {
        return std::string("HTTP/1.1 200 OK\r\n"
                           "ais-checksum-type: xxhash\r\n"
                           "ais-checksum-value: a1b2c3\r\n"
                           "Transfer-Encoding: chunked\r\n"
                           "Connection: close\r\n\r\n"
                           "5\r\nhello\r\n"
                           "6\r\n world\r\n"
                           "0\r\n\r\n");
    });

    const client::Client client(configFor(server.endpoint()));
    const auto bucket = client.bucket("images");
    auto stream = bucket.object("cat.png").getObject("", 4);

    EXPECT_EQ(stream.contentLength(), 0u);
    EXPECT_EQ(stream.eTag(), "a1b2c3");
    EXPECT_EQ(stream.eTagType(), "xxhash");

    EXPECT_EQ(stream.readChunk(), "hell");
    EXPECT_EQ(stream.readChunk(), "o wo");
    EXPECT_EQ(stream.readChunk(), "rld");
    EXPECT_EQ(stream.readChunk(), "");
    EXPECT_FALSE(stream.isOpen());

    const auto reqs = server.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, "GET");
    EXPECT_EQ(reqs[0].target, "/v1/objects/images/cat.png?archpath=&provider=ais");
}

TEST_F(CurlLoopbackTest, StreamedGetKeepsOnlyFinalResponseHeaders) {
    LoopbackHttpServer server([](const CapturedRequest& req) {
        if (req.target.starts_with("/v1/objects/images/old.png"))
            return httpResponse(307, "Temporary Redirect",
                                {{"Location", "/v1/objects/images/cat.png?provider=ais"},
                                 {"X-Hop", "proxy"},
                                 {"ais-checksum-type", "md5"}});
        return httpResponse(200, "OK", {{"ais-checksum-value", "ffee"}}, "target body");
    });

    CurlDispatcher d(configFor(server.endpoint()));
    auto req = objectRequest(Method::Get, "objects/images/old.png", {{"provider", "ais"}});
    req.stream = true;

    const Response resp = d.request(req);
    EXPECT_EQ(resp.status, 200);
    EXPECT_FALSE(resp.headers.contains("x-hop"));
    EXPECT_FALSE(resp.headers.contains("ais-checksum-type"));
    EXPECT_EQ(headerOr(resp.headers, "ais-checksum-value"), "ffee");
    EXPECT_EQ(headerOr(resp.headers, "content-length"), "11");

    ASSERT_TRUE(resp.stream);
    std::string body;
    char buf[3];
    for (size_t n; (n = resp.stream->read(buf, sizeof(buf))) > 0;) body.append(buf, n);
    EXPECT_EQ(body, "target body");
    resp.stream->close();

    EXPECT_EQ(server.requests().size(), 2u);
}

TEST_F(CurlLoopbackTest, BufferedErrorCarriesJsonMessage) {
    LoopbackHttpServer server([](const CapturedRequest&) {
        return httpResponse(404, "Not Found", {{"Content-Type", "application/json"}},
                            R"({"message":"object images/cat.png does not exist","status":404})");
    });

    const client::Client client(configFor(server.endpoint()));
    const auto bucket = client.bucket("images");

    try {
        bucket.object("cat.png").deleteObject();
        FAIL() << "expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.status(), 404);
        EXPECT_EQ(e.message(), "object images/cat.png does not exist");
    }

    const auto reqs = server.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, "DELETE");
}

TEST_F(CurlLoopbackTest, StreamedErrorCarriesJsonMessage) {
    LoopbackHttpServer server([](const CapturedRequest&) {
        return httpResponse(404, "Not Found", {{"Content-Type", "application/json"}},
                            R"({"message":"bucket images does not exist","status":404})");
    });

    const client::Client client(configFor(server.endpoint()));
    const auto bucket = client.bucket("images");

    try {
        (void)bucket.object("cat.png").getObject();
        FAIL() << "expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.status(), 404);
        EXPECT_EQ(e.message(), "bucket images does not exist");
    }

    EXPECT_EQ(server.requests().size(), 1u);
}

TEST_F(CurlLoopbackTest, PutReplaysBodyAfterRedirect) {
    std::string content;
    for (int i = 0; i < 200; ++i) content += fmt::format("line {:03}\n", i);
    const auto file = test_dir / "upload.txt";
    {
        std::ofstream out(file, std::ios::binary);
        out << content;
    }

    LoopbackHttpServer server([](const CapturedRequest& req) {
        if (req.target.find("target=1") == std::string::npos)
            return httpResponse(307, "Temporary Redirect",
                                {{"Location", "/v1/objects/images/notes.txt?provider=ais&target=1"}});
        return httpResponse(200, "OK", {{"ais-checksum-value", "cafe"}});
    });

    const client::Client client(configFor(server.endpoint()));
    const auto bucket = client.bucket("images");
    const auto headers = bucket.object("notes.txt").putObject(file);

    EXPECT_EQ(headerOr(headers, "ais-checksum-value"), "cafe");

    const auto reqs = server.requests();
    ASSERT_EQ(reqs.size(), 2u);
    EXPECT_EQ(reqs[0].method, "PUT");
    EXPECT_EQ(reqs[0].body, content);
    EXPECT_EQ(reqs[1].method, "PUT");
    EXPECT_EQ(reqs[1].target, "/v1/objects/images/notes.txt?provider=ais&target=1");
    EXPECT_EQ(reqs[1].body, content);
}
