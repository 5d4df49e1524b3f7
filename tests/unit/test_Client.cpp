#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "client/Client.hpp"
#include "http/CurlDispatcher.hpp"
#include "mocks/MockDispatcher.hpp"

using namespace ais;
using namespace ais::client;
using ::testing::_;

TEST(ClientTest, ForwardsRequestsToDispatcher) {
    auto dispatcher = std::make_shared<test::MockDispatcher>();
    const Client client(dispatcher);

    http::Request req;
    req.method = http::Method::Head;
    req.path = "objects/b/o";

    EXPECT_CALL(*dispatcher, request(_)).WillOnce([](const http::Request& r) {
        EXPECT_EQ(r.path, "objects/b/o");
        http::Response resp;
        resp.status = 200;
        resp.headers = {{"x", "y"}};
        return resp;
    });

    const auto resp = client.request(req);
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(http::headerOr(resp.headers, "X"), "y");
}

TEST(ClientTest, RejectsNullDispatcher) {
    EXPECT_THROW(Client(std::shared_ptr<http::Dispatcher>{}), std::invalid_argument);
}

TEST(ClientTest, ConfigBuildsCurlDispatcher) {
    config::ClientConfig cfg;
    cfg.endpoint = "http://ais-proxy:51080/";
    const Client client(cfg);

    const auto* curl = dynamic_cast<const http::CurlDispatcher*>(client.dispatcher().get());
    ASSERT_NE(curl, nullptr);
    EXPECT_EQ(curl->config().endpoint, "http://ais-proxy:51080");
}
