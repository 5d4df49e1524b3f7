#include <gtest/gtest.h>

#include "client/Client.hpp"
#include "client/Object.hpp"
#include "mocks/MockDispatcher.hpp"

using namespace ais;
using namespace ais::client;

class BucketTest : public ::testing::Test {
protected:
    std::shared_ptr<test::MockDispatcher> dispatcher_ = std::make_shared<test::MockDispatcher>();
    Client client_{dispatcher_};
};

TEST_F(BucketTest, DefaultsToAisProvider) {
    const auto bck = client_.bucket("images");
    EXPECT_EQ(bck.name(), "images");
    EXPECT_EQ(bck.provider(), "ais");
    EXPECT_EQ(bck.ns(), "");
    EXPECT_EQ(&bck.client(), &client_);
    EXPECT_EQ(bck.qparam(), (http::QueryParams{{"provider", "ais"}}));
}

TEST_F(BucketTest, NamespaceAddsParam) {
    const auto bck = client_.bucket("images", "aws", "@uuid#ns");
    EXPECT_EQ(bck.qparam(), (http::QueryParams{{"provider", "aws"}, {"namespace", "@uuid#ns"}}));
}

TEST_F(BucketTest, QparamIsACopy) {
    const auto bck = client_.bucket("images");
    auto params = bck.qparam();
    params["archpath"] = "x";
    EXPECT_EQ(bck.qparam().size(), 1u);
}

TEST_F(BucketTest, ObjectFactoryBindsBucket) {
    const auto bck = client_.bucket("images");
    const auto obj = bck.object("cat.png");
    EXPECT_EQ(&obj.bucket(), &bck);
    EXPECT_EQ(obj.name(), "cat.png");
}

TEST_F(BucketTest, RejectsEmptyName) {
    EXPECT_THROW((void)client_.bucket(""), std::invalid_argument);
}
