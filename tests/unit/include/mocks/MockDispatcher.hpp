#pragma once

#include "http/Dispatcher.hpp"

#include <gmock/gmock.h>

namespace ais::test {

class MockDispatcher : public http::Dispatcher {
public:
    MOCK_METHOD(http::Response, request, (const http::Request& req), (override));
};

}
