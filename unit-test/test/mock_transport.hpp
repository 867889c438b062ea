#pragma once

#include <string>
#include "gmock/gmock.h"
#include "remote/transport.hpp"

namespace submitter::remote::mock {

struct mock_transport : public transport {
    MOCK_METHOD(http_response, execute, (const http_request &request), (override));
};

http_response reply(long status_code, const std::string &body);

http_response network_failure(const std::string &error);

}  // namespace submitter::remote::mock
