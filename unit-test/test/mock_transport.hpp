#pragma once

#include "ai/transport.hpp"
#include "gmock/gmock.h"

namespace kata::test {

struct mock_transport : public completion_transport {
    MOCK_METHOD2(post, http_response(const http_request &request, const cancellation_token *cancel));
};

/**
 * @brief chat completions 接口的成功响应，content 为模型的回答
 */
http_response completion(const std::string &content);

http_response http_status(long status_code, const std::string &body = "{}");

}  // namespace kata::test
