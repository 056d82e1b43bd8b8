#pragma once

#include <egress/core/errors.hpp>
#include <egress/core/jobs/egress_types.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace Egress {

enum class RpcType : uint8_t {
    START = 1,
    STOP = 2,
    LIST = 3
};

/**
 * @brief Request envelope carried on the request topic
 *
 * The reply goes to reply_topic and echoes request_id.
 */
struct RpcRequest {
    std::string request_id;
    std::string reply_topic;
    RpcType type = RpcType::LIST;
    StartEgressRequest start;   // type == START
    StopEgressRequest stop;     // type == STOP
};

/**
 * @brief Reply envelope
 *
 * START/STOP carry exactly one EgressInfo, also on failure, with the error
 * text in EgressInfo::error. LIST carries the whole snapshot.
 */
struct RpcResponse {
    std::string request_id;
    ErrorCode code = ErrorCode::OK;
    std::string error;
    std::vector<EgressInfo> items;
};

} // namespace Egress
