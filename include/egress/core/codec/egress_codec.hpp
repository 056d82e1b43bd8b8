#pragma once
#include <egress/core/jobs/egress_types.hpp>
#include <egress/core/service/rpc_messages.hpp>
#include <cstdint>
#include <string>

/**
 * Binary wire format
 *
 * Integers are big-endian. Strings are a 4-byte length followed by the
 * bytes. Enums are one byte. Every decode* function requires the whole
 * input to be consumed and throws std::runtime_error on truncated input,
 * unknown enum values or trailing bytes.
 */
namespace Egress::Codec {

std::string encodeEgressInfo(const EgressInfo& info);
EgressInfo decodeEgressInfo(const std::string& data);

std::string encodeStartRequest(const StartEgressRequest& req);
StartEgressRequest decodeStartRequest(const std::string& data);

std::string encodeRequest(const RpcRequest& req);
RpcRequest decodeRequest(const std::string& data);

std::string encodeResponse(const RpcResponse& resp);
RpcResponse decodeResponse(const std::string& data);

} // namespace Egress::Codec
