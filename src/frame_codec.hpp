#pragma once

#include "config.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace toolrt {

struct JsonRpcRequest {
  int64_t id = 0;
  std::string method;
  nlohmann::json params = nlohmann::json::object();
};

struct JsonRpcNotification {
  std::string method;
  nlohmann::json params = nlohmann::json::object();
};

struct JsonRpcResponse {
  int64_t id = 0;
  nlohmann::json result;
};

struct JsonRpcErrorResponse {
  std::optional<int64_t> id;
  int code = 0;
  std::string message;
  nlohmann::json data;
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcNotification, JsonRpcResponse, JsonRpcErrorResponse>;

// Classifies a decoded JSON document; anything that is not one of the four shapes yields nullopt.
std::optional<JsonRpcMessage> ParseJsonRpcMessage(const nlohmann::json& j);
nlohmann::json ToJson(const JsonRpcMessage& msg);

std::string EncodeFrame(WireFormat format, const nlohmann::json& payload);
std::string EncodeFrame(WireFormat format, const JsonRpcMessage& msg);

// Incremental decoder over an append-only byte buffer. Bytes may arrive in arbitrary chunks;
// each call to NextFrame() returns at most one complete payload and keeps the remainder buffered.
class FrameDecoder {
 public:
  explicit FrameDecoder(WireFormat format) : format_(format) {}

  void Append(std::string_view bytes);

  // Next complete raw payload (JSON text), or nullopt when more bytes are needed.
  std::optional<std::string> NextFrame();

  // Next payload that parses as a JSON-RPC message. Malformed or non-JSON payloads are skipped.
  std::optional<JsonRpcMessage> Next();

  size_t BufferedBytes() const { return buffer_.size() - consumed_; }
  WireFormat format() const { return format_; }

 private:
  std::optional<std::string> NextContentLengthFrame();
  std::optional<std::string> NextLineFrame();
  void Compact();

  WireFormat format_;
  std::string buffer_;
  size_t consumed_ = 0;
};

}  // namespace toolrt
