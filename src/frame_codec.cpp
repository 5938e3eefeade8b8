#include "frame_codec.hpp"

#include <cctype>
#include <cstring>
#include <string>
#include <utility>

namespace toolrt {
namespace {

constexpr const char* kCrlfDelimiter = "\r\n\r\n";
constexpr const char* kLfDelimiter = "\n\n";
constexpr const char* kContentLengthField = "content-length:";
constexpr size_t kMaxFrameBytes = 32u * 1024u * 1024u;

static std::string Dump(const nlohmann::json& j) {
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

static std::string Trim(std::string_view s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return std::string(s.substr(start, end - start));
}

static std::optional<int64_t> IntegerId(const nlohmann::json& j) {
  if (!j.contains("id")) return std::nullopt;
  const auto& id = j["id"];
  if (id.is_number_unsigned()) return static_cast<int64_t>(id.get<uint64_t>());
  if (id.is_number_integer()) return id.get<int64_t>();
  return std::nullopt;
}

// Returns the declared body length, or nullopt when the header has no usable Content-Length.
static std::optional<size_t> ParseContentLength(std::string_view header) {
  std::string lower(header);
  for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  auto pos = lower.find(kContentLengthField);
  if (pos == std::string::npos) return std::nullopt;
  pos += std::strlen(kContentLengthField);
  while (pos < lower.size() && std::isspace(static_cast<unsigned char>(lower[pos]))) pos++;
  if (pos >= lower.size() || !std::isdigit(static_cast<unsigned char>(lower[pos]))) return std::nullopt;
  size_t value = 0;
  while (pos < lower.size() && std::isdigit(static_cast<unsigned char>(lower[pos]))) {
    value = value * 10 + static_cast<size_t>(lower[pos] - '0');
    if (value > kMaxFrameBytes) return std::nullopt;
    pos++;
  }
  return value;
}

}  // namespace

std::optional<JsonRpcMessage> ParseJsonRpcMessage(const nlohmann::json& j) {
  if (!j.is_object()) return std::nullopt;
  const bool has_id = j.contains("id") && !j["id"].is_null();
  const auto id = IntegerId(j);
  if (has_id && !id) return std::nullopt;

  if (j.contains("method")) {
    if (!j["method"].is_string()) return std::nullopt;
    nlohmann::json params = j.contains("params") ? j["params"] : nlohmann::json::object();
    if (id) return JsonRpcRequest{*id, j["method"].get<std::string>(), std::move(params)};
    return JsonRpcNotification{j["method"].get<std::string>(), std::move(params)};
  }

  if (j.contains("error") && !j["error"].is_null()) {
    const auto& e = j["error"];
    JsonRpcErrorResponse out;
    out.id = id;
    // A bare value in place of the error object still fails the request; it is kept as data.
    if (!e.is_object()) {
      out.data = e;
      return out;
    }
    if (e.contains("code") && e["code"].is_number_integer()) out.code = e["code"].get<int>();
    if (e.contains("message") && e["message"].is_string()) out.message = e["message"].get<std::string>();
    if (e.contains("data")) out.data = e["data"];
    return out;
  }

  if (j.contains("result") && id) return JsonRpcResponse{*id, j["result"]};
  return std::nullopt;
}

nlohmann::json ToJson(const JsonRpcMessage& msg) {
  nlohmann::json j;
  j["jsonrpc"] = "2.0";
  if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
    j["id"] = req->id;
    j["method"] = req->method;
    j["params"] = req->params;
  } else if (const auto* note = std::get_if<JsonRpcNotification>(&msg)) {
    j["method"] = note->method;
    j["params"] = note->params;
  } else if (const auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
    j["id"] = resp->id;
    j["result"] = resp->result;
  } else if (const auto* err = std::get_if<JsonRpcErrorResponse>(&msg)) {
    j["id"] = err->id ? nlohmann::json(*err->id) : nlohmann::json(nullptr);
    j["error"] = {{"code", err->code}, {"message", err->message}};
    if (!err->data.is_null()) j["error"]["data"] = err->data;
  }
  return j;
}

std::string EncodeFrame(WireFormat format, const nlohmann::json& payload) {
  std::string body = Dump(payload);
  if (format == WireFormat::kLineDelimited) {
    body.push_back('\n');
    return body;
  }
  std::string out = "Content-Length: " + std::to_string(body.size()) + kCrlfDelimiter;
  out += body;
  return out;
}

std::string EncodeFrame(WireFormat format, const JsonRpcMessage& msg) {
  return EncodeFrame(format, ToJson(msg));
}

void FrameDecoder::Append(std::string_view bytes) {
  Compact();
  buffer_.append(bytes.data(), bytes.size());
}

void FrameDecoder::Compact() {
  if (consumed_ == 0) return;
  buffer_.erase(0, consumed_);
  consumed_ = 0;
}

std::optional<std::string> FrameDecoder::NextFrame() {
  auto frame = format_ == WireFormat::kLineDelimited ? NextLineFrame() : NextContentLengthFrame();
  if (consumed_ == buffer_.size()) {
    buffer_.clear();
    consumed_ = 0;
  }
  return frame;
}

std::optional<std::string> FrameDecoder::NextContentLengthFrame() {
  while (consumed_ < buffer_.size()) {
    const size_t crlf = buffer_.find(kCrlfDelimiter, consumed_);
    const size_t lf = buffer_.find(kLfDelimiter, consumed_);
    size_t header_end = std::string::npos;
    size_t delimiter_len = 0;
    if (crlf != std::string::npos && (lf == std::string::npos || crlf <= lf)) {
      header_end = crlf;
      delimiter_len = std::strlen(kCrlfDelimiter);
    } else if (lf != std::string::npos) {
      header_end = lf;
      delimiter_len = std::strlen(kLfDelimiter);
    }
    if (header_end == std::string::npos) return std::nullopt;

    const std::string_view header(buffer_.data() + consumed_, header_end - consumed_);
    const auto length = ParseContentLength(header);
    if (!length) {
      consumed_ = header_end + delimiter_len;
      continue;
    }
    const size_t body_start = header_end + delimiter_len;
    const size_t body_end = body_start + *length;
    if (buffer_.size() < body_end) return std::nullopt;

    std::string body = buffer_.substr(body_start, *length);
    consumed_ = body_end;
    return body;
  }
  return std::nullopt;
}

std::optional<std::string> FrameDecoder::NextLineFrame() {
  while (consumed_ < buffer_.size()) {
    const size_t line_end = buffer_.find('\n', consumed_);
    if (line_end == std::string::npos) return std::nullopt;
    std::string_view raw(buffer_.data() + consumed_, line_end - consumed_);
    if (!raw.empty() && raw.back() == '\r') raw.remove_suffix(1);
    std::string line = Trim(raw);
    consumed_ = line_end + 1;
    if (line.empty()) continue;
    return line;
  }
  return std::nullopt;
}

std::optional<JsonRpcMessage> FrameDecoder::Next() {
  while (true) {
    auto frame = NextFrame();
    if (!frame) return std::nullopt;
    auto j = nlohmann::json::parse(*frame, nullptr, false);
    if (j.is_discarded()) continue;
    if (auto msg = ParseJsonRpcMessage(j)) return msg;
  }
}

}  // namespace toolrt
