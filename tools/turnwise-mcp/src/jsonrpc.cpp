#include "mcp/jsonrpc.hpp"

namespace turnwise::mcp {

namespace {

bool valid_id(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

}  // namespace

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw InvalidRequest("request must be a JSON object");
  }

  const auto version = request.find("jsonrpc");
  if (version == request.end() || !version->is_string() || *version != kJsonRpcVersion) {
    throw InvalidRequest("jsonrpc must be \"2.0\"");
  }

  const auto method = request.find("method");
  if (method == request.end() || !method->is_string()) {
    throw InvalidRequest("method must be a string");
  }

  JsonRpcRequest parsed{.method = method->get<std::string>(), .params = nlohmann::json::object(), .id = std::nullopt};

  if (const auto id = request.find("id"); id != request.end()) {
    if (!valid_id(*id)) {
      throw InvalidRequest("id must be a string, an integer or null");
    }
    parsed.id = *id;
  }

  if (const auto params = request.find("params"); params != request.end()) {
    if (!params->is_object()) {
      throw std::invalid_argument("params must be an object");
    }
    parsed.params = *params;
  }

  return parsed;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion},
                        {"id", id},
                        {"error", {{"code", static_cast<int>(error.code)}, {"message", error.message}}}};
}

}  // namespace turnwise::mcp
