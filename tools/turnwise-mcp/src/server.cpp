#include "mcp/server.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

#include "sinks/redis_ts.hpp"

namespace turnwise::mcp {

namespace {

constexpr const char* kSeriesCatalogUri = "turnwise://series/catalog";
constexpr const char* kMoodScaleUri = "turnwise://schema/mood";

}  // namespace

Server::Server(ToolRegistry tools) : tools_(std::move(tools)) {}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) const {
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    try {
      const auto response = handle_line(line);
      if (!response.is_null()) {
        out << response.dump() << '\n';
        out.flush();
      }
    } catch (const std::exception& ex) {
      err << "turnwise-mcp: failed to process request: " << ex.what() << '\n';
    }
  }

  return 0;
}

nlohmann::json Server::handle_line(const std::string& line) const {
  nlohmann::json request;
  try {
    request = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& ex) {
    return make_error_response(nullptr, JsonRpcError{.code = rpc_error::PARSE_ERROR, .message = ex.what()});
  }

  JsonRpcRequest parsed;
  try {
    parsed = parse_request(request);
  } catch (const InvalidRequest& ex) {
    return make_error_response(nullptr, JsonRpcError{.code = rpc_error::INVALID_REQUEST, .message = ex.what()});
  } catch (const std::invalid_argument& ex) {
    const auto id = request.contains("id") ? request.at("id") : nlohmann::json(nullptr);
    return make_error_response(id, JsonRpcError{.code = rpc_error::INVALID_PARAMS, .message = ex.what()});
  }

  const nlohmann::json id = parsed.id.value_or(nullptr);
  try {
    auto result = dispatch(parsed);
    if (parsed.is_notification()) {
      return nullptr;
    }
    return result;
  } catch (const std::invalid_argument& ex) {
    if (parsed.is_notification()) {
      return nullptr;
    }
    return make_error_response(id, JsonRpcError{.code = rpc_error::INVALID_PARAMS, .message = ex.what()});
  } catch (const std::runtime_error& ex) {
    if (parsed.is_notification()) {
      return nullptr;
    }
    return make_error_response(id, JsonRpcError{.code = rpc_error::INTERNAL_ERROR, .message = ex.what()});
  }
}

nlohmann::json Server::dispatch(const JsonRpcRequest& request) const {
  const nlohmann::json id = request.id.value_or(nullptr);

  if (request.method == "initialize") {
    return make_result_response(id, handle_initialize(request.params));
  }
  if (request.method == "tools/list") {
    return make_result_response(id, handle_tools_list());
  }
  if (request.method == "tools/call") {
    return make_result_response(id, handle_tools_call(request.params));
  }
  if (request.method == "resources/list") {
    return make_result_response(id, handle_resources_list());
  }
  if (request.method == "resources/read") {
    return make_result_response(id, handle_resources_read(request.params));
  }

  return make_error_response(id, JsonRpcError{.code = rpc_error::METHOD_NOT_FOUND, .message = "method not found"});
}

nlohmann::json Server::handle_initialize(const nlohmann::json& /*params*/) const {
  return nlohmann::json{{"serverInfo", {{"name", "turnwise-mcp"}, {"version", "0.1.0"}}},
                        {"capabilities",
                         {{"tools", nlohmann::json::object()}, {"resources", nlohmann::json::object()}}}};
}

nlohmann::json Server::handle_tools_list() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& [_, tool] : tools_) {
    tools.push_back({{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}});
  }
  return nlohmann::json{{"tools", tools}};
}

nlohmann::json Server::handle_tools_call(const nlohmann::json& params) const {
  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    throw std::invalid_argument("name must be a string");
  }

  const auto args_it = params.find("arguments");
  const nlohmann::json arguments = args_it == params.end() ? nlohmann::json::object() : *args_it;
  if (!arguments.is_object()) {
    throw std::invalid_argument("arguments must be an object");
  }

  const auto tool_it = tools_.find(name_it->get<std::string>());
  if (tool_it == tools_.end()) {
    throw std::invalid_argument("unknown tool: " + name_it->get<std::string>());
  }

  return nlohmann::json{{"content", tool_it->second.handler(arguments)}};
}

nlohmann::json Server::handle_resources_list() const {
  return nlohmann::json{
      {"resources", nlohmann::json::array({{{"uri", kSeriesCatalogUri},
                                             {"name", "Agent Series Catalog"},
                                             {"description", "Per-agent series published by the turnwise runtime"}},
                                            {{"uri", kMoodScaleUri},
                                             {"name", "Mood Scale"},
                                             {"description", "Numeric encoding of the state:mood series"}}})}};
}

nlohmann::json Server::handle_resources_read(const nlohmann::json& params) const {
  const auto uri_it = params.find("uri");
  if (uri_it == params.end() || !uri_it->is_string()) {
    throw std::invalid_argument("uri must be a string");
  }

  const auto& uri = uri_it->get_ref<const std::string&>();
  if (uri == kSeriesCatalogUri) {
    return nlohmann::json{{"uri", uri},
                          {"contents", nlohmann::json{{"key_format", "<prefix>:<agent>:<series>"},
                                                      {"series", sinks::agent_series_suffixes()}}}};
  }
  if (uri == kMoodScaleUri) {
    return nlohmann::json{
        {"uri", uri},
        {"contents", nlohmann::json{{"idle", 0}, {"active", 1}, {"tired", 2}, {"overwhelmed", 3}}}};
  }

  throw std::invalid_argument("unknown resource uri");
}

}  // namespace turnwise::mcp
