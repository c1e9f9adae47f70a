#pragma once

#include <iosfwd>

#include "mcp/jsonrpc.hpp"
#include "mcp/tools.hpp"

namespace turnwise::mcp {

// Read-only inspection endpoint: one JSON-RPC request per input line.
class Server {
 public:
  explicit Server(ToolRegistry tools);

  int run(std::istream& in, std::ostream& out, std::ostream& err) const;

  // Returns a null json value for notifications.
  [[nodiscard]] nlohmann::json handle_line(const std::string& line) const;

 private:
  nlohmann::json dispatch(const JsonRpcRequest& request) const;
  nlohmann::json handle_initialize(const nlohmann::json& params) const;
  nlohmann::json handle_tools_list() const;
  nlohmann::json handle_tools_call(const nlohmann::json& params) const;
  nlohmann::json handle_resources_list() const;
  nlohmann::json handle_resources_read(const nlohmann::json& params) const;

  ToolRegistry tools_;
};

}  // namespace turnwise::mcp
