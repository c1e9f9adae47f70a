#pragma once

#include <iosfwd>
#include <memory>
#include <string>

#include "model/event.hpp"

namespace turnwise::core {

struct ActionResult {
  bool ok{true};
  std::string detail{};
  float complexity{1.0F};
};

// Host-supplied action boundary. Implementations may fail by returning
// ok=false or by throwing std::exception; both count as a failed action.
class ActionExecutor {
 public:
  virtual ActionResult execute(const std::string& agent_id, const model::Event& event) = 0;
  virtual ~ActionExecutor() = default;
};

std::unique_ptr<ActionExecutor> make_echo_executor(std::ostream& out);

}  // namespace turnwise::core
