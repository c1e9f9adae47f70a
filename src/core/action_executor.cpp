#include "core/action_executor.hpp"

#include <memory>
#include <mutex>
#include <ostream>

namespace turnwise::core {
namespace {

class EchoExecutor final : public ActionExecutor {
 public:
  explicit EchoExecutor(std::ostream& out) : out_(out) {}

  ActionResult execute(const std::string& agent_id, const model::Event& event) override {
    const std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[action] " << agent_id << " -> " << event.context_id << '/' << event.id << ": " << event.payload << '\n';
    out_.flush();
    if (!out_) {
      return ActionResult{false, "output stream failed", 1.0F};
    }
    return ActionResult{true, {}, 1.0F};
  }

 private:
  std::ostream& out_;
  std::mutex mutex_;
};

}  // namespace

std::unique_ptr<ActionExecutor> make_echo_executor(std::ostream& out) { return std::make_unique<EchoExecutor>(out); }

}  // namespace turnwise::core
