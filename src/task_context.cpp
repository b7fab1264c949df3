#include "warden/task_context.hpp"

namespace warden {

bool TaskContext::cancelled() const {
  if (source_.stop_requested()) return true;
  return deadline_ && Clock::now() >= *deadline_;
}

std::string TaskContext::claim(const std::string& key, const std::string& def) const {
  auto it = claims.find(key);
  return it == claims.end() ? def : it->second;
}

}  // namespace warden
