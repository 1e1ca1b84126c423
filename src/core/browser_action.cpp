#include "tasknag/core/browser_action.hpp"

#include <algorithm>

namespace tasknag::core {

Result<void> BrowserActionSettings::addAction(BrowserAction action) {
  if (actions_.size() >= kMaxActions) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "A task can have at most " + std::to_string(kMaxActions) +
                                     " browser actions"));
  }
  actions_.push_back(std::move(action));
  sortByOrder();
  return {};
}

bool BrowserActionSettings::removeAction(const std::string& action_id) {
  auto it = std::find_if(actions_.begin(), actions_.end(),
                         [&](const BrowserAction& a) { return a.id == action_id; });
  if (it == actions_.end()) {
    return false;
  }
  actions_.erase(it);
  return true;
}

bool BrowserActionSettings::reorderAction(const std::string& action_id, int new_order) {
  auto it = std::find_if(actions_.begin(), actions_.end(),
                         [&](const BrowserAction& a) { return a.id == action_id; });
  if (it == actions_.end()) {
    return false;
  }
  it->order = new_order;
  sortByOrder();
  return true;
}

std::vector<BrowserAction> BrowserActionSettings::enabledActions() const {
  std::vector<BrowserAction> result;
  if (!enabled_) {
    return result;
  }
  for (const auto& action : actions_) {
    if (action.enabled) {
      result.push_back(action);
    }
  }
  std::stable_sort(result.begin(), result.end(),
                   [](const BrowserAction& a, const BrowserAction& b) { return a.order < b.order; });
  return result;
}

void BrowserActionSettings::sortByOrder() {
  std::stable_sort(actions_.begin(), actions_.end(),
                   [](const BrowserAction& a, const BrowserAction& b) { return a.order < b.order; });
}

}  // namespace tasknag::core
