#pragma once

#include <optional>
#include <string>
#include <vector>

#include "tasknag/common.hpp"

namespace tasknag::core {

// A URL to open when a level 3 reminder fires
struct BrowserAction {
  std::string id;
  std::string label;
  std::string url;
  bool enabled = true;
  int order = 0;
  std::optional<std::string> created_at;  // RFC3339
};

// Per-task browser action list, at most kMaxActions entries kept sorted by order
class BrowserActionSettings {
 public:
  static constexpr size_t kMaxActions = 5;

  BrowserActionSettings() = default;
  explicit BrowserActionSettings(bool enabled) : enabled_(enabled) {}

  bool enabled() const noexcept { return enabled_; }
  void setEnabled(bool enabled) noexcept { enabled_ = enabled; }

  const std::vector<BrowserAction>& actions() const noexcept { return actions_; }

  // Rejects the action once kMaxActions are configured
  Result<void> addAction(BrowserAction action);

  // Returns false if no action has the given id
  bool removeAction(const std::string& action_id);
  bool reorderAction(const std::string& action_id, int new_order);

  // Enabled actions in ascending order (stable for equal orders); empty when disabled
  std::vector<BrowserAction> enabledActions() const;

  bool hasRunnableActions() const { return !enabledActions().empty(); }

 private:
  void sortByOrder();

  bool enabled_ = false;
  std::vector<BrowserAction> actions_;
};

}  // namespace tasknag::core
