#pragma once

#include <vector>

#include "tasknag/common.hpp"
#include "tasknag/core/task_record.hpp"

namespace tasknag::store {

// Abstract source of the tasks a sweep should consider
class TaskSnapshotProvider {
 public:
  virtual ~TaskSnapshotProvider() = default;

  /**
   * @brief Tasks that are not done and have a notification kind other than none
   *
   * Rows are returned undecoded so that one malformed row only costs that
   * task. The order is stable between calls on an unchanged store.
   */
  virtual Result<std::vector<core::TaskRecord>> listActiveNotifiable() = 0;
};

}  // namespace tasknag::store
