#pragma once

#include <cstddef>

#include "internal/model/batch_item.hpp"

namespace batchsync::coordinator {

/*
  One actionable batch handed to the worker pool.

  slot is the item's position in the run's result table.
*/
struct TransferTask {
  size_t           slot = 0;
  model::BatchItem item;
};

} // namespace batchsync::coordinator
