#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "transfer_task.hpp"

namespace batchsync::coordinator {

/*
  Thread-safe blocking queue for transfer workers.
*/
class TransferQueue {
 public:
  void Enqueue(TransferTask task);

  // blocking wait; nullopt once shut down and drained
  std::optional<TransferTask> Dequeue();

  void Shutdown();

 private:
  std::mutex               mutex_;
  std::condition_variable  cv_;
  std::queue<TransferTask> queue_;
  bool                     shutdown_ = false;
};

} // namespace batchsync::coordinator
