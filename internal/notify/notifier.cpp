#include "notifier.hpp"

#include "internal/observability/logging.hpp"

namespace batchsync::notify {

void LogNotifier::Notify(const model::RunSummary& summary) {
  const auto report = model::FormatRunSummary(summary);
  if (summary.AllSucceeded()) {
    BATCHSYNC_LOG_INFO(report);
  } else {
    BATCHSYNC_LOG_WARN(report);
  }
}

void LogNotifier::NotifyFatal(const std::string& run_context, const std::string& error) {
  BATCHSYNC_LOG_ERROR("run aborted", {observability::StringField("context", run_context), observability::StringField("error", error)});
}

} // namespace batchsync::notify
