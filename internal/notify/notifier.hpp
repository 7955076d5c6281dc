#pragma once

#include <memory>
#include <string>

#include "internal/model/run_summary.hpp"

namespace batchsync::notify {

/*
  Receives the summary of every finished run.
*/
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual void Notify(const model::RunSummary& summary) = 0;

  // A run that could not finish (configuration, record source, ledger).
  virtual void NotifyFatal(const std::string& run_context, const std::string& error) = 0;
};

using NotifierPtr = std::shared_ptr<Notifier>;

/*
  Writes the formatted report to the log: info when every batch
  succeeded, warning otherwise.
*/
class LogNotifier final : public Notifier {
 public:
  void Notify(const model::RunSummary& summary) override;
  void NotifyFatal(const std::string& run_context, const std::string& error) override;
};

} // namespace batchsync::notify
