#include "connectivity_provider.hpp"

#include <sys/wait.h>

#include <cstdlib>

#include "internal/observability/logging.hpp"

namespace batchsync::connectivity {

using observability::IntField;
using observability::StringField;

CommandConnectivityProvider::CommandConnectivityProvider(std::string command) : command_(std::move(command)) {
}

bool CommandConnectivityProvider::IsConnected() {
  const int status = std::system(command_.c_str());
  if (status == -1) {
    BATCHSYNC_LOG_ERROR("connectivity check could not run", {StringField("command", command_)});
    return false;
  }

  const bool ok = WIFEXITED(status) && WEXITSTATUS(status) == 0;
  if (!ok) {
    BATCHSYNC_LOG_WARN("connectivity check failed", {StringField("command", command_), IntField("status", WIFEXITED(status) ? WEXITSTATUS(status) : status)});
  }
  return ok;
}

} // namespace batchsync::connectivity
