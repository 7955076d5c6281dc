#pragma once

#include <memory>
#include <string>

namespace batchsync::connectivity {

/*
  Answers whether the network the storage roots live on is reachable
  (VPN up, share mounted, ...). Checked once before a run.
*/
class ConnectivityProvider {
 public:
  virtual ~ConnectivityProvider() = default;

  virtual bool IsConnected() = 0;

  virtual std::string Describe() const = 0;
};

using ConnectivityProviderPtr = std::shared_ptr<ConnectivityProvider>;

class AlwaysConnected final : public ConnectivityProvider {
 public:
  bool IsConnected() override {
    return true;
  }
  std::string Describe() const override {
    return "always-connected";
  }
};

/*
  Runs a shell command; connected iff it exits with status 0.
*/
class CommandConnectivityProvider final : public ConnectivityProvider {
 public:
  explicit CommandConnectivityProvider(std::string command);

  bool IsConnected() override;

  std::string Describe() const override {
    return "command: " + command_;
  }

 private:
  std::string command_;
};

} // namespace batchsync::connectivity
