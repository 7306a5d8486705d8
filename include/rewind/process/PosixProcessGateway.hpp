// Repository: Rewind
// Component: POSIX Process Gateway
// Purpose: fork/exec child supervision with pipe capture, cancel and timeout.
// Copyright (c) 2026 Rewind

#ifndef REWIND_PROCESS_POSIX_PROCESS_GATEWAY_HPP_
#define REWIND_PROCESS_POSIX_PROCESS_GATEWAY_HPP_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rewind/process/ProcessGateway.hpp"

namespace rwd::process {

// PosixProcessGateway spawns children with fork/execv.
//
// Each handle owns a waiter thread that drains the captured pipes, enforces
// the optional timeout, and reaps the child. The waiter observes exit with
// waitid(WNOWAIT) and only reaps while holding the handle mutex, so Cancel()
// can never signal a PID that was already reaped (and possibly reused).
//
// Termination (Cancel or timeout): SIGINT first so capture/encoder programs
// can finalize their output, then SIGKILL after kKillGraceMs.
class PosixProcessGateway : public IProcessGateway {
 public:
  static constexpr int kKillGraceMs = 2000;

  // extra_search_dirs are tried before $PATH when resolving bare names.
  explicit PosixProcessGateway(std::vector<std::string> extra_search_dirs = {});

  std::shared_ptr<IProcessHandle> Launch(const LaunchSpec& spec) override;

  std::optional<std::string> ResolveExecutable(
      const std::string& name) const override;

 private:
  std::vector<std::string> extra_search_dirs_;
};

}  // namespace rwd::process

#endif  // REWIND_PROCESS_POSIX_PROCESS_GATEWAY_HPP_
