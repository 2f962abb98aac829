#pragma once

#include "mcpc/process/process_controller.hpp"

namespace mcpc::detail {

/// fork/exec into a fresh process group; signals go to -pgid.
class PosixProcessController final : public ProcessController {
public:
    PosixProcessController();

    [[nodiscard]] Result<ChildProcess> spawn(const ValidatedCommand& command,
                                             const SpawnOptions& options) override;
    void terminate(const ProcessHandle& handle, StopMode mode) override;
    [[nodiscard]] ReapStatus reap(const ProcessHandle& handle) override;
    void release(ProcessHandle& handle) noexcept override;

    [[nodiscard]] std::string_view platform_name() const noexcept override { return "posix"; }
};

}  // namespace mcpc::detail
