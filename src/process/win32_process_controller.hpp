#pragma once

#include "mcpc/process/process_controller.hpp"

namespace mcpc::detail {

/// CreateProcess into a kill-on-close job object; the job is the group.
class Win32ProcessController final : public ProcessController {
public:
    [[nodiscard]] Result<ChildProcess> spawn(const ValidatedCommand& command,
                                             const SpawnOptions& options) override;
    void terminate(const ProcessHandle& handle, StopMode mode) override;
    [[nodiscard]] ReapStatus reap(const ProcessHandle& handle) override;
    void release(ProcessHandle& handle) noexcept override;

    [[nodiscard]] std::string_view platform_name() const noexcept override { return "windows"; }
};

}  // namespace mcpc::detail
