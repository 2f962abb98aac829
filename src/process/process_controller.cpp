#include "mcpc/process/process_controller.hpp"

#if defined(_WIN32)
#include "win32_process_controller.hpp"
#else
#include "posix_process_controller.hpp"
#endif

namespace mcpc {

std::unique_ptr<ProcessController> make_platform_process_controller() {
#if defined(_WIN32)
    return std::make_unique<detail::Win32ProcessController>();
#else
    return std::make_unique<detail::PosixProcessController>();
#endif
}

}  // namespace mcpc
