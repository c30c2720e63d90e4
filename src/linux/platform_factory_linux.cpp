#include "../platform_factory.hpp"

#include "linux_process_control.hpp"

namespace cml {

std::unique_ptr<IProcessControl> make_process_control() {
    return std::make_unique<LinuxProcessControl>();
}

} // namespace cml
