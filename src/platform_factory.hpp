#pragma once

#include "interfaces/i_process_control.hpp"
#include <memory>

namespace cml {

// Factory for the platform-specific process primitives.
// Current build provides the Linux implementation.
std::unique_ptr<IProcessControl> make_process_control();

} // namespace cml
