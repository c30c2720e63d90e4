#pragma once

#include "../interfaces/i_process_control.hpp"

namespace cml {

class LinuxProcessControl : public IProcessControl {
public:
    LinuxProcessControl() = default;
    ~LinuxProcessControl() override = default;

    bool is_alive(int pid) override;
    SignalResult terminate(int pid) override;
    int current_pid() const override;

private:
    static std::string get_signal_error_message(int err);
};

} // namespace cml
