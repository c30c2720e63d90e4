#pragma once

#include "errors.hpp"
#include "interfaces/i_process_control.hpp"
#include <filesystem>
#include <optional>
#include <string_view>

namespace cml {

// Liveness marker: a file holding the decimal PID of the active background
// instance. Claiming is not atomic; two instances started at the same moment
// can both see "not active" and both claim.
class SingleInstance {
public:
    // process_control must outlive this object
    SingleInstance(std::filesystem::path marker_path, IProcessControl* process_control);

    // True only if the marker names a live process. A missing, unparsable or
    // dead marker is deleted and reported as not active.
    [[nodiscard]] bool is_active();

    // Write our own PID, creating or truncating the marker
    OpResult claim();

    // Delete the marker. Missing file is not an error.
    OpResult release();

    // PID recorded in the marker, without probing it
    [[nodiscard]] std::optional<int> active_pid() const;

    [[nodiscard]] const std::filesystem::path& marker_path() const { return marker_path_; }

    static std::optional<int> parse_pid(std::string_view text);

private:
    void remove_stale_marker(std::string_view reason);

    std::filesystem::path marker_path_;
    IProcessControl* process_control_ = nullptr;
};

} // namespace cml
