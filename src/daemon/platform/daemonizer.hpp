#pragma once

#include <string>

namespace platform {

// Detaches from the controlling terminal; only the grandchild returns.
// stderr is appended to log_path so diagnostics survive detaching, or
// discarded when log_path is empty.
void daemonize(const std::string& log_path);

} // namespace platform
