#pragma once

namespace platform {

// Detach from the controlling terminal. Only the grandchild returns.
void daemonize();

} // namespace platform
