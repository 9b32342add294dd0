#pragma once

namespace platform {

// SIGINT sets a flag instead of terminating. Installed without SA_RESTART so
// blocking reads return EINTR and can notice it.
bool install_interrupt_handler();

bool interrupted();
void clear_interrupt();

} // namespace platform
