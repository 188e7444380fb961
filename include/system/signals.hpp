#pragma once

#include "util/cancel_token.hpp"

namespace zipline {

// SIGINT/SIGTERM cancel the given token.
void InstallSignalHandlers(const CancelToken& token);

} // namespace zipline
