#pragma once

#include <functional>

namespace ringtrack {

/**
 * @brief Run a CLI command and turn an escaping exception into an exit code.
 *
 * PreconditionError gives 2 (after calling `on_precondition`, if set). Any
 * other error is logged and gives 1. The stack is unwound before returning,
 * so open run files are flushed by their destructors.
 */
int run_guarded(const std::function<int()>& body,
                const std::function<void()>& on_precondition = nullptr);

}  // namespace ringtrack
