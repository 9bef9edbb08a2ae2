#pragma once

#include <string>

namespace prompts {

// Fixed instruction text sent as the system message of every request.
const std::string& system_prompt();

// Per-step user prompt. `context` and `action_history` may be empty.
std::string plan_action(const std::string& task, const std::string& context,
                        const std::string& action_history);

// Directive carried into the next step when the same action keeps repeating.
std::string recovery(const std::string& failed_action, int attempt_count);

} // namespace prompts
