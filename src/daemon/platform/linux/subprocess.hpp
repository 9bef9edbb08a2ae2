#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

// fork/exec helpers for the Wayland command-line tools (grim, ydotool, wtype, xdg-open).
namespace subprocess {

// Runs argv[0] from $PATH and waits for it. Non-zero exit is an error.
std::expected<void, std::string> run(const std::vector<std::string>& argv);

// Same, collecting the child's stdout.
std::expected<std::vector<uint8_t>, std::string> read_stdout(const std::vector<std::string>& argv);

// Starts argv[0] fully detached (double fork, new session) and does not wait.
std::expected<void, std::string> spawn_detached(const std::vector<std::string>& argv);

} // namespace subprocess
