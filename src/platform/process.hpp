#pragma once

#include <expected>
#include <string>
#include <vector>

namespace platform {

// Runs argv[0] (looked up on PATH when it has no slash) and waits for it.
// Fails if the child cannot be started or exits non-zero; the error carries
// the tail of the child's stderr when there is one.
std::expected<void, std::string> run_process(const std::vector<std::string>& argv);

} // namespace platform
