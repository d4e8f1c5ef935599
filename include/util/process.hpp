#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fdrop::util {

std::optional<std::filesystem::path> findExecutable(const std::string& name);

// Runs argv[0] (looked up on PATH) with input written to its stdin and returns
// the exit status. Throws std::runtime_error if the process cannot be started.
int runWithInput(const std::vector<std::string>& argv, const std::string& input = {});

}
