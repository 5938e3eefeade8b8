#pragma once

#include <string>

namespace toolrt {

// True when the launch command names one of the interpreter/runtime binaries tool providers
// are allowed to run through. Path components and a trailing ".exe" are ignored.
bool IsAllowedCommand(const std::string& command);

}  // namespace toolrt
