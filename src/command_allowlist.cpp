#include "command_allowlist.hpp"

#include <cctype>
#include <string>
#include <unordered_set>

namespace toolrt {
namespace {

static const std::unordered_set<std::string>& AllowedCommands() {
  static const std::unordered_set<std::string> kAllowed = {
      "npx", "node", "bunx", "uvx", "python", "python3", "deno", "cmd", "powershell", "pwsh",
  };
  return kAllowed;
}

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

}  // namespace

bool IsAllowedCommand(const std::string& command) {
  const std::string trimmed = Trim(command);
  if (trimmed.empty()) return false;

  auto slash = trimmed.find_last_of("/\\");
  std::string base = slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
  for (auto& c : base) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  constexpr const char* kExeSuffix = ".exe";
  if (base.size() > 4 && base.compare(base.size() - 4, 4, kExeSuffix) == 0) base.resize(base.size() - 4);
  return AllowedCommands().count(base) > 0;
}

}  // namespace toolrt
