#pragma once

#include <string>
#include <vector>

namespace docqa_core {

enum class Role { User, Assistant };

std::string to_string(Role role);
Role role_from_string(const std::string& str);

struct Turn {
  Role role;
  std::string content;

  bool operator==(const Turn& other) const = default;
};

// Oldest turn first.
using ConversationWindow = std::vector<Turn>;

}  // namespace docqa_core
