#include "docqa_core/services/conversation.hpp"

namespace docqa_core {
namespace conversation {

ConversationWindow append_turn(ConversationWindow window, Role role, const std::string &content) {
  window.push_back(Turn{role, content});
  return window;
}

ConversationWindow trim(ConversationWindow window, int window_exchanges) {
  const size_t max_turns = window_exchanges > 0 ? static_cast<size_t>(window_exchanges) * 2 : 0;
  if (window.size() > max_turns) {
    window.erase(window.begin(), window.end() - static_cast<std::ptrdiff_t>(max_turns));
  }
  return window;
}

ConversationWindow record_exchange(ConversationWindow window,
                                   const std::string &question,
                                   const std::string &answer,
                                   int window_exchanges) {
  window = append_turn(std::move(window), Role::User, question);
  window = append_turn(std::move(window), Role::Assistant, answer);
  return trim(std::move(window), window_exchanges);
}

}  // namespace conversation
}  // namespace docqa_core
