#pragma once

#include <string>

#include "docqa_core/types/conversation.hpp"

namespace docqa_core {

// Bounded conversation history. A window of W exchanges keeps at most 2W turns.
namespace conversation {

constexpr int DEFAULT_WINDOW_EXCHANGES = 3;

ConversationWindow append_turn(ConversationWindow window, Role role, const std::string &content);

// Keeps the last 2 * window_exchanges turns in order. Negative counts as 0.
ConversationWindow trim(ConversationWindow window, int window_exchanges);

// Appends the question and its answer, then trims.
ConversationWindow record_exchange(ConversationWindow window,
                                   const std::string &question,
                                   const std::string &answer,
                                   int window_exchanges = DEFAULT_WINDOW_EXCHANGES);

}  // namespace conversation
}  // namespace docqa_core
