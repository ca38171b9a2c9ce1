#pragma once

#include <memory>
#include <string>

#include "docqa_core/types/conversation.hpp"

namespace docqa_core {

// Request/response boundary to the generative model.
class AnswerGenerator {
 public:
  virtual ~AnswerGenerator() = default;

  /**
   * @throw GenerationError on any failure; callers surface it without interpreting it.
   */
  virtual std::string generate(const ConversationWindow &history,
                               const std::string &query,
                               const std::string &context) = 0;
};

using AnswerGeneratorPtr = std::shared_ptr<AnswerGenerator>;

}  // namespace docqa_core
