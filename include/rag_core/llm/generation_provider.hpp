#pragma once

#include <string>
#include <vector>

namespace rag_core {

class GenerationError : public std::exception {
 public:
  explicit GenerationError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

enum class TurnRole { User, Model };

struct ConversationTurn {
  TurnRole role;
  std::string text;
};

struct GenerationParams {
  float temperature = 0.2f;
  int max_output_tokens = 1024;
  // Provider default when empty
  std::string model;
};

// External text-generation backend
class GenerationProvider {
 public:
  virtual ~GenerationProvider() = default;

  // Returns the answer text; throws GenerationError on any failure, including an empty answer
  virtual std::string generate(const std::string& system_prompt,
                               const std::vector<ConversationTurn>& turns,
                               const GenerationParams& params) = 0;
};

}  // namespace rag_core
