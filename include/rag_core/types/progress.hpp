#pragma once

#include <functional>
#include <string>

namespace rag_core {

// Receives a fraction in [0, 1] and a short status line
using ProgressUpdater = std::function<void(float, const std::string&)>;

}  // namespace rag_core
