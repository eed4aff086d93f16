#pragma once

#include <string>

namespace rag_core {

// Random (version 4) UUID in canonical lowercase 8-4-4-4-12 form.
std::string generate_uuid();

// Accepts the canonical hyphenated form in either case.
bool is_valid_uuid(const std::string& text);

}  // namespace rag_core
