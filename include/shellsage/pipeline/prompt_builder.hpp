#pragma once
#include <string>
#include <shellsage/context/error_context.hpp>

namespace shellsage {

// Persona, response format (🧠 Analysis / 🛠️ Command / 📝 Details / ⚠️ Warning) and environment.
std::string build_generation_prompt(const std::string& query, const GenerationContext& ctx);

// Terminal context plus the <think> block and the five diagnosis labels.
std::string build_diagnosis_prompt(const ErrorContext& ctx);

} // namespace shellsage
