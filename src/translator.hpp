#pragma once

#include <map>
#include <memory>
#include <string>

namespace pseudo_mt {

// Free-form hints for the model, e.g. "before" (preceding code) or
// "session_history" (interactive transcript).
using TranslationContext = std::map<std::string, std::string>;

class Translator {
public:
    virtual ~Translator() = default;

    // Per-thread isolation point: each worker gets its own translator clone.
    virtual std::unique_ptr<Translator> clone() const = 0;

    // Turns one natural-language instruction into code. May throw.
    virtual std::string translate(const std::string& instruction, const TranslationContext& context) = 0;
};

}  // namespace pseudo_mt
