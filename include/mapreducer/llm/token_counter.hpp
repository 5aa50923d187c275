#pragma once

#include "mapreducer/types.hpp"

#include <string>

namespace mapreducer::llm {

// Deterministic, monotone token count of a text under an encoding.
class TokenCounter {
public:
    virtual ~TokenCounter() = default;

    virtual TokenCount count(const std::string& text, EncodingId encoding) const = 0;
};

// Character-ratio estimate: ceil(code_points / ratio), 0 for empty text.
// Roughly 4 characters per token for o200k and 3.6 for cl100k.
class ApproximateTokenCounter : public TokenCounter {
public:
    TokenCount count(const std::string& text, EncodingId encoding) const override;

    static double characters_per_token(EncodingId encoding) noexcept;
};

// Number of UTF-8 code points in `text` (continuation bytes are not counted).
std::size_t count_code_points(const std::string& text) noexcept;

} // namespace mapreducer::llm
