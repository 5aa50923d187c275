#include "mapreducer/llm/token_counter.hpp"

#include <cmath>

namespace mapreducer::llm {

std::size_t count_code_points(const std::string& text) noexcept {
    std::size_t n = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

double ApproximateTokenCounter::characters_per_token(EncodingId encoding) noexcept {
    switch (encoding) {
        case EncodingId::O200k:  return 4.0;
        case EncodingId::Cl100k: return 3.6;
    }
    return 4.0;
}

TokenCount ApproximateTokenCounter::count(const std::string& text, EncodingId encoding) const {
    auto chars = count_code_points(text);
    if (chars == 0) return 0;
    return static_cast<TokenCount>(
        std::ceil(static_cast<double>(chars) / characters_per_token(encoding)));
}

} // namespace mapreducer::llm
