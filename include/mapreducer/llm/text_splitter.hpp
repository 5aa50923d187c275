#pragma once

#include "mapreducer/llm/token_counter.hpp"
#include "mapreducer/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace mapreducer::llm {

// Copy of `s` without leading and trailing ASCII whitespace.
std::string trim_whitespace(const std::string& s);

// Token-aware recursive splitter.
//
// Splits on the first separator present in the text ("\n\n", then "\n",
// then " ", then per character), recursing into pieces that are still too
// large, and merges adjacent pieces back into chunks of at most chunk_size
// tokens. Consecutive chunks share a tail of at most chunk_overlap tokens.
class TextSplitter {
public:
    TextSplitter(std::shared_ptr<TokenCounter> counter,
                 EncodingId encoding,
                 TokenCount chunk_size,
                 TokenCount chunk_overlap);

    std::vector<std::string> split_text(const std::string& text) const;

    // split_text() plus per-chunk token counts and positions.
    std::vector<Segment> split_segments(const std::string& text) const;

    TokenCount chunk_size() const noexcept;
    TokenCount chunk_overlap() const noexcept;

private:
    std::shared_ptr<TokenCounter> counter_;
    EncodingId encoding_;
    TokenCount chunk_size_;
    TokenCount chunk_overlap_;
    std::vector<std::string> separators_;

    TokenCount length(const std::string& s) const;

    void split_recursive(const std::string& text,
                         std::size_t separator_index,
                         std::vector<std::string>& out) const;

    void merge_splits(const std::vector<std::string>& splits,
                      const std::string& separator,
                      std::vector<std::string>& out) const;
};

} // namespace mapreducer::llm
