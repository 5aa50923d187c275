#include "mapreducer/llm/text_splitter.hpp"

#include <deque>
#include <stdexcept>

namespace mapreducer::llm {

namespace {

std::vector<std::string> split_on(const std::string& text, const std::string& separator) {
    std::vector<std::string> parts;
    if (separator.empty()) {
        // One piece per UTF-8 code point.
        for (std::size_t i = 0; i < text.size();) {
            std::size_t len = 1;
            while (i + len < text.size() &&
                   (static_cast<unsigned char>(text[i + len]) & 0xC0) == 0x80) {
                ++len;
            }
            parts.push_back(text.substr(i, len));
            i += len;
        }
        return parts;
    }

    std::size_t pos = 0;
    while (true) {
        auto hit = text.find(separator, pos);
        std::string piece = text.substr(pos, hit == std::string::npos ? std::string::npos
                                                                      : hit - pos);
        if (!piece.empty()) parts.push_back(std::move(piece));
        if (hit == std::string::npos) break;
        pos = hit + separator.size();
    }
    return parts;
}

std::string join(const std::deque<std::string>& parts, const std::string& separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

} // anonymous namespace

std::string trim_whitespace(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

TextSplitter::TextSplitter(std::shared_ptr<TokenCounter> counter,
                           EncodingId encoding,
                           TokenCount chunk_size,
                           TokenCount chunk_overlap)
    : counter_(std::move(counter))
    , encoding_(encoding)
    , chunk_size_(chunk_size)
    , chunk_overlap_(chunk_overlap)
    , separators_{"\n\n", "\n", " ", ""}
{
    if (!counter_) {
        throw std::invalid_argument("TextSplitter requires a token counter");
    }
    if (chunk_size_ <= 0) {
        throw std::invalid_argument("TextSplitter chunk_size must be positive");
    }
    if (chunk_overlap_ < 0 || chunk_overlap_ >= chunk_size_) {
        throw std::invalid_argument("TextSplitter chunk_overlap must be in [0, chunk_size)");
    }
}

std::vector<std::string> TextSplitter::split_text(const std::string& text) const {
    std::vector<std::string> chunks;
    split_recursive(text, 0, chunks);
    return chunks;
}

std::vector<Segment> TextSplitter::split_segments(const std::string& text) const {
    auto chunks = split_text(text);
    std::vector<Segment> segments;
    segments.reserve(chunks.size());
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        Segment seg;
        seg.approximate_token_count = length(chunks[i]);
        seg.text = std::move(chunks[i]);
        seg.index = i;
        segments.push_back(std::move(seg));
    }
    return segments;
}

TokenCount TextSplitter::chunk_size() const noexcept { return chunk_size_; }
TokenCount TextSplitter::chunk_overlap() const noexcept { return chunk_overlap_; }

TokenCount TextSplitter::length(const std::string& s) const {
    return counter_->count(s, encoding_);
}

void TextSplitter::split_recursive(const std::string& text,
                                   std::size_t separator_index,
                                   std::vector<std::string>& out) const {
    // Pick the first separator that occurs in the text; "" always matches.
    std::size_t chosen = separators_.size() - 1;
    for (std::size_t i = separator_index; i < separators_.size(); ++i) {
        if (separators_[i].empty() || text.find(separators_[i]) != std::string::npos) {
            chosen = i;
            break;
        }
    }
    const std::string& separator = separators_[chosen];
    const bool can_recurse = chosen + 1 < separators_.size();

    std::vector<std::string> good;
    for (auto& piece : split_on(text, separator)) {
        if (length(piece) < chunk_size_) {
            good.push_back(std::move(piece));
            continue;
        }
        if (!good.empty()) {
            merge_splits(good, separator, out);
            good.clear();
        }
        if (can_recurse) {
            split_recursive(piece, chosen + 1, out);
        } else {
            out.push_back(std::move(piece));
        }
    }
    if (!good.empty()) {
        merge_splits(good, separator, out);
    }
}

void TextSplitter::merge_splits(const std::vector<std::string>& splits,
                                const std::string& separator,
                                std::vector<std::string>& out) const {
    const TokenCount separator_len = length(separator);

    std::deque<std::string> current;
    std::deque<TokenCount> lengths;
    TokenCount total = 0;

    for (const auto& piece : splits) {
        const TokenCount len = length(piece);
        const TokenCount joined = current.empty() ? 0 : separator_len;

        if (total + len + joined > chunk_size_ && !current.empty()) {
            auto chunk = trim_whitespace(join(current, separator));
            if (!chunk.empty()) out.push_back(std::move(chunk));

            // Drop from the front until what is left fits as overlap.
            while (!current.empty() &&
                   (total > chunk_overlap_ ||
                    total + len + (current.empty() ? 0 : separator_len) > chunk_size_)) {
                total -= lengths.front() + (current.size() > 1 ? separator_len : 0);
                current.pop_front();
                lengths.pop_front();
            }
        }

        total += len + (current.empty() ? 0 : separator_len);
        current.push_back(piece);
        lengths.push_back(len);
    }

    auto chunk = trim_whitespace(join(current, separator));
    if (!chunk.empty()) out.push_back(std::move(chunk));
}

} // namespace mapreducer::llm
