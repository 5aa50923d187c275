#include "mapreducer/llm/prompt_template.hpp"
#include "mapreducer/exceptions.hpp"

#include <cstring>

namespace mapreducer::llm {

PromptTemplate::PromptTemplate(std::string source)
    : source_(std::move(source)) {}

PromptTemplate PromptTemplate::from_template(std::string source) {
    if (source.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ConfigurationException("Prompt template must not be empty");
    }
    if (source.find(PLACEHOLDER) == std::string::npos) {
        throw ConfigurationException("Prompt template must contain a {text} placeholder");
    }
    return PromptTemplate(std::move(source));
}

std::string PromptTemplate::format(const std::string& text) const {
    const std::size_t placeholder_len = std::strlen(PLACEHOLDER);
    std::string out;
    out.reserve(source_.size() + text.size());

    std::size_t pos = 0;
    while (true) {
        auto hit = source_.find(PLACEHOLDER, pos);
        if (hit == std::string::npos) {
            out.append(source_, pos, std::string::npos);
            break;
        }
        out.append(source_, pos, hit - pos);
        out += text;
        pos = hit + placeholder_len;
    }
    return out;
}

const std::string& PromptTemplate::source() const noexcept {
    return source_;
}

} // namespace mapreducer::llm
