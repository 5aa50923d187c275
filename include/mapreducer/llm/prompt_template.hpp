#pragma once

#include <string>

namespace mapreducer::llm {

// Prompt with a {text} placeholder.
class PromptTemplate {
public:
    static constexpr const char* PLACEHOLDER = "{text}";

    // Throws ConfigurationException if the template is blank or has no
    // {text} placeholder.
    static PromptTemplate from_template(std::string source);

    // Replaces every {text} occurrence with `text`.
    std::string format(const std::string& text) const;

    const std::string& source() const noexcept;

private:
    explicit PromptTemplate(std::string source);

    std::string source_;
};

} // namespace mapreducer::llm
