// 01_basic_summarize.cpp
//
// Summarizes a short document with a stand-in model client. The text is
// split into segments, every segment is summarized (MAP), and the partial
// summaries are combined pairwise until one remains (REDUCE).
//
// Swap KeywordModel for a real provider client to summarize for real.

#include <mapreducer/mapreducer.hpp>

#include <algorithm>
#include <iostream>
#include <sstream>
#include <thread>

using namespace mapreducer;
using namespace std::chrono_literals;

// Keeps the first few words of whatever follows the prompt header.
class KeywordModel : public llm::ModelClient {
public:
    ModelResponse invoke(const std::string& prompt, const InvokeOptions& options) override {
        std::this_thread::sleep_for(20ms);

        auto body = prompt.substr(prompt.find(':') + 1);
        std::istringstream words(body);
        std::string word;
        std::string out;
        for (int i = 0; i < 8 && words >> word; ++i) {
            if (word == "---") continue;
            out += (out.empty() ? "" : " ") + word;
        }

        Usage usage;
        usage.input_tokens = static_cast<TokenCount>(prompt.size() / 4);
        usage.output_tokens = std::min<TokenCount>(options.max_output_tokens,
                                                   static_cast<TokenCount>(out.size() / 4 + 1));
        return ModelResponse{out, usage};
    }
};

int main() {
    std::cout << "=== MapReducer: Basic Summarize Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Configuration from host parameters
    // ----------------------------------------------------------------
    ParameterMap params = {
        {"TOKENS_PER_MINUTE", "20000"},
        {"TOKEN_BUDGET_TIMEOUT", "30"},
        {"TOKEN_BUDGET_WINDOWS", "60"},
        {"REQUESTS_PER_MINUTE", "60"},
        {"QUEUE_INTERVAL", "60"},
        {"QUEUE_CONCURRENCY", "3"},
        {"MAP_OUT_MAX", "200"},
        {"REDUCE_OUT_MAX", "300"},
        {"HIERARCHY_GROUP_SIZE", "2"},
        {"TEMPERATURE", "0.2"},
        {"CHUNK_TOKENS", "40"},
        {"CHUNK_OVERLAP", "5"},
    };

    RunConfig config;
    try {
        config = load_run_config(params);
    } catch (const ConfigurationException& e) {
        std::cerr << "Bad configuration: " << e.what() << "\n";
        return 1;
    }

    // ----------------------------------------------------------------
    // 2. Summarizer
    // ----------------------------------------------------------------
    MapReduceSummarizer summarizer(
        config,
        std::make_shared<KeywordModel>(),
        std::make_shared<llm::ApproximateTokenCounter>(),
        llm::PromptTemplate::from_template("Summarize this passage:{text}"),
        llm::PromptTemplate::from_template("Merge these summaries:{text}"));
    summarizer.set_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));

    const std::string document =
        "Rate limits are enforced per minute by most model providers. A client "
        "that ignores them receives 429 responses and must back off.\n\n"
        "Token budgets are the second constraint. Each request consumes input "
        "and output tokens, and the provider caps the total per minute.\n\n"
        "Long documents exceed a single context window, so they are split into "
        "segments that are summarized independently.\n\n"
        "The partial summaries are then merged in a tree, a few at a time, until "
        "a single summary of the whole document remains.";

    // ----------------------------------------------------------------
    // 3. Run
    // ----------------------------------------------------------------
    try {
        auto summary = summarizer.summarize_text(document);
        std::cout << "\nSummary:\n  " << summary << "\n";
    } catch (const MapReducerException& e) {
        std::cerr << "Run failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nFinal state: " << to_string(summarizer.state()) << "\n";
    return 0;
}
