#pragma once

#include "mapreducer/cancellation.hpp"
#include "mapreducer/config.hpp"
#include "mapreducer/hierarchical_reducer.hpp"
#include "mapreducer/llm/model_client.hpp"
#include "mapreducer/llm/prompt_template.hpp"
#include "mapreducer/llm/token_counter.hpp"
#include "mapreducer/monitor.hpp"
#include "mapreducer/types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mapreducer {

class JobQueue;
class RetryPolicy;
class TokenBudgetTracker;
class TokenReservation;

// Map-reduce summarization of ordered segments against a rate-limited model.
//
// Every model call reserves its estimate against the token budget first
// (waiting up to token_budget_timeout), then passes the job queue's
// concurrency and request caps, and runs under the retry policy. Once the
// call completes the reservation is swapped for the reported usage. Map outputs are combined by hierarchical_reduce until a
// single summary remains.
//
// Each summarize() call owns a fresh tracker and queue. Only one run may be in
// progress per instance at a time.
class MapReduceSummarizer {
public:
    // Throws ConfigurationException if `config` is invalid or a collaborator
    // is missing.
    MapReduceSummarizer(RunConfig config,
                        std::shared_ptr<llm::ModelClient> model,
                        std::shared_ptr<llm::TokenCounter> counter,
                        llm::PromptTemplate map_prompt,
                        llm::PromptTemplate combine_prompt);

    MapReduceSummarizer(const MapReduceSummarizer&) = delete;
    MapReduceSummarizer& operator=(const MapReduceSummarizer&) = delete;

    void set_monitor(std::shared_ptr<Monitor> monitor);

    // Blocking. Returns the trimmed final summary or throws the run-level error.
    std::string summarize(const std::vector<Segment>& segments);

    // Splits `text` with a TextSplitter (chunking from the config) first.
    std::string summarize_text(const std::string& text);

    // Cancels the run in progress. Safe from any thread.
    void cancel();

    RunState state() const noexcept;
    const RunConfig& config() const noexcept;

private:
    struct Run {
        TokenBudgetTracker& tracker;
        JobQueue& queue;
        const RetryPolicy& retry;
        CancellationToken token;
        std::shared_ptr<Monitor> monitor;
    };

    struct PlannedCall {
        SegmentIndex segment;
        std::string prompt;
        TokenCount estimate;
    };

    RunConfig config_;
    std::shared_ptr<llm::ModelClient> model_;
    std::shared_ptr<llm::TokenCounter> counter_;
    llm::PromptTemplate map_prompt_;
    llm::PromptTemplate combine_prompt_;

    mutable std::mutex mutex_;
    std::shared_ptr<Monitor> monitor_;
    CancellationToken current_token_;
    std::atomic<RunState> state_{RunState::Idle};

    std::string execute(const std::vector<Segment>& segments, Run& run);

    std::vector<std::string> map_phase(const std::vector<Segment>& segments, Run& run);
    std::string reduce_phase(std::vector<std::string> partials, Run& run);
    std::string combine_group(const std::vector<std::string>& group, const GroupInfo& info,
                              Run& run);

    TokenCount estimate_tokens(const std::string& prompt, TokenCount max_output) const;

    // Blocks until the budget reserves `estimate`; throws BudgetTimeoutException.
    std::shared_ptr<TokenReservation> admit(Run& run, Phase phase,
                                            std::optional<SegmentIndex> segment,
                                            TokenCount estimate,
                                            const MonitorEvent& context);

    // Retried model call; settles `hold` either way. Runs on a queue worker.
    std::string call_model(Run& run, const std::string& prompt, Phase phase,
                           TokenCount max_output, TokenReservation& hold,
                           const MonitorEvent& context);

    void set_state(RunState s) noexcept;
};

} // namespace mapreducer
