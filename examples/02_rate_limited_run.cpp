// 02_rate_limited_run.cpp
//
// A run against a deliberately tight budget. The token budget admits only a
// few calls per window, the queue starts at most two requests per interval,
// and the stand-in provider answers every third call with a 429. The run
// still completes: calls wait for budget, the queue spaces them out and the
// retry policy absorbs the rate limit responses.

#include <mapreducer/mapreducer.hpp>

#include <atomic>
#include <iostream>
#include <thread>

using namespace mapreducer;
using namespace std::chrono_literals;

class FlakyModel : public llm::ModelClient {
public:
    ModelResponse invoke(const std::string& prompt, const InvokeOptions&) override {
        int n = ++calls_;
        std::this_thread::sleep_for(30ms);
        if (n % 3 == 0) {
            throw ProviderException(429, "Too Many Requests", 0.2);
        }
        Usage usage;
        usage.total_tokens = 40;
        return ModelResponse{"summary #" + std::to_string(n) + " (" +
                             std::to_string(prompt.size()) + " chars in)", usage};
    }

    int calls() const { return calls_.load(); }

private:
    std::atomic<int> calls_{0};
};

int main() {
    std::cout << "=== MapReducer: Rate Limited Run Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Tight limits, short windows
    // ----------------------------------------------------------------
    RunConfig config;
    config.tokens_per_minute = 200;
    config.token_budget_window = 1s;
    config.token_budget_timeout = 10s;
    config.budget_poll_interval = 50ms;
    config.requests_per_minute = 2;
    config.queue_interval = 500ms;
    config.queue_concurrency = 2;
    config.map_output_max_tokens = 40;
    config.reduce_output_max_tokens = 60;
    config.hierarchy_group_size = 3;
    config.retry.max_retries = 3;
    config.retry.base_delay = 100ms;
    config.retry.max_delay = 400ms;

    auto model = std::make_shared<FlakyModel>();
    MapReduceSummarizer summarizer(
        config, model,
        std::make_shared<llm::ApproximateTokenCounter>(),
        llm::PromptTemplate::from_template("Summarize: {text}"),
        llm::PromptTemplate::from_template("Combine: {text}"));

    // Console output plus metrics collection.
    auto console = std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose);
    auto metrics = std::make_shared<MetricsMonitor>();
    auto composite = std::make_shared<CompositeMonitor>();
    composite->add_monitor(console);
    composite->add_monitor(metrics);
    summarizer.set_monitor(composite);

    // ----------------------------------------------------------------
    // 2. Segments
    // ----------------------------------------------------------------
    std::vector<Segment> segments;
    for (SegmentIndex i = 0; i < 7; ++i) {
        segments.push_back(Segment{"Chapter " + std::to_string(i + 1) + " text", 4, i});
    }

    // ----------------------------------------------------------------
    // 3. Run
    // ----------------------------------------------------------------
    auto start = Clock::now();
    try {
        auto summary = summarizer.summarize(segments);
        std::cout << "\nSummary: " << summary << "\n";
    } catch (const BudgetTimeoutException& e) {
        std::cerr << "Budget never freed up: " << e.what() << "\n";
        return 1;
    } catch (const MapReducerException& e) {
        std::cerr << "Run failed: " << e.what() << "\n";
        return 1;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    // ----------------------------------------------------------------
    // 4. Metrics
    // ----------------------------------------------------------------
    auto m = metrics->get_metrics();
    std::cout << "\n--- Metrics ---\n"
              << "  Model calls:        " << model->calls() << "\n"
              << "  Map jobs:           " << m.map_calls << "\n"
              << "  Reduce jobs:        " << m.reduce_calls << "\n"
              << "  Reduce rounds:      " << m.reduce_rounds << "\n"
              << "  Retries:            " << m.retries << "\n"
              << "  Segments skipped:   " << m.segments_skipped << "\n"
              << "  Budget waits:       " << m.budget_waits << "\n"
              << "  Avg budget wait:    " << m.average_budget_wait_ms << " ms\n"
              << "  Tokens recorded:    " << m.tokens_recorded << "\n"
              << "  Elapsed:            " << elapsed.count() << " ms\n";
    return 0;
}
