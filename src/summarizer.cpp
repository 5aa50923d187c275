#include "mapreducer/summarizer.hpp"
#include "mapreducer/exceptions.hpp"
#include "mapreducer/job_queue.hpp"
#include "mapreducer/llm/text_splitter.hpp"
#include "mapreducer/retry_policy.hpp"
#include "mapreducer/token_budget_tracker.hpp"

#include <future>

namespace mapreducer {

namespace {

MonitorEvent phase_event(EventType type, Phase phase, std::string message) {
    MonitorEvent event;
    event.type = type;
    event.phase = phase;
    event.message = std::move(message);
    return event;
}

} // anonymous namespace

MapReduceSummarizer::MapReduceSummarizer(RunConfig config,
                                         std::shared_ptr<llm::ModelClient> model,
                                         std::shared_ptr<llm::TokenCounter> counter,
                                         llm::PromptTemplate map_prompt,
                                         llm::PromptTemplate combine_prompt)
    : config_(std::move(config))
    , model_(std::move(model))
    , counter_(std::move(counter))
    , map_prompt_(std::move(map_prompt))
    , combine_prompt_(std::move(combine_prompt))
{
    config_.validate();
    if (!model_) {
        throw ConfigurationException("A model client is required");
    }
    if (!counter_) {
        throw ConfigurationException("A token counter is required");
    }
}

void MapReduceSummarizer::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

RunState MapReduceSummarizer::state() const noexcept {
    return state_.load();
}

const RunConfig& MapReduceSummarizer::config() const noexcept {
    return config_;
}

void MapReduceSummarizer::set_state(RunState s) noexcept {
    state_.store(s);
}

void MapReduceSummarizer::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_token_.cancel();
}

// ==================== Run ====================

std::string MapReduceSummarizer::summarize_text(const std::string& text) {
    llm::TextSplitter splitter(counter_, config_.encoding,
                               config_.chunking.chunk_tokens,
                               config_.chunking.chunk_overlap);
    return summarize(splitter.split_segments(text));
}

std::string MapReduceSummarizer::summarize(const std::vector<Segment>& segments) {
    CancellationToken token;
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto s = state_.load();
        if (s == RunState::Mapping || s == RunState::Reducing) {
            throw MapReducerException("A run is already in progress");
        }
        current_token_ = token;
        monitor = monitor_;
        set_state(RunState::Mapping);
    }
    if (config_.run_timeout > Duration::zero()) {
        token.set_deadline(Clock::now() + config_.run_timeout);
    }

    // Jobs reference `run`, the tracker and the retry policy. Every exit path
    // below stops the queue, joining its workers, before any of those go.
    TokenBudgetTracker tracker(config_.tokens_per_minute, config_.token_budget_window);
    tracker.set_monitor(monitor);
    RetryPolicy retry(config_.retry);
    retry.set_monitor(monitor);
    JobQueue queue(config_.queue_concurrency, config_.requests_per_minute, config_.queue_interval);
    queue.set_monitor(monitor);

    Run run{tracker, queue, retry, token, monitor};

    MonitorEvent started;
    started.type = EventType::RunStarted;
    started.message = "Summarizing " + std::to_string(segments.size()) + " segments";
    started.count = segments.size();
    emit(monitor, started);

    try {
        auto summary = execute(segments, run);
        queue.stop();
        set_state(RunState::Done);

        MonitorEvent done;
        done.type = EventType::RunCompleted;
        done.message = "Summary complete";
        done.count = summary.size();
        emit(monitor, done);
        return summary;
    } catch (const CancelledException& e) {
        queue.stop();
        set_state(RunState::Failed);
        MonitorEvent event;
        event.type = EventType::RunCancelled;
        event.message = e.what();
        emit(monitor, event);
        throw;
    } catch (const std::exception& e) {
        queue.stop();
        set_state(RunState::Failed);
        MonitorEvent event;
        event.type = EventType::RunFailed;
        event.message = e.what();
        emit(monitor, event);
        throw;
    }
}

std::string MapReduceSummarizer::execute(const std::vector<Segment>& segments, Run& run) {
    auto partials = map_phase(segments, run);
    set_state(RunState::Reducing);
    return reduce_phase(std::move(partials), run);
}

// ==================== Map Phase ====================

std::vector<std::string> MapReduceSummarizer::map_phase(const std::vector<Segment>& segments,
                                                        Run& run) {
    // Render and estimate everything up front so an impossible request fails
    // the run before any call is made.
    std::vector<PlannedCall> plan;
    plan.reserve(segments.size());
    for (SegmentIndex i = 0; i < segments.size(); ++i) {
        if (llm::trim_whitespace(segments[i].text).empty()) {
            auto event = phase_event(EventType::SegmentSkipped, Phase::Map, "Segment has no text");
            event.segment = i;
            emit(run.monitor, event);
            continue;
        }
        auto prompt = map_prompt_.format(segments[i].text);
        auto estimate = estimate_tokens(prompt, config_.map_output_max_tokens);
        if (estimate > run.tracker.capacity()) {
            throw ImpossibleEstimateException(Phase::Map, i, estimate, run.tracker.capacity());
        }
        plan.push_back(PlannedCall{i, std::move(prompt), estimate});
    }

    struct InFlight {
        SegmentIndex segment;
        std::future<std::string> result;
    };
    std::vector<InFlight> in_flight;
    in_flight.reserve(plan.size());

    for (auto& call : plan) {
        run.token.throw_if_cancelled();

        MonitorEvent context;
        context.phase = Phase::Map;
        context.segment = call.segment;

        auto hold = admit(run, Phase::Map, call.segment, call.estimate, context);

        auto future = run.queue.submit(
            [this, &run, prompt = std::move(call.prompt), hold, context] {
                return call_model(run, prompt, Phase::Map, config_.map_output_max_tokens,
                                  *hold, context);
            },
            context);
        in_flight.push_back(InFlight{call.segment, std::move(future)});
    }

    // Awaiting in submission order yields partials ordered by segment index
    // however the calls completed.
    std::vector<std::string> partials;
    partials.reserve(in_flight.size());
    for (auto& job : in_flight) {
        try {
            partials.push_back(await_result(job.result, run.token));
            auto event = phase_event(EventType::SegmentCompleted, Phase::Map, "Segment summarized");
            event.segment = job.segment;
            event.count = partials.back().size();
            emit(run.monitor, event);
        } catch (const CancelledException&) {
            throw;
        } catch (const std::exception& e) {
            auto event = phase_event(EventType::SegmentSkipped, Phase::Map, e.what());
            event.segment = job.segment;
            emit(run.monitor, event);
        }
    }

    if (partials.empty()) {
        throw NoSegmentsSucceededException(segments.size());
    }

    auto event = phase_event(EventType::MapPhaseCompleted, Phase::Map,
                             std::to_string(partials.size()) + "/" +
                             std::to_string(segments.size()) + " segments summarized");
    event.count = partials.size();
    emit(run.monitor, event);
    return partials;
}

// ==================== Reduce Phase ====================

std::string MapReduceSummarizer::reduce_phase(std::vector<std::string> partials, Run& run) {
    auto combine = [this, &run](std::vector<std::string> group, GroupInfo info) {
        // Each group waits for budget and for its queue result on its own
        // task, so the groups of a round proceed concurrently.
        return std::async(std::launch::async,
                          [this, &run, group = std::move(group), info] {
                              return combine_group(group, info, run);
                          });
    };

    ReduceObserver observer;
    observer.round_started = [&run](std::size_t round, std::size_t groups) {
        auto event = phase_event(EventType::ReduceRoundStarted, Phase::Reduce,
                                 "Combining " + std::to_string(groups) + " groups");
        event.round = round;
        event.count = groups;
        emit(run.monitor, event);
    };
    observer.round_completed = [&run](std::size_t round, std::size_t outputs) {
        auto event = phase_event(EventType::ReduceRoundCompleted, Phase::Reduce,
                                 std::to_string(outputs) + " results remain");
        event.round = round;
        event.count = outputs;
        emit(run.monitor, event);
    };

    auto summary = llm::trim_whitespace(
        hierarchical_reduce(std::move(partials), combine, config_.hierarchy_group_size, observer));
    if (summary.empty()) {
        throw ReduceFailureException(0, 0, "Final summary is empty");
    }
    return summary;
}

std::string MapReduceSummarizer::combine_group(const std::vector<std::string>& group,
                                               const GroupInfo& info,
                                               Run& run) {
    MonitorEvent context;
    context.phase = Phase::Reduce;
    context.round = info.round;
    context.group = info.index;

    try {
        auto joined = join_group(group);
        if (llm::trim_whitespace(joined).empty()) {
            throw EmptyResponseException("Reduce group has no text");
        }

        auto prompt = combine_prompt_.format(joined);
        auto estimate = estimate_tokens(prompt, config_.reduce_output_max_tokens);
        if (estimate > run.tracker.capacity()) {
            throw ImpossibleEstimateException(Phase::Reduce, std::nullopt, estimate,
                                              run.tracker.capacity());
        }

        auto hold = admit(run, Phase::Reduce, std::nullopt, estimate, context);

        auto future = run.queue.submit(
            [this, &run, prompt = std::move(prompt), hold, context] {
                return call_model(run, prompt, Phase::Reduce, config_.reduce_output_max_tokens,
                                  *hold, context);
            },
            context);
        auto text = await_result(future, run.token);

        auto event = context;
        event.type = EventType::ReduceGroupCompleted;
        event.message = "Group " + std::to_string(info.index + 1) + "/" +
                        std::to_string(info.group_count) + " combined";
        event.count = text.size();
        emit(run.monitor, event);
        return text;
    } catch (const ConfigurationException&) {
        throw;
    } catch (const BudgetTimeoutException&) {
        throw;
    } catch (const CancelledException&) {
        throw;
    } catch (const std::exception& e) {
        throw ReduceFailureException(info.round, info.index, e.what());
    }
}

// ==================== Shared Call Path ====================

TokenCount MapReduceSummarizer::estimate_tokens(const std::string& prompt,
                                                TokenCount max_output) const {
    return counter_->count(prompt, config_.encoding) + max_output;
}

std::shared_ptr<TokenReservation> MapReduceSummarizer::admit(
    Run& run, Phase phase, std::optional<SegmentIndex> segment,
    TokenCount estimate, const MonitorEvent& context) {
    if (run.tracker.reserve(estimate, config_.token_budget_timeout,
                            config_.budget_poll_interval, run.token)) {
        // Shared with the queued job; a job dropped unrun releases it.
        return std::make_shared<TokenReservation>(run.tracker, estimate);
    }

    auto remaining = run.tracker.remaining();
    auto event = context;
    event.type = EventType::BudgetTimedOut;
    event.message = "Token budget not available in time";
    event.tokens = estimate;
    event.remaining = remaining;
    emit(run.monitor, event);

    throw BudgetTimeoutException(phase, segment, estimate, remaining,
                                 config_.token_budget_timeout);
}

std::string MapReduceSummarizer::call_model(Run& run, const std::string& prompt, Phase phase,
                                            TokenCount max_output, TokenReservation& hold,
                                            const MonitorEvent& context) {
    InvokeOptions options;
    options.max_output_tokens = max_output;
    options.temperature = config_.temperature;

    ModelResponse response;
    try {
        response = run.retry.execute(
            [this, &prompt, &options] { return model_->invoke(prompt, options); },
            run.token, context);
    } catch (const std::exception&) {
        hold.release();
        throw;
    }

    // Actual usage when reported, the admission estimate otherwise.
    hold.commit(extract_total_tokens(response.usage).value_or(hold.amount()));

    auto text = llm::trim_whitespace(response.content);
    if (text.empty()) {
        throw EmptyResponseException(std::string("Empty response from model in ") +
                                     to_string(phase) + " phase");
    }
    return text;
}

} // namespace mapreducer
