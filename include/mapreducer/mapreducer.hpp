#pragma once

// MapReducer: rate-limited hierarchical summarization
//
// Admits every language-model call against a tokens-per-minute budget and a
// requests-per-minute job queue, retries transient provider failures, and
// tree-reduces the per-segment summaries into one result.

// Core
#include "mapreducer/types.hpp"
#include "mapreducer/exceptions.hpp"
#include "mapreducer/config.hpp"
#include "mapreducer/monitor.hpp"
#include "mapreducer/cancellation.hpp"

// Scheduling
#include "mapreducer/token_budget_tracker.hpp"
#include "mapreducer/retry_policy.hpp"
#include "mapreducer/job_queue.hpp"
#include "mapreducer/hierarchical_reducer.hpp"

// Language-model collaborators
#include "mapreducer/llm/model_client.hpp"
#include "mapreducer/llm/token_counter.hpp"
#include "mapreducer/llm/prompt_template.hpp"
#include "mapreducer/llm/text_splitter.hpp"

// Orchestration
#include "mapreducer/summarizer.hpp"
