#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <mapreducer/mapreducer.hpp>

using namespace mapreducer;

namespace {
// Kept alive by the static exception object registered below.
py::handle g_provider_error;
}

py::handle provider_error_type() {
    return g_provider_error;
}

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_mapreducer, m) {
    m.doc() = "MapReducer: rate-limited hierarchical summarization";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_monitors(m);
    bind_core(m);
    bind_llm(m);
    bind_summarizer(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<RunState>(m, "RunState")
        .value("Idle",     RunState::Idle)
        .value("Mapping",  RunState::Mapping)
        .value("Reducing", RunState::Reducing)
        .value("Done",     RunState::Done)
        .value("Failed",   RunState::Failed)
        .export_values();

    py::enum_<Phase>(m, "Phase")
        .value("Map",    Phase::Map)
        .value("Reduce", Phase::Reduce)
        .export_values();

    py::enum_<FailureKind>(m, "FailureKind")
        .value("RateLimited", FailureKind::RateLimited)
        .value("ServerError", FailureKind::ServerError)
        .value("Fatal",       FailureKind::Fatal)
        .export_values();

    py::enum_<EncodingId>(m, "EncodingId")
        .value("O200k",  EncodingId::O200k)
        .value("Cl100k", EncodingId::Cl100k)
        .export_values();

    // ---- Structs ----------------------------------------------------------

    // RetryConfig
    py::class_<RetryConfig>(m, "RetryConfig")
        .def(py::init<>())
        .def_readwrite("max_retries", &RetryConfig::max_retries)
        .def_readwrite("base_delay",  &RetryConfig::base_delay)
        .def_readwrite("max_delay",   &RetryConfig::max_delay);

    // ChunkingConfig
    py::class_<ChunkingConfig>(m, "ChunkingConfig")
        .def(py::init<>())
        .def_readwrite("chunk_tokens",  &ChunkingConfig::chunk_tokens)
        .def_readwrite("chunk_overlap", &ChunkingConfig::chunk_overlap);

    // RunConfig (embeds retry and chunking)
    py::class_<RunConfig>(m, "RunConfig")
        .def(py::init<>())
        .def_readwrite("tokens_per_minute",        &RunConfig::tokens_per_minute)
        .def_readwrite("token_budget_window",      &RunConfig::token_budget_window)
        .def_readwrite("token_budget_timeout",     &RunConfig::token_budget_timeout)
        .def_readwrite("budget_poll_interval",     &RunConfig::budget_poll_interval)
        .def_readwrite("queue_concurrency",        &RunConfig::queue_concurrency)
        .def_readwrite("requests_per_minute",      &RunConfig::requests_per_minute)
        .def_readwrite("queue_interval",           &RunConfig::queue_interval)
        .def_readwrite("map_output_max_tokens",    &RunConfig::map_output_max_tokens)
        .def_readwrite("reduce_output_max_tokens", &RunConfig::reduce_output_max_tokens)
        .def_readwrite("hierarchy_group_size",     &RunConfig::hierarchy_group_size)
        .def_readwrite("temperature",              &RunConfig::temperature)
        .def_readwrite("encoding",                 &RunConfig::encoding)
        .def_readwrite("run_timeout",              &RunConfig::run_timeout)
        .def_readwrite("retry",                    &RunConfig::retry)
        .def_readwrite("chunking",                 &RunConfig::chunking)
        .def("validate", &RunConfig::validate);

    m.def("load_run_config", &load_run_config, py::arg("params"),
          "Build a RunConfig from named host parameters (string values).");
    m.def("parse_encoding", &parse_encoding, py::arg("name"));

    // ---- Constants --------------------------------------------------------

    m.attr("GROUP_SEPARATOR") = GROUP_SEPARATOR;
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_MapReducerError =
        py::register_exception<MapReducerException>(m, "MapReducerError", PyExc_RuntimeError);

    static auto py_ConfigurationError =
        py::register_exception<ConfigurationException>(m, "ConfigurationError", py_MapReducerError.ptr());

    // Derived from ConfigurationError
    static auto py_ImpossibleEstimateError =
        py::register_exception<ImpossibleEstimateException>(m, "ImpossibleEstimateError", py_ConfigurationError.ptr());

    // Derived from MapReducerError
    static auto py_BudgetTimeoutError =
        py::register_exception<BudgetTimeoutException>(m, "BudgetTimeoutError", py_MapReducerError.ptr());
    static auto py_ProviderError =
        py::register_exception<ProviderException>(m, "ProviderError", py_MapReducerError.ptr());
    static auto py_RetriesExhaustedError =
        py::register_exception<RetriesExhaustedException>(m, "RetriesExhaustedError", py_MapReducerError.ptr());
    static auto py_EmptyResponseError =
        py::register_exception<EmptyResponseException>(m, "EmptyResponseError", py_MapReducerError.ptr());
    static auto py_NoSegmentsSucceededError =
        py::register_exception<NoSegmentsSucceededException>(m, "NoSegmentsSucceededError", py_MapReducerError.ptr());
    static auto py_ReduceFailureError =
        py::register_exception<ReduceFailureException>(m, "ReduceFailureError", py_MapReducerError.ptr());
    static auto py_CancelledError =
        py::register_exception<CancelledException>(m, "CancelledError", py_MapReducerError.ptr());

    g_provider_error = py_ProviderError.ptr();
}
