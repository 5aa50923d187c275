#include "bind_forward.hpp"
#include <mapreducer/mapreducer.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <set>

using namespace mapreducer;

// Trampoline class to allow Python subclassing of Monitor
class PyMonitor : public Monitor {
public:
    using Monitor::Monitor;

    void on_event(const MonitorEvent& event) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, Monitor, on_event, event);
    }
};

namespace {

// Forwards events to a Python callable, optionally only some event types.
// Events arrive on queue workers and reduce tasks; the GIL is taken per call.
class CallbackMonitor : public Monitor {
public:
    CallbackMonitor(py::function callback, std::set<EventType> only)
        : callback_(std::move(callback))
        , only_(std::move(only)) {}

    ~CallbackMonitor() override {
        // The last reference may be dropped by a run thread without the GIL.
        py::gil_scoped_acquire acquire;
        callback_ = py::function();
    }

    void on_event(const MonitorEvent& event) override {
        if (!only_.empty() && only_.count(event.type) == 0) return;
        py::gil_scoped_acquire acquire;
        try {
            callback_(event);
        } catch (py::error_already_set& e) {
            // A failing callback must not fail the model call that emitted.
            e.discard_as_unraisable("mapreducer monitor callback");
        }
    }

private:
    py::function callback_;
    std::set<EventType> only_;
};

py::dict metrics_as_dict(const MetricsMonitor::Metrics& m) {
    py::dict d;
    d["runs_started"] = m.runs_started;
    d["runs_completed"] = m.runs_completed;
    d["runs_failed"] = m.runs_failed;
    d["map_calls"] = m.map_calls;
    d["reduce_calls"] = m.reduce_calls;
    d["jobs_started"] = m.jobs_started;
    d["retries"] = m.retries;
    d["retries_exhausted"] = m.retries_exhausted;
    d["segments_skipped"] = m.segments_skipped;
    d["reduce_rounds"] = m.reduce_rounds;
    d["budget_waits"] = m.budget_waits;
    d["budget_timeouts"] = m.budget_timeouts;
    d["tokens_recorded"] = m.tokens_recorded;
    d["average_budget_wait_ms"] = m.average_budget_wait_ms;
    return d;
}

} // anonymous namespace

void bind_monitors(py::module_& m) {
    py::enum_<EventType>(m, "EventType")
        .value("RunStarted",           EventType::RunStarted)
        .value("RunCompleted",         EventType::RunCompleted)
        .value("RunFailed",            EventType::RunFailed)
        .value("RunCancelled",         EventType::RunCancelled)
        .value("BudgetWaiting",        EventType::BudgetWaiting)
        .value("BudgetAdmitted",       EventType::BudgetAdmitted)
        .value("BudgetTimedOut",       EventType::BudgetTimedOut)
        .value("TokensRecorded",       EventType::TokensRecorded)
        .value("BudgetWindowReset",    EventType::BudgetWindowReset)
        .value("JobSubmitted",         EventType::JobSubmitted)
        .value("JobStarted",           EventType::JobStarted)
        .value("JobFinished",          EventType::JobFinished)
        .value("RetryScheduled",       EventType::RetryScheduled)
        .value("RetriesExhausted",     EventType::RetriesExhausted)
        .value("SegmentCompleted",     EventType::SegmentCompleted)
        .value("SegmentSkipped",       EventType::SegmentSkipped)
        .value("MapPhaseCompleted",    EventType::MapPhaseCompleted)
        .value("ReduceRoundStarted",   EventType::ReduceRoundStarted)
        .value("ReduceGroupCompleted", EventType::ReduceGroupCompleted)
        .value("ReduceRoundCompleted", EventType::ReduceRoundCompleted)
        .export_values();

    // --- MonitorEvent (optional fields map to None) ---
    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",      &MonitorEvent::type)
        .def_readwrite("timestamp", &MonitorEvent::timestamp)
        .def_readwrite("message",   &MonitorEvent::message)
        .def_readwrite("phase",     &MonitorEvent::phase)
        .def_readwrite("segment",   &MonitorEvent::segment)
        .def_readwrite("round",     &MonitorEvent::round)
        .def_readwrite("group",     &MonitorEvent::group)
        .def_readwrite("tokens",    &MonitorEvent::tokens)
        .def_readwrite("remaining", &MonitorEvent::remaining)
        .def_readwrite("status",    &MonitorEvent::status)
        .def_readwrite("attempt",   &MonitorEvent::attempt)
        .def_readwrite("delay",     &MonitorEvent::delay)
        .def_readwrite("count",     &MonitorEvent::count)
        .def("__repr__", [](const MonitorEvent& e) {
            return std::string("<MonitorEvent ") + to_string(e.type) + ": " + e.message + ">";
        });

    // --- Abstract Monitor with trampoline ---
    py::class_<Monitor, PyMonitor, std::shared_ptr<Monitor>>(m, "Monitor")
        .def(py::init<>())
        .def("on_event", &Monitor::on_event);

    m.def("monitor_from_callable",
          [](py::function callback, std::set<EventType> only) -> std::shared_ptr<Monitor> {
              return std::make_shared<CallbackMonitor>(std::move(callback), std::move(only));
          },
          py::arg("callback"), py::arg("only") = std::set<EventType>{},
          "Wrap callback(event) as a Monitor, optionally restricted to some event types.");

    // --- ConsoleMonitor ---
    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    py::class_<ConsoleMonitor, Monitor, std::shared_ptr<ConsoleMonitor>>(m, "ConsoleMonitor")
        .def(py::init<ConsoleMonitor::Verbosity>(),
             py::arg("verbosity") = ConsoleMonitor::Verbosity::Normal);

    // --- MetricsMonitor ---
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("runs_started",           &MetricsMonitor::Metrics::runs_started)
        .def_readwrite("runs_completed",         &MetricsMonitor::Metrics::runs_completed)
        .def_readwrite("runs_failed",            &MetricsMonitor::Metrics::runs_failed)
        .def_readwrite("map_calls",              &MetricsMonitor::Metrics::map_calls)
        .def_readwrite("reduce_calls",           &MetricsMonitor::Metrics::reduce_calls)
        .def_readwrite("jobs_started",           &MetricsMonitor::Metrics::jobs_started)
        .def_readwrite("retries",                &MetricsMonitor::Metrics::retries)
        .def_readwrite("retries_exhausted",      &MetricsMonitor::Metrics::retries_exhausted)
        .def_readwrite("segments_skipped",       &MetricsMonitor::Metrics::segments_skipped)
        .def_readwrite("reduce_rounds",          &MetricsMonitor::Metrics::reduce_rounds)
        .def_readwrite("budget_waits",           &MetricsMonitor::Metrics::budget_waits)
        .def_readwrite("budget_timeouts",        &MetricsMonitor::Metrics::budget_timeouts)
        .def_readwrite("tokens_recorded",        &MetricsMonitor::Metrics::tokens_recorded)
        .def_readwrite("average_budget_wait_ms", &MetricsMonitor::Metrics::average_budget_wait_ms)
        .def("as_dict", &metrics_as_dict);

    py::class_<MetricsMonitor, Monitor, std::shared_ptr<MetricsMonitor>>(m, "MetricsMonitor")
        .def(py::init<>())
        .def("get_metrics", &MetricsMonitor::get_metrics)
        .def("reset_metrics", &MetricsMonitor::reset_metrics);

    // --- CompositeMonitor ---
    py::class_<CompositeMonitor, Monitor, std::shared_ptr<CompositeMonitor>>(m, "CompositeMonitor")
        .def(py::init<>())
        .def("add_monitor", &CompositeMonitor::add_monitor);

    m.def("event_type_name", [](EventType t) { return std::string(to_string(t)); },
          py::arg("type"));
}
