#include "bind_forward.hpp"
#include <mapreducer/mapreducer.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace mapreducer;

// ---------------------------------------------------------------------------
// bind_core  --  CancellationToken, TokenBudgetTracker, RetryPolicy, reducer
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // CancellationToken
    // ===================================================================
    py::class_<CancellationToken>(m, "CancellationToken")
        .def(py::init<>())
        .def("cancel",       &CancellationToken::cancel)
        .def("is_cancelled", &CancellationToken::is_cancelled)
        .def("set_deadline", &CancellationToken::set_deadline, py::arg("deadline"))
        .def("deadline",     &CancellationToken::deadline);

    // ===================================================================
    // TokenBudgetTracker
    // ===================================================================
    py::class_<TokenBudgetTracker>(m, "TokenBudgetTracker")
        .def(py::init([](TokenCount capacity, Duration window) {
                 return std::make_unique<TokenBudgetTracker>(capacity, window);
             }),
             py::arg("capacity_tokens"), py::arg("window_duration"))
        .def("can_use",         &TokenBudgetTracker::can_use, py::arg("estimate"))
        .def("use",             &TokenBudgetTracker::use, py::arg("amount"))
        .def("remaining",       &TokenBudgetTracker::remaining)
        .def("used",            &TokenBudgetTracker::used)
        .def("capacity",        &TokenBudgetTracker::capacity)
        .def("window_duration", &TokenBudgetTracker::window_duration)
        .def("wait_for",
             [](TokenBudgetTracker& self, TokenCount estimate, Duration timeout,
                Duration poll_interval, const CancellationToken& token) {
                 return self.wait_for(estimate, timeout, poll_interval, token);
             },
             py::arg("estimate"), py::arg("timeout"),
             py::arg("poll_interval") = std::chrono::seconds(3),
             py::arg("token") = CancellationToken{},
             py::call_guard<py::gil_scoped_release>())
        .def("reserve",
             [](TokenBudgetTracker& self, TokenCount estimate, Duration timeout,
                Duration poll_interval, const CancellationToken& token) {
                 return self.reserve(estimate, timeout, poll_interval, token);
             },
             py::arg("estimate"), py::arg("timeout"),
             py::arg("poll_interval") = std::chrono::seconds(3),
             py::arg("token") = CancellationToken{},
             py::call_guard<py::gil_scoped_release>())
        .def("commit",          &TokenBudgetTracker::commit, py::arg("reserved"), py::arg("actual"))
        .def("release",         &TokenBudgetTracker::release, py::arg("reserved"))
        .def("reserved",        &TokenBudgetTracker::reserved)
        .def("set_monitor",     &TokenBudgetTracker::set_monitor, py::arg("monitor"))
        .def("__repr__", [](TokenBudgetTracker& t) {
            return "<TokenBudgetTracker capacity=" + std::to_string(t.capacity())
                 + " used=" + std::to_string(t.used()) + ">";
        });

    // ===================================================================
    // RetryPolicy (delay computation only; execution happens in C++)
    // ===================================================================
    py::class_<RetryPolicy>(m, "RetryPolicy")
        .def(py::init<RetryConfig>(), py::arg("config") = RetryConfig{})
        .def_static("classify", &RetryPolicy::classify, py::arg("status"))
        .def("backoff_delay",   &RetryPolicy::backoff_delay, py::arg("attempt"))
        .def("retry_delay",     &RetryPolicy::retry_delay,
             py::arg("kind"), py::arg("attempt"),
             py::arg("retry_after_seconds") = std::nullopt)
        .def("max_attempts",    &RetryPolicy::max_attempts)
        .def("config",          &RetryPolicy::config);

    // ===================================================================
    // Hierarchical reducer over strings
    // ===================================================================
    py::class_<GroupInfo>(m, "GroupInfo")
        .def(py::init<>())
        .def_readwrite("round",       &GroupInfo::round)
        .def_readwrite("index",       &GroupInfo::index)
        .def_readwrite("group_count", &GroupInfo::group_count)
        .def("__repr__", [](const GroupInfo& g) {
            return "<GroupInfo round=" + std::to_string(g.round)
                 + " index=" + std::to_string(g.index)
                 + " group_count=" + std::to_string(g.group_count) + ">";
        });

    m.def("make_groups",
          [](const std::vector<std::string>& items, std::size_t group_size) {
              return make_groups(items, group_size);
          },
          py::arg("items"), py::arg("group_size"));

    m.def("join_group", &join_group, py::arg("group"));

    // The Python callable runs synchronously, one group at a time, with the
    // GIL held.
    m.def("hierarchical_reduce",
          [](std::vector<std::string> items,
             const std::function<std::string(const std::vector<std::string>&, const GroupInfo&)>& combine,
             std::size_t group_size) {
              auto call = [&combine](std::vector<std::string> group, GroupInfo info) {
                  std::promise<std::string> done;
                  try {
                      done.set_value(combine(group, info));
                  } catch (...) {
                      // Surfaces from hierarchical_reduce once the round settles.
                      done.set_exception(std::current_exception());
                  }
                  return done.get_future();
              };
              return hierarchical_reduce(std::move(items), call, group_size);
          },
          py::arg("items"), py::arg("combine"), py::arg("group_size") = 2);
}
