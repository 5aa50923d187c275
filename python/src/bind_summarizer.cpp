#include "bind_forward.hpp"
#include <mapreducer/mapreducer.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>

using namespace mapreducer;

// ---------------------------------------------------------------------------
// bind_summarizer  --  MapReduceSummarizer
// ---------------------------------------------------------------------------
void bind_summarizer(py::module_& m) {
    py::class_<MapReduceSummarizer>(m, "MapReduceSummarizer")
        .def(py::init([](RunConfig config,
                         std::shared_ptr<llm::ModelClient> model,
                         std::shared_ptr<llm::TokenCounter> counter,
                         const std::string& map_prompt,
                         const std::string& combine_prompt) {
                 return std::make_unique<MapReduceSummarizer>(
                     std::move(config), std::move(model), std::move(counter),
                     llm::PromptTemplate::from_template(map_prompt),
                     llm::PromptTemplate::from_template(combine_prompt));
             }),
             py::arg("config"), py::arg("model"), py::arg("counter"),
             py::arg("map_prompt"), py::arg("combine_prompt"))
        .def("set_monitor", &MapReduceSummarizer::set_monitor, py::arg("monitor"))
        // Blocking runs release the GIL; Python callbacks re-acquire it.
        .def("summarize", &MapReduceSummarizer::summarize, py::arg("segments"),
             py::call_guard<py::gil_scoped_release>())
        .def("summarize_text", &MapReduceSummarizer::summarize_text, py::arg("text"),
             py::call_guard<py::gil_scoped_release>())
        .def("cancel", &MapReduceSummarizer::cancel)
        .def("state",  &MapReduceSummarizer::state)
        .def("config", &MapReduceSummarizer::config, py::return_value_policy::reference_internal)
        .def("__repr__", [](const MapReduceSummarizer& s) {
            return std::string("<MapReduceSummarizer state=") + to_string(s.state()) + ">";
        });
}
