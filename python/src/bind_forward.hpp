#pragma once
#include <pybind11/pybind11.h>
namespace py = pybind11;

void bind_enums_and_structs(py::module_& m);
void bind_exceptions(py::module_& m);
void bind_core(py::module_& m);
void bind_llm(py::module_& m);
void bind_monitors(py::module_& m);
void bind_summarizer(py::module_& m);

// Python type registered for ProviderException. A Python model client raises
// it as ProviderError(status, message[, retry_after_seconds]).
py::handle provider_error_type();
