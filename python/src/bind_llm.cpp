#include "bind_forward.hpp"
#include <mapreducer/mapreducer.hpp>
#include <pybind11/stl.h>

using namespace mapreducer;
using namespace mapreducer::llm;

namespace {

// Python errors never cross into worker threads as Python objects: a raised
// ProviderError becomes ProviderException so the retry policy can classify
// it, everything else becomes MapReducerException.
[[noreturn]] void rethrow_as_native(py::error_already_set& e) {
    if (e.matches(provider_error_type())) {
        py::tuple args = e.value().attr("args");
        if (args.size() >= 1 && py::isinstance<py::int_>(args[0])) {
            int status = args[0].cast<int>();
            std::string message = args.size() >= 2 ? py::str(args[1]).cast<std::string>()
                                                   : std::string();
            std::optional<double> retry_after;
            if (args.size() >= 3 && !args[2].is_none()) {
                retry_after = args[2].cast<double>();
            }
            throw ProviderException(status, std::move(message), retry_after);
        }
    }
    throw MapReducerException(e.what());
}

} // anonymous namespace

// Trampoline class to allow Python subclassing of ModelClient
class PyModelClient : public ModelClient {
public:
    using ModelClient::ModelClient;

    ModelResponse invoke(const std::string& prompt, const InvokeOptions& options) override {
        py::gil_scoped_acquire acquire;
        try {
            PYBIND11_OVERRIDE_PURE(ModelResponse, ModelClient, invoke, prompt, options);
        } catch (py::error_already_set& e) {
            rethrow_as_native(e);
        }
    }
};

// Trampoline class to allow Python subclassing of TokenCounter
class PyTokenCounter : public TokenCounter {
public:
    using TokenCounter::TokenCounter;

    TokenCount count(const std::string& text, EncodingId encoding) const override {
        py::gil_scoped_acquire acquire;
        try {
            PYBIND11_OVERRIDE_PURE(TokenCount, TokenCounter, count, text, encoding);
        } catch (py::error_already_set& e) {
            rethrow_as_native(e);
        }
    }
};

void bind_llm(py::module_& m) {

    // --- Value types ---
    py::class_<Usage>(m, "Usage")
        .def(py::init<>())
        .def(py::init([](std::optional<TokenCount> input, std::optional<TokenCount> output,
                         std::optional<TokenCount> total) {
                 return Usage{input, output, total};
             }),
             py::arg("input_tokens") = std::nullopt,
             py::arg("output_tokens") = std::nullopt,
             py::arg("total_tokens") = std::nullopt)
        .def_readwrite("input_tokens",  &Usage::input_tokens)
        .def_readwrite("output_tokens", &Usage::output_tokens)
        .def_readwrite("total_tokens",  &Usage::total_tokens);

    py::class_<InvokeOptions>(m, "InvokeOptions")
        .def(py::init<>())
        .def_readwrite("max_output_tokens", &InvokeOptions::max_output_tokens)
        .def_readwrite("temperature",       &InvokeOptions::temperature);

    py::class_<ModelResponse>(m, "ModelResponse")
        .def(py::init<>())
        .def(py::init([](std::string content, std::optional<Usage> usage) {
                 return ModelResponse{std::move(content), std::move(usage)};
             }),
             py::arg("content"), py::arg("usage") = std::nullopt)
        .def_readwrite("content", &ModelResponse::content)
        .def_readwrite("usage",   &ModelResponse::usage);

    py::class_<Segment>(m, "Segment")
        .def(py::init<>())
        .def(py::init([](std::string text, TokenCount tokens, SegmentIndex index) {
                 return Segment{std::move(text), tokens, index};
             }),
             py::arg("text"), py::arg("approximate_token_count") = 0, py::arg("index") = 0)
        .def_readwrite("text",                    &Segment::text)
        .def_readwrite("approximate_token_count", &Segment::approximate_token_count)
        .def_readwrite("index",                   &Segment::index);

    m.def("extract_total_tokens", &extract_total_tokens, py::arg("usage"));

    // --- Abstract ModelClient with trampoline ---
    py::class_<ModelClient, PyModelClient, std::shared_ptr<ModelClient>>(m, "ModelClient")
        .def(py::init<>())
        .def("invoke", &ModelClient::invoke, py::arg("prompt"), py::arg("options"));

    // --- Token counters ---
    py::class_<TokenCounter, PyTokenCounter, std::shared_ptr<TokenCounter>>(m, "TokenCounter")
        .def(py::init<>())
        .def("count", &TokenCounter::count, py::arg("text"), py::arg("encoding"));

    py::class_<ApproximateTokenCounter, TokenCounter, std::shared_ptr<ApproximateTokenCounter>>(
            m, "ApproximateTokenCounter")
        .def(py::init<>())
        .def_static("characters_per_token", &ApproximateTokenCounter::characters_per_token,
                    py::arg("encoding"));

    // --- PromptTemplate ---
    py::class_<PromptTemplate>(m, "PromptTemplate")
        .def_static("from_template", &PromptTemplate::from_template, py::arg("source"))
        .def("format", &PromptTemplate::format, py::arg("text"))
        .def("source", &PromptTemplate::source);

    // --- TextSplitter ---
    py::class_<TextSplitter>(m, "TextSplitter")
        .def(py::init<std::shared_ptr<TokenCounter>, EncodingId, TokenCount, TokenCount>(),
             py::arg("counter"), py::arg("encoding") = EncodingId::O200k,
             py::arg("chunk_size") = 18000, py::arg("chunk_overlap") = 500)
        .def("split_text",     &TextSplitter::split_text, py::arg("text"))
        .def("split_segments", &TextSplitter::split_segments, py::arg("text"))
        .def("chunk_size",     &TextSplitter::chunk_size)
        .def("chunk_overlap",  &TextSplitter::chunk_overlap);
}
