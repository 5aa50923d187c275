#pragma once

#include "mapreducer/types.hpp"

#include <string>

namespace mapreducer::llm {

// Boundary to the remote language model.
//
// invoke() is called concurrently from queue workers, so implementations
// must be thread-safe. Provider failures are reported by throwing
// ProviderException carrying the HTTP-like status and, for 429, the
// optional retry-after hint in seconds.
class ModelClient {
public:
    virtual ~ModelClient() = default;

    virtual ModelResponse invoke(const std::string& prompt, const InvokeOptions& options) = 0;
};

} // namespace mapreducer::llm
