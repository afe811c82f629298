#pragma once

#include <string>
#include "core/errors/agent_errors.hpp"

namespace toolgate::model {

// The text-generation service, seen as an opaque request/response call.
// Implementations apply their own retry policy; an error returned here means
// the service is unusable for the rest of the conversation.
class ModelClient {
public:
    virtual ~ModelClient() = default;

    virtual core::errors::Result<std::string> complete(const std::string& prompt) = 0;
};

}  // namespace toolgate::model
