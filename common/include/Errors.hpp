#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <fmt/core.h>

namespace esmc
{
    // Invalid user supplied configuration, e.g. an unknown import annotation value or a malformed manifest.
    struct ConfigError : std::runtime_error
    {
        explicit ConfigError(const std::string &message) : std::runtime_error(message) {}

        static ConfigError unknownChunkingType(const std::string &value)
        {
            return ConfigError(fmt::format("unknown chunking_type: {}", value));
        }
    };

    // The active chunking context cannot express what the code needs.
    struct UnsupportedFeature : std::runtime_error
    {
        UnsupportedFeature(const std::string &message, std::string request_)
            : std::runtime_error(message), request(std::move(request_)) {}

        static UnsupportedFeature externalModules(const std::string &request)
        {
            return UnsupportedFeature(fmt::format("the chunking context does not support external modules (request: {})", request), request);
        }

        std::string request;
    };
}
