#pragma once

#include "generation-client.h"
#include "../http/http-transport.h"

#include <string>

// Gemini generateContent REST backend
class gemini_client : public generation_client {
public:
    gemini_client(http_transport & transport, std::string api_key, std::string base_url);

    generation_response generate(const std::string & model,
                                 const generation_config & config,
                                 const json & messages,
                                 const std::vector<const tool_def *> & tools) override;

    // Request body for a generateContent call
    static json build_request(const generation_config & config,
                              const json & messages,
                              const std::vector<const tool_def *> & tools);

    // Decode a generateContent response body
    static generation_response parse_response(const std::string & body);

    std::string endpoint(const std::string & model) const;

private:
    http_transport & transport_;
    std::string api_key_;
    std::string base_url_;
};
