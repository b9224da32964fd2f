#pragma once

#include "extraction_client.hpp"
#include <core/types.hpp>
#include <nlohmann/json.hpp>
#include <string>

// ExtractionClient for the Gemini generateContent REST endpoint.
// Posts the page image inline with a JSON response schema and parses the
// first candidate's text through the strict row parser. The transfer is
// aborted from libcurl's progress callback when the request token fires.
class GeminiClient : public ExtractionClient {
public:
    explicit GeminiClient(const ExtractionConfig& config);

    ExtractionResponse extract(const ExtractionRequest& request) override;

    // Request body for a request; exposed so the payload shape can be checked
    // without a network round trip.
    nlohmann::json build_request_body(const ExtractionRequest& request) const;

    // Extracts rows and the audit payload from a generateContent response.
    ExtractionResponse parse_response_body(const std::string& body,
                                           const std::string& model) const;

private:
    std::string api_key() const;
    std::string post(const std::string& url, const std::string& body,
                     const std::string& key, CancelToken* token) const;

    ExtractionConfig config_;
};
