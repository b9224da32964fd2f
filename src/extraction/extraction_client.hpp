#pragma once

#include <chart/completeness.hpp>
#include <chart/extracted_row.hpp>
#include <core/cancel_token.hpp>
#include <string>
#include <vector>

enum class ExtractionMode {
    Full,         // every chart row on the page
    MissingRows,  // only the ranks listed in missing_groups
};

const char* extraction_mode_name(ExtractionMode mode);

struct ExtractionRequest {
    std::string image;       // encoded bytes
    std::string mime_type;
    std::string model;
    ExtractionMode mode = ExtractionMode::Full;
    std::vector<MissingChartGroup> missing_groups;  // MissingRows only
    CancelToken* token = nullptr;                   // aborts the transfer when fired
};

struct ExtractionResponse {
    std::vector<ExtractedRow> rows;  // normalized, incomplete rows dropped
    std::string raw_json;            // audit payload for the run record
};

// Vision-language extraction call. Implementations throw ExtractionError on
// remote or schema failure and CancelledError when the token fires.
class ExtractionClient {
public:
    virtual ~ExtractionClient() = default;
    virtual ExtractionResponse extract(const ExtractionRequest& request) = 0;
};
