#include "extraction_client.hpp"

const char* extraction_mode_name(ExtractionMode mode) {
    switch (mode) {
        case ExtractionMode::Full:        return "full";
        case ExtractionMode::MissingRows: return "missing_rows";
    }
    return "full";
}
