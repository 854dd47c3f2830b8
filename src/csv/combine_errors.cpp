#include "csv/combine_errors.hpp"

namespace ConCat {
namespace CSV {

std::string combineErrorCodeToString(CombineErrorCode code) {
    switch (code) {
        case CombineErrorCode::DISCOVERY: return "DISCOVERY";
        case CombineErrorCode::EXTENSION_CONFLICT: return "EXTENSION_CONFLICT";
        case CombineErrorCode::NO_INPUT: return "NO_INPUT";
        case CombineErrorCode::SCHEMA_MISMATCH: return "SCHEMA_MISMATCH";
        case CombineErrorCode::EMPTY_INTERSECTION: return "EMPTY_INTERSECTION";
        case CombineErrorCode::MISSING_COLUMNS: return "MISSING_COLUMNS";
        case CombineErrorCode::NO_USABLE_FILES: return "NO_USABLE_FILES";
        case CombineErrorCode::DELIMITER_CONFLICT: return "DELIMITER_CONFLICT";
        case CombineErrorCode::HEADER_READ: return "HEADER_READ";
        case CombineErrorCode::CONFIGURATION: return "CONFIGURATION";
        case CombineErrorCode::IO: return "IO";
        case CombineErrorCode::INTERRUPTED: return "INTERRUPTED";
        default: return "UNKNOWN";
    }
}

} // namespace CSV
} // namespace ConCat
