#include "csv/header_reader.hpp"
#include "csv/combine_errors.hpp"
#include "csv/streaming_parser.hpp"

namespace ConCat {
namespace CSV {

std::vector<std::string> HeaderReader::readHeader(const std::filesystem::path& path, char delimiter) {
    ParserConfig config;
    config.delimiter = delimiter;
    StreamingParser parser(config);
    ParserError status = parser.open(path.string());
    if (status != ParserError::SUCCESS) {
        throw IoError("Cannot read header of " + path.string() + ": " + parserErrorToString(status));
    }
    auto header = parser.readHeader();
    if (!header.has_value()) {
        return {};
    }
    return *header;
}

} // namespace CSV
} // namespace ConCat
