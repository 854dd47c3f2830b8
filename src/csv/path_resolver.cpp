#include "csv/path_resolver.hpp"
#include "csv/combine_errors.hpp"
#include "csv/dialect.hpp"
#include "infrastructure/logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <glob.h>
#include <set>

namespace ConCat {
namespace CSV {

namespace {

std::filesystem::path absoluteNormal(const std::filesystem::path& path) {
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(std::filesystem::absolute(path, ec), ec);
    if (ec) {
        return std::filesystem::absolute(path).lexically_normal();
    }
    return resolved;
}

} // namespace

std::string inputModeToString(InputMode mode) {
    switch (mode) {
        case InputMode::DIRECTORY: return "directory";
        case InputMode::GLOB: return "glob";
        case InputMode::FILES: return "files";
    }
    return "unknown";
}

DiscoveryResult PathResolver::resolve(const DiscoveryRequest& request) const {
    auto collected = collect(request);
    if (collected.empty()) {
        throw NoInputError("No input files found.");
    }

    // EN: std::set gives both de-duplication and the sorted order
    // FR: std::set assure à la fois la dé-duplication et l'ordre trié
    std::set<std::filesystem::path> unique;
    for (const auto& path : collected) {
        unique.insert(absoluteNormal(path));
    }

    DiscoveryResult result;
    if (request.extension.has_value() && !request.extension->empty()) {
        result.extension = normalizeExtension(*request.extension);
    } else {
        result.extension = inferExtension({unique.begin(), unique.end()});
    }

    for (const auto& path : unique) {
        if (extensionOf(path) == result.extension) {
            result.files.push_back(path);
        } else {
            LOG_DEBUG("discovery", "Filtered out by extension: " + path.string());
        }
    }

    if (result.files.empty()) {
        throw NoInputError("No *." + result.extension +
                           " files after filtering. Check inputs/--extension.");
    }

    LOG_INFO("discovery", "Discovered " + std::to_string(result.files.size()) + " file(s) with extension ." +
             result.extension + " (" + inputModeToString(request.mode) + " mode)");
    return result;
}

std::vector<std::filesystem::path> PathResolver::collect(const DiscoveryRequest& request) const {
    std::vector<std::filesystem::path> found;
    std::vector<std::string> missing;

    switch (request.mode) {
        case InputMode::DIRECTORY: {
            std::error_code ec;
            if (!std::filesystem::is_directory(request.directory, ec)) {
                throw DiscoveryError("Directory not found: " + request.directory.string());
            }
            std::filesystem::directory_iterator it(request.directory, ec);
            if (ec) {
                throw DiscoveryError("Cannot list directory " + request.directory.string() + ": " + ec.message());
            }
            for (const auto& entry : it) {
                if (entry.is_regular_file(ec)) {
                    found.push_back(entry.path());
                }
            }
            break;
        }

        case InputMode::GLOB: {
            for (const auto& pattern : request.patterns) {
                // EN: The shell may already have expanded the pattern; take existing paths literally
                // FR: Le shell a pu développer le motif ; les chemins existants sont pris tels quels
                std::error_code ec;
                std::filesystem::path literal(pattern);
                if (std::filesystem::exists(literal, ec)) {
                    if (std::filesystem::is_regular_file(literal, ec)) {
                        found.push_back(literal);
                    }
                    continue;
                }
                auto matches = expandGlob(pattern);
                if (matches.empty()) {
                    LOG_DEBUG("discovery", "Pattern matched nothing: " + pattern);
                }
                for (const auto& match : matches) {
                    if (std::filesystem::is_regular_file(match, ec)) {
                        found.push_back(match);
                    }
                }
            }
            break;
        }

        case InputMode::FILES: {
            for (const auto& file : request.files) {
                std::error_code ec;
                if (!std::filesystem::exists(file, ec)) {
                    missing.push_back(file.string());
                } else if (std::filesystem::is_directory(file, ec)) {
                    throw DiscoveryError("Not a file: " + file.string());
                } else {
                    found.push_back(file);
                }
            }
            break;
        }
    }

    if (!missing.empty()) {
        throw DiscoveryError("Missing files: " + formatNameList(missing));
    }
    return found;
}

std::string PathResolver::inferExtension(const std::vector<std::filesystem::path>& files) const {
    std::set<std::string> extensions;
    for (const auto& path : files) {
        extensions.insert(extensionOf(path));
    }
    if (extensions.size() != 1) {
        throw ExtensionConflictError("Inconsistent extensions detected: " +
                                     formatNameList({extensions.begin(), extensions.end()}) +
                                     ". Use --extension to enforce one, or clean inputs.");
    }
    return *extensions.begin();
}

std::string PathResolver::normalizeExtension(const std::string& extension) {
    std::string out = extension;
    out.erase(0, out.find_first_not_of('.'));
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string PathResolver::extensionOf(const std::filesystem::path& path) {
    return normalizeExtension(path.extension().string());
}

std::vector<std::filesystem::path> PathResolver::expandGlob(const std::string& pattern) {
    std::vector<std::filesystem::path> matches;
    glob_t results{};
    int rc = ::glob(pattern.c_str(), 0, nullptr, &results);
    if (rc == 0) {
        for (size_t i = 0; i < results.gl_pathc; ++i) {
            matches.emplace_back(results.gl_pathv[i]);
        }
    } else if (rc != GLOB_NOMATCH) {
        globfree(&results);
        throw DiscoveryError("Cannot expand glob pattern '" + pattern + "'");
    }
    globfree(&results);
    return matches;
}

} // namespace CSV
} // namespace ConCat
