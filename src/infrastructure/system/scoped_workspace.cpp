// EN: Implementation of ScopedWorkspace.
// FR: Implémentation de ScopedWorkspace.

#include "infrastructure/system/scoped_workspace.hpp"
#include "infrastructure/logging/logger.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <stdlib.h>
#include <vector>

namespace ConCat {

ScopedWorkspace::ScopedWorkspace(std::string prefix, std::filesystem::path parent)
    : prefix_(std::move(prefix)), parent_(std::move(parent)) {
}

ScopedWorkspace::~ScopedWorkspace() {
    cleanup();
}

const std::filesystem::path& ScopedWorkspace::path() {
    if (!path_.empty()) {
        return path_;
    }

    std::filesystem::path parent = parent_.empty() ? std::filesystem::temp_directory_path() : parent_;
    std::string pattern = (parent / (prefix_ + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("Cannot create scratch workspace under " + parent.string() +
                                 ": " + std::strerror(errno));
    }

    path_ = std::filesystem::path(buffer.data());
    LOG_DEBUG("workspace", "Created scratch workspace: " + path_.string());
    return path_;
}

void ScopedWorkspace::cleanup() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        LOG_WARN("workspace", "Failed to remove scratch workspace " + path_.string() + ": " + ec.message());
    } else {
        LOG_DEBUG("workspace", "Removed scratch workspace: " + path_.string());
    }
    path_.clear();
}

} // namespace ConCat
