#include <canopy/storage/storage_key.h>

#include <cctype>

namespace canopy::storage {

namespace {

bool isIdChar(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.';
}

Result<void> invalid(std::string message) {
    return Error{ErrorCode::ValidationError, std::move(message)};
}

} // namespace

std::string pathScoped(std::string_view pathName, std::string_view fileName) {
    std::string out = "paths/";
    out.append(pathName);
    out.push_back('/');
    out.append(fileName);
    return out;
}

Result<void> validateProjectId(std::string_view projectId) {
    if (projectId.empty()) {
        return invalid("projectId must be a non-empty string");
    }
    if (projectId == kGlobalProject) {
        return {};
    }
    if (projectId.size() > kMaxProjectIdLength) {
        return invalid("projectId exceeds " + std::to_string(kMaxProjectIdLength) + " characters");
    }
    if (!std::isalnum(static_cast<unsigned char>(projectId.front()))) {
        return invalid("projectId must start with a letter or digit: '" + std::string(projectId) +
                       "'");
    }
    for (unsigned char c : projectId) {
        if (!isIdChar(c)) {
            return invalid("projectId contains an illegal character: '" + std::string(projectId) +
                           "'");
        }
    }
    return {};
}

Result<void> validateRelativePath(std::string_view relativePath) {
    if (relativePath.empty()) {
        return invalid("relative path must be non-empty");
    }
    if (relativePath.size() > kMaxRelativePathLength) {
        return invalid("relative path too long");
    }
    if (relativePath.front() == '/') {
        return invalid("relative path must not be absolute: '" + std::string(relativePath) + "'");
    }

    std::size_t start = 0;
    while (start <= relativePath.size()) {
        auto end = relativePath.find('/', start);
        if (end == std::string_view::npos) {
            end = relativePath.size();
        }
        auto component = relativePath.substr(start, end - start);
        if (component.empty()) {
            return invalid("relative path has an empty component: '" + std::string(relativePath) +
                           "'");
        }
        if (component.front() == '.') {
            return invalid("relative path component may not start with '.': '" +
                           std::string(relativePath) + "'");
        }
        for (unsigned char c : component) {
            if (c < 0x20 || c == 0x7F || c == '\\') {
                return invalid("relative path contains an illegal character");
            }
        }
        start = end + 1;
    }

    if (relativePath.size() >= kTempSuffix.size() &&
        relativePath.substr(relativePath.size() - kTempSuffix.size()) == kTempSuffix) {
        return invalid("relative path may not use the reserved '.tmp' suffix");
    }
    return {};
}

Result<void> validateKey(const StorageKey& key) {
    if (auto r = validateProjectId(key.projectId); !r) {
        return r;
    }
    return validateRelativePath(key.relativePath);
}

} // namespace canopy::storage
