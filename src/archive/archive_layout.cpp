// =============================================================================
// qzbulk - Archive Layout Implementation
// =============================================================================

#include "qzb/archive/archive_layout.h"

#include <vector>

#include <fmt/format.h>

#include "qzb/archive/archiver.h"
#include "qzb/common/error.h"

namespace qzb::archive::layout {

namespace {

std::vector<std::string_view> splitPath(std::string_view path) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (start < path.size()) {
        std::size_t end = path.find('/', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        if (end > start) {
            parts.push_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return parts;
}

void requireLibrary(std::string_view library) {
    if (!isValidLibraryName(library)) {
        throw FormatError(fmt::format("Invalid library name '{}'", library));
    }
}

}  // namespace

bool isValidLibraryName(std::string_view library) noexcept {
    return !library.empty() && library != "." && library != ".." &&
           library.find('/') == std::string_view::npos;
}

std::string normalizePath(std::string_view path) {
    std::string result;
    for (std::string_view part : splitPath(path)) {
        if (part == "." || part == "..") {
            throw FormatError(fmt::format("Invalid component '{}' in path", part),
                              ErrorContext{}.withPath(std::string(path)));
        }
        result += '/';
        result += part;
    }
    return result.empty() ? std::string(1, '/') : result;
}

std::string contentEntry(std::string_view library, std::string_view path) {
    requireLibrary(library);
    std::string normalized = normalizePath(path);
    if (normalized == "/") {
        throw FormatError("The library root is not a document",
                          ErrorContext{}.withLibrary(std::string(library)));
    }
    return fmt::format("{}/{}{}", library, kContentDir, normalized);
}

std::string propertiesEntry(std::string_view library, std::string_view path) {
    requireLibrary(library);
    std::string normalized = normalizePath(path);
    if (normalized == "/") {
        return fmt::format("{}/{}/{}", library, kPropertiesDir, kPropertiesFile);
    }
    return fmt::format("{}/{}{}/{}", library, kPropertiesDir, normalized, kPropertiesFile);
}

EntryRef parseEntry(std::string_view name) {
    validateEntryName(name);

    std::vector<std::string_view> parts = splitPath(name);
    if (parts.size() < 3) {
        throw FormatError("Archive entry does not follow the dump layout",
                          ErrorContext{}.withEntry(std::string(name)));
    }

    EntryRef ref;
    ref.library = std::string(parts[0]);

    std::size_t first = 2;
    std::size_t last = parts.size();
    if (parts[1] == kContentDir) {
        ref.kind = EntryKind::kContent;
    } else if (parts[1] == kPropertiesDir && parts.back() == kPropertiesFile) {
        ref.kind = EntryKind::kProperties;
        --last;
    } else {
        throw FormatError("Archive entry does not follow the dump layout",
                          ErrorContext{}.withEntry(std::string(name)));
    }

    for (std::size_t i = first; i < last; ++i) {
        ref.path += '/';
        ref.path += parts[i];
    }
    if (ref.path.empty()) {
        ref.path = "/";
    }
    return ref;
}

}  // namespace qzb::archive::layout
