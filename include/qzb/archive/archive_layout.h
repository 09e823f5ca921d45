// =============================================================================
// qzbulk - Archive Layout
// =============================================================================
// Naming scheme shared by dump and restore:
//
//   <library>/content<path>                   document body
//   <library>/properties<path>/.properties    property set of a member
//   <library>/properties/.properties          property set of the root
// =============================================================================

#ifndef QZB_ARCHIVE_ARCHIVE_LAYOUT_H
#define QZB_ARCHIVE_ARCHIVE_LAYOUT_H

#include <cstdint>
#include <string>
#include <string_view>

namespace qzb::archive::layout {

inline constexpr std::string_view kContentDir = "content";
inline constexpr std::string_view kPropertiesDir = "properties";
inline constexpr std::string_view kPropertiesFile = ".properties";

enum class EntryKind : std::uint8_t {
    kContent = 0,
    kProperties = 1
};

/// @brief A parsed archive entry name.
struct EntryRef {
    EntryKind kind = EntryKind::kContent;
    std::string library;

    /// @brief Member path, starting with '/'.
    std::string path;

    bool operator==(const EntryRef&) const = default;
};

/// @brief Entry name of a document body.
/// @throws FormatError for an invalid library name or path
[[nodiscard]] std::string contentEntry(std::string_view library, std::string_view path);

/// @brief Entry name of the property set of a document or collection.
/// @throws FormatError for an invalid library name or path
[[nodiscard]] std::string propertiesEntry(std::string_view library, std::string_view path);

/// @brief Parse an entry name produced by contentEntry() or propertiesEntry().
/// @throws FormatError if the name does not follow the layout
[[nodiscard]] EntryRef parseEntry(std::string_view name);

/// @brief Normalize a member path: leading '/', no trailing '/' (except root),
///        no empty components.
/// @throws FormatError for "." or ".." components
[[nodiscard]] std::string normalizePath(std::string_view path);

/// @brief Check a library name (non-empty, no '/', not "." or "..").
[[nodiscard]] bool isValidLibraryName(std::string_view library) noexcept;

}  // namespace qzb::archive::layout

#endif  // QZB_ARCHIVE_ARCHIVE_LAYOUT_H
