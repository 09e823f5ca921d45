// =============================================================================
// qzbulk - Remote Store Interface
// =============================================================================
// Capability the pipeline consumes to talk to the XML database server.
//
// Every worker owns its own RemoteStore, created from a RemoteStoreFactory;
// instances are never shared between threads.
//
// Failures:
// - RemoteError: the server rejected or failed one request
// - ConnectionError: the server could not be reached
// =============================================================================

#ifndef QZB_REMOTE_REMOTE_STORE_H
#define QZB_REMOTE_REMOTE_STORE_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "qzb/common/types.h"

namespace qzb::remote {

// =============================================================================
// Members and Properties
// =============================================================================

/// @brief Name of the server-derived property telling members apart.
inline constexpr std::string_view kNatureProperty = "nature";

/// @brief Kind of library member, as reported by its "nature" property.
enum class MemberNature : std::uint8_t {
    kCollection = 0,
    kDocument = 1,
    kNonXmlDocument = 2
};

/// @brief Parse a "nature" property value ("collection", "document", "non-xml").
[[nodiscard]] MemberNature parseNature(std::string_view value) noexcept;

[[nodiscard]] constexpr std::string_view natureToString(MemberNature nature) noexcept {
    switch (nature) {
        case MemberNature::kCollection: return "collection";
        case MemberNature::kDocument: return "document";
        case MemberNature::kNonXmlDocument: return "non-xml";
    }
    return "document";
}

/// @brief A collection or document below a library root.
struct Member {
    /// @brief Absolute member path, starting with '/'.
    std::string path;

    MemberNature nature = MemberNature::kDocument;

    [[nodiscard]] bool isCollection() const noexcept { return nature == MemberNature::kCollection; }

    [[nodiscard]] DocumentKind documentKind() const noexcept {
        return nature == MemberNature::kNonXmlDocument ? DocumentKind::kNonXml : DocumentKind::kXml;
    }

    bool operator==(const Member&) const = default;
};

/// @brief One named, typed property value.
/// @note For "node()" properties the value holds serialized XML.
struct Property {
    std::string name;
    std::string type = "string";
    std::string value;

    bool operator==(const Property&) const = default;
};

/// @brief The properties of one document or collection.
struct PropertySet {
    std::string path;
    std::vector<Property> properties;

    /// @brief Find a property by name.
    [[nodiscard]] const Property* find(std::string_view name) const noexcept;

    bool operator==(const PropertySet&) const = default;
};

/// @brief Whether the server derives a property itself (never written back).
[[nodiscard]] bool isServerManagedProperty(std::string_view name) noexcept;

// =============================================================================
// RemoteStore
// =============================================================================

/// @brief Remote database capability.
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    /// @brief Names of all XML libraries.
    [[nodiscard]] virtual std::vector<std::string> listLibraries() = 0;

    /// @brief Members below a collection, down to depth levels.
    /// @note The collection itself is not part of the result.
    [[nodiscard]] virtual std::vector<Member> listMembers(const std::string& library,
                                                          const std::string& path, int depth) = 0;

    /// @brief Raw bytes of a document body.
    [[nodiscard]] virtual Payload getDocument(const std::string& library,
                                              const std::string& path) = 0;

    /// @brief All properties of a document or collection.
    [[nodiscard]] virtual PropertySet getProperties(const std::string& library,
                                                    const std::string& path) = 0;

    /// @brief Store a document body, creating missing ancestor collections.
    virtual void putDocument(const std::string& library, const std::string& path,
                             const Payload& body, DocumentKind kind) = 0;

    /// @brief Store properties; a missing collection at path is created.
    virtual void putProperties(const std::string& library, const std::string& path,
                               const PropertySet& properties) = 0;

    /// @brief Create a library unless it already exists.
    virtual void ensureLibrary(const std::string& library) = 0;
};

/// @brief Creates one RemoteStore per worker.
/// @throws ConnectionError if no client can be created
using RemoteStoreFactory = std::function<std::unique_ptr<RemoteStore>()>;

}  // namespace qzb::remote

#endif  // QZB_REMOTE_REMOTE_STORE_H
