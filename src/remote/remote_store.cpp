// =============================================================================
// qzbulk - Remote Store Value Types
// =============================================================================

#include "qzb/remote/remote_store.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace qzb::remote {

MemberNature parseNature(std::string_view value) noexcept {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "collection") {
        return MemberNature::kCollection;
    }
    // "non-xml", "non-XML document", "nonxml"
    if (lower.starts_with("non")) {
        return MemberNature::kNonXmlDocument;
    }
    return MemberNature::kDocument;
}

const Property* PropertySet::find(std::string_view name) const noexcept {
    auto it = std::find_if(properties.begin(), properties.end(),
                           [name](const Property& property) { return property.name == name; });
    return it == properties.end() ? nullptr : &*it;
}

bool isServerManagedProperty(std::string_view name) noexcept {
    return name == kNatureProperty;
}

}  // namespace qzb::remote
