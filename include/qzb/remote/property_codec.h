// =============================================================================
// qzbulk - Property Set XML Codec
// =============================================================================
// Property sets travel and are archived as the XML the server emits:
//
//   <properties path="/a/b.xml">
//     <property name="nature">document</property>
//     <property name="owner" type="string">alice</property>
//   </properties>
//
// Several sets may be wrapped in any root element (getprop with depth > 0).
// =============================================================================

#ifndef QZB_REMOTE_PROPERTY_CODEC_H
#define QZB_REMOTE_PROPERTY_CODEC_H

#include <cstdint>
#include <span>
#include <vector>

#include "qzb/common/types.h"
#include "qzb/remote/remote_store.h"

namespace qzb::remote {

/// @brief Serialize one property set as an XML document.
[[nodiscard]] Payload encodeProperties(const PropertySet& properties);

/// @brief Parse a document whose root is a single <properties> element.
/// @throws FormatError on malformed XML or an unexpected root
[[nodiscard]] PropertySet decodeProperties(std::span<const std::uint8_t> xml);

/// @brief Parse every <properties> element of a document.
/// @note Accepts a <properties> root or any root wrapping <properties> children.
/// @throws FormatError on malformed XML
[[nodiscard]] std::vector<PropertySet> decodePropertiesList(std::span<const std::uint8_t> xml);

}  // namespace qzb::remote

#endif  // QZB_REMOTE_PROPERTY_CODEC_H
