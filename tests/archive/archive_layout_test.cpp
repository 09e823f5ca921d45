// =============================================================================
// qzbulk - Archive Layout Tests
// =============================================================================

#include "qzb/archive/archive_layout.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>
#include <vector>

#include "qzb/archive/archiver.h"
#include "qzb/common/error.h"

namespace qzb::archive::test {

namespace gen {

rc::Gen<std::string> component() {
    return rc::gen::suchThat(
        rc::gen::nonEmpty(rc::gen::container<std::string>(
            rc::gen::elementOf(std::string("abcdefghijklmnopqrstuvwxyz0123456789-_.")))),
        [](const std::string& name) {
            return name != "." && name != ".." && name != layout::kPropertiesFile;
        });
}

rc::Gen<std::string> memberPath() {
    return rc::gen::map(rc::gen::nonEmpty(rc::gen::container<std::vector<std::string>>(component())),
                        [](const std::vector<std::string>& parts) {
                            std::string path;
                            for (const auto& part : parts) {
                                path += "/" + part;
                            }
                            return path;
                        });
}

}  // namespace gen

// =============================================================================
// Entry Names
// =============================================================================

TEST(ArchiveLayoutTest, ContentEntry) {
    EXPECT_EQ(layout::contentEntry("books", "/a/b.xml"), "books/content/a/b.xml");
    EXPECT_EQ(layout::contentEntry("books", "a//b.xml"), "books/content/a/b.xml");
}

TEST(ArchiveLayoutTest, PropertiesEntry) {
    EXPECT_EQ(layout::propertiesEntry("books", "/a/b.xml"), "books/properties/a/b.xml/.properties");
    EXPECT_EQ(layout::propertiesEntry("books", "/"), "books/properties/.properties");
}

TEST(ArchiveLayoutTest, RootHasNoContentEntry) {
    EXPECT_THROW(static_cast<void>(layout::contentEntry("books", "/")), FormatError);
}

TEST(ArchiveLayoutTest, InvalidLibraryNames) {
    EXPECT_FALSE(layout::isValidLibraryName(""));
    EXPECT_FALSE(layout::isValidLibraryName(".."));
    EXPECT_FALSE(layout::isValidLibraryName("a/b"));
    EXPECT_TRUE(layout::isValidLibraryName("books"));
    EXPECT_THROW(static_cast<void>(layout::contentEntry("a/b", "/x")), FormatError);
}

TEST(ArchiveLayoutTest, NormalizePath) {
    EXPECT_EQ(layout::normalizePath(""), "/");
    EXPECT_EQ(layout::normalizePath("/"), "/");
    EXPECT_EQ(layout::normalizePath("a/b/"), "/a/b");
    EXPECT_THROW(static_cast<void>(layout::normalizePath("/a/../b")), FormatError);
}

TEST(ArchiveLayoutTest, ParseEntry) {
    auto content = layout::parseEntry("books/content/a/b.xml");
    EXPECT_EQ(content.kind, layout::EntryKind::kContent);
    EXPECT_EQ(content.library, "books");
    EXPECT_EQ(content.path, "/a/b.xml");

    auto collection = layout::parseEntry("books/properties/a/.properties");
    EXPECT_EQ(collection.kind, layout::EntryKind::kProperties);
    EXPECT_EQ(collection.path, "/a");

    auto root = layout::parseEntry("books/properties/.properties");
    EXPECT_EQ(root.kind, layout::EntryKind::kProperties);
    EXPECT_EQ(root.path, "/");
}

TEST(ArchiveLayoutTest, ParseRejectsForeignEntries) {
    EXPECT_THROW(static_cast<void>(layout::parseEntry("books/other/a.xml")), FormatError);
    EXPECT_THROW(static_cast<void>(layout::parseEntry("books/properties/a.xml")), FormatError);
    EXPECT_THROW(static_cast<void>(layout::parseEntry("books/content")), FormatError);
    EXPECT_THROW(static_cast<void>(layout::parseEntry("/books/content/a.xml")), FormatError);
    EXPECT_THROW(static_cast<void>(layout::parseEntry("books/content/../a.xml")), FormatError);
}

TEST(ArchiveLayoutTest, ValidateEntryName) {
    EXPECT_NO_THROW(validateEntryName("books/content/a.xml"));
    EXPECT_THROW(validateEntryName(""), FormatError);
    EXPECT_THROW(validateEntryName("/etc/passwd"), FormatError);
    EXPECT_THROW(validateEntryName("books/../../etc"), FormatError);
    EXPECT_THROW(validateEntryName("books//a.xml"), FormatError);
    EXPECT_THROW(validateEntryName("books/"), FormatError);
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(ArchiveLayoutProperty, EntriesParseBackToTheirMember, ()) {
    const auto library = *gen::component();
    const auto path = *gen::memberPath();

    const auto content = layout::parseEntry(layout::contentEntry(library, path));
    RC_ASSERT(content == (layout::EntryRef{layout::EntryKind::kContent, library, path}));

    const auto properties = layout::parseEntry(layout::propertiesEntry(library, path));
    RC_ASSERT(properties == (layout::EntryRef{layout::EntryKind::kProperties, library, path}));
}

}  // namespace qzb::archive::test
