#include "TempTree.hpp"
#include "fs/MetadataExtractor.hpp"
#include "fs/PathResolver.hpp"
#include "fs/platform/BirthTime.hpp"

#include <pwd.h>
#include <sys/stat.h>

using namespace dp::fs;
using namespace dp::fs::model;

class MetadataExtractorTest : public TempTreeTest {
protected:
    Root root;
    PathResolver resolver;

    void SetUp() override {
        TempTreeTest::SetUp();
        root = {"/", mkdir("root")};
    }
};

TEST(MetadataFormatTest, PermissionModeIsFourDigitOctal) {
    EXPECT_EQ(MetadataExtractor::formatPermissionMode(0644), "0644");
    EXPECT_EQ(MetadataExtractor::formatPermissionMode(S_IFREG | 0755), "0755");
    EXPECT_EQ(MetadataExtractor::formatPermissionMode(04755), "0755");
    EXPECT_EQ(MetadataExtractor::formatPermissionMode(0), "0000");
}

TEST(MetadataFormatTest, UnresolvedIdsFallBackToDecimal) {
    constexpr uid_t unmapped = 987654;
    ASSERT_EQ(::getpwuid(unmapped), nullptr);
    EXPECT_EQ(MetadataExtractor::userName(unmapped), "987654");
    EXPECT_EQ(MetadataExtractor::groupName(unmapped), "987654");
}

TEST(MetadataFormatTest, SniffOfUnreadablePathIsEmpty) {
    EXPECT_EQ(MetadataExtractor::sniffMimeType("/nonexistent/dendrite/file"), "");
}

TEST_F(MetadataExtractorTest, FileAttributes) {
    const auto p = write("root/notes.txt", "plain text content\n");
    fs::permissions(p, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read);

    const auto d = resolver.describe(root, "notes.txt");
    const auto& m = d.metadata;

    EXPECT_EQ(m.name, "notes.txt");
    EXPECT_EQ(m.virtualPath, "/notes.txt");
    EXPECT_EQ(m.resourceKind, Kind::File);
    ASSERT_TRUE(m.sizeBytes);
    EXPECT_EQ(*m.sizeBytes, 19u);
    EXPECT_EQ(m.permissionMode, "0640");
    EXPECT_EQ(m.userId, ::getuid());
    EXPECT_EQ(m.groupId, ::getgid());
    EXPECT_EQ(m.mimeType, "text/plain");
    EXPECT_TRUE(m.accessedAt);
    EXPECT_TRUE(m.modifiedAt);
    EXPECT_TRUE(m.changedAt);
    if (!platform::supportsBirthTime()) EXPECT_FALSE(m.bornAt);
}

TEST_F(MetadataExtractorTest, OwnerNameMatchesSystemLookup) {
    write("root/a.txt", "x");
    const auto m = resolver.describe(root, "a.txt").metadata;
    if (const auto* pw = ::getpwuid(::getuid())) EXPECT_EQ(m.user, pw->pw_name);
    else EXPECT_EQ(m.user, ::getuid() == 0 ? "" : std::to_string(::getuid()));
}

TEST_F(MetadataExtractorTest, ContentIsSniffedNotGuessedFromExtension) {
    const std::string png("\x89PNG\r\n\x1a\n\0\0\0\rIHDR\0\0\0\x01\0\0\0\x01\x08\x06\0\0\0", 29);
    write("root/picture.txt", png);
    EXPECT_EQ(resolver.describe(root, "picture.txt").metadata.mimeType, "image/png");
}

TEST_F(MetadataExtractorTest, FolderAndSymlinkSentinels) {
    mkdir("root/dir");
    write("root/file.txt", "hello");
    link("file.txt", "root/link");

    const auto folder = resolver.describe(root, "dir").metadata;
    EXPECT_EQ(folder.mimeType, MIME_DIRECTORY);
    EXPECT_FALSE(folder.sizeBytes);

    const auto symlink = resolver.describe(root, "link").metadata;
    EXPECT_EQ(symlink.resourceKind, Kind::Symlink);
    EXPECT_EQ(symlink.mimeType, MIME_SYMLINK);
    EXPECT_FALSE(symlink.sizeBytes);
}

TEST_F(MetadataExtractorTest, SymlinkAttributesComeFromTarget) {
    const auto target = write("root/target.txt", "hello");
    fs::permissions(target, fs::perms::owner_all);
    link("target.txt", "root/link");

    const auto m = resolver.describe(root, "link").metadata;
    EXPECT_EQ(m.permissionMode, "0700");
    EXPECT_EQ(m.name, "link");
}
