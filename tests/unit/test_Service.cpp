#include "TempTree.hpp"
#include "fs/Error.hpp"
#include "fs/Service.hpp"

#include <algorithm>
#include <functional>

using namespace dp::fs;
using namespace dp::fs::model;

class ServiceTest : public TempTreeTest {};

static ErrorCode codeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected an fs::Error";
    return ErrorCode::StatFailure;
}

TEST_F(ServiceTest, ListRootsReturnsOneFolderPerRoot) {
    mkdir("docs");
    mkdir("media");
    const Service svc({{"/docs", test_dir / "docs"}, {"/media", test_dir / "media"}});

    const auto roots = svc.listRoots();
    ASSERT_EQ(roots.size(), 2u);
    EXPECT_EQ(roots[0].name, "docs");
    EXPECT_EQ(roots[0].virtualPath, "/docs");
    EXPECT_EQ(roots[0].kind, Kind::Folder);
    EXPECT_EQ(roots[1].name, "media");
    EXPECT_FALSE(svc.hasSingleSlashRoot());
}

TEST_F(ServiceTest, SingleSlashRootListsContentsDirectly) {
    write("root/a.txt");
    write("root/b.txt");
    const Service svc({{"/", test_dir / "root"}});

    ASSERT_TRUE(svc.hasSingleSlashRoot());
    const auto entries = svc.list("/", "");
    ASSERT_EQ(entries.size(), 2u);
    for (const auto& e : entries) {
        EXPECT_NE(e.name, "/");
        EXPECT_EQ(e.virtualPath, "/" + e.name);
    }
}

TEST_F(ServiceTest, ResolveAndListUseTheNamedRoot) {
    write("docs/x.txt", "1");
    write("media/y.txt", "22");
    const Service svc({{"/docs", test_dir / "docs"}, {"/media", test_dir / "media"}});

    EXPECT_EQ(svc.resolve("/media", "y.txt").metadata.sizeBytes.value_or(0), 2u);
    EXPECT_EQ(svc.resolve("docs", "x.txt").virtualPath, "/docs/x.txt");
    EXPECT_EQ(svc.list("/docs", "").size(), 1u);
}

TEST_F(ServiceTest, UnknownRootIsRootNotFound) {
    mkdir("docs");
    const Service svc({{"/docs", test_dir / "docs"}});
    EXPECT_EQ(codeOf([&] { (void)svc.resolve("/nope", ""); }), ErrorCode::RootNotFound);
    EXPECT_EQ(codeOf([&] { (void)svc.list("/nope", ""); }), ErrorCode::RootNotFound);
}

TEST_F(ServiceTest, ErrorsCarryOnlyTheVirtualPath) {
    mkdir("docs");
    const Service svc({{"/docs", test_dir / "docs"}});
    try {
        (void)svc.resolve("/docs", "missing.txt");
        FAIL() << "expected NotFound";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
        EXPECT_EQ(e.virtualPath(), "/docs/missing.txt");
        EXPECT_EQ(std::string(e.what()).find(test_dir.string()), std::string::npos);
    }
}

TEST_F(ServiceTest, IndependentInstancesCoexist) {
    mkdir("a");
    mkdir("b");
    const Service one({{"/x", test_dir / "a"}});
    const Service two({{"/y", test_dir / "b"}});
    EXPECT_EQ(one.roots().front().virtualName, "/x");
    EXPECT_EQ(two.roots().front().virtualName, "/y");
    EXPECT_EQ(codeOf([&] { (void)one.resolve("/y", ""); }), ErrorCode::RootNotFound);
}
