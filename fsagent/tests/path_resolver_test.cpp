#include <gtest/gtest.h>

#include "agent_error.hpp"
#include "path_resolver.hpp"
#include "test_helpers.hpp"

#include <filesystem>

using fsagent::PathResolver;

namespace fs = std::filesystem;

class PathResolverTest : public ::testing::Test {
protected:
	void SetUp() override {
		root = dir.path();
		fs::create_directories(root / "home");
		fs::create_directories(root / "a" / "b");
	}

	PathResolver resolver() const { return PathResolver(root / "home", root); }

	TempDir dir;
	fs::path root;
};

TEST_F(PathResolverTest, EmptyPathIsRejected) {
	EXPECT_THROW(resolver().resolve(""), fsagent::ValidationError);
}

TEST_F(PathResolverTest, RelativePathIsRootedAtWorkingDirectory) {
	EXPECT_EQ(resolver().resolve("a/file.txt"), root / "a" / "file.txt");
	EXPECT_EQ(resolver().resolve("."), root);
}

TEST_F(PathResolverTest, DotDotMatchesSimplifiedPath) {
	auto r = resolver();
	EXPECT_EQ(r.resolve((root / "a/b/../b/./c").string()), r.resolve((root / "a/b/c").string()));
	EXPECT_EQ(r.resolve("a/../a/b"), root / "a" / "b");
	EXPECT_EQ(r.resolve("missing/x/../y"), root / "missing" / "y");
}

TEST_F(PathResolverTest, ExpandsHomeDirectory) {
	auto r = resolver();
	EXPECT_EQ(r.resolve("~"), root / "home");
	EXPECT_EQ(r.resolve("~/notes.txt"), root / "home" / "notes.txt");
}

TEST_F(PathResolverTest, UnknownUserIsLeftAsTyped) {
	EXPECT_EQ(resolver().resolve("~fsagent_no_such_user/x"), root / "~fsagent_no_such_user" / "x");
}

TEST_F(PathResolverTest, ResolvesSymlinksInExistingPrefix) {
	fs::create_directory_symlink(root / "a", root / "link");
	EXPECT_EQ(resolver().resolve("link/b/new.txt"), root / "a" / "b" / "new.txt");
}

TEST_F(PathResolverTest, DropsTrailingSeparator) {
	auto r = resolver();
	EXPECT_EQ(r.resolve("missing/"), root / "missing");
	EXPECT_EQ(r.resolve((root / "a").string() + "/"), root / "a");
}

TEST_F(PathResolverTest, ResultIsAlwaysAbsolute) {
	EXPECT_TRUE(resolver().resolve("x").is_absolute());
	EXPECT_TRUE(resolver().resolve("/").is_absolute());
}
