#include <gtest/gtest.h>

#include "atomic_file.hpp"
#include "test_helpers.hpp"

#include <filesystem>

#include <sys/stat.h>

namespace fs = std::filesystem;

using nlohmann::json;

namespace {

json copy_op(int64_t off, int64_t len) {
	return json{{"copy", {{"off", off}, {"len", len}}}};
}

json insert_op(const std::string& bytes) {
	return json{{"insert", {{"data", b64(bytes)}}}};
}

} // namespace

TEST(PatchAction, MixesCopyAndInsert) {
	TempDir dir;
	TestAgent agent(dir);
	write_text(dir / "f.txt", "ABCDEF");

	auto reply = agent.call(1, "patch",
	                        {{"src", "f.txt"}, {"ops", json::array({copy_op(0, 2), insert_op("XY"), copy_op(4, 2)})}});
	ASSERT_TRUE(reply.contains("r")) << reply.dump();
	EXPECT_EQ(read_text(dir / "f.txt"), "ABXYEF");
	EXPECT_FALSE(fs::exists(fsagent::AtomicFile::temp_path_for(dir / "f.txt")));
}

TEST(PatchAction, FullCopyReproducesSource) {
	TempDir dir;
	TestAgent agent(dir);
	std::string content = make_pattern(150000);
	write_text(dir / "blob", content);

	auto reply = agent.call(2, "patch", {{"src", "blob"}, {"ops", json::array({copy_op(0, 70000), copy_op(70000, 80000)})}});
	ASSERT_TRUE(reply.contains("r")) << reply.dump();
	EXPECT_EQ(read_text(dir / "blob"), content);
}

TEST(PatchAction, WritesSeparateDestination) {
	TempDir dir;
	TestAgent agent(dir);
	write_text(dir / "base", "hello world");

	auto reply = agent.call(3, "patch",
	                        {{"src", "base"}, {"dst", "derived"}, {"ops", json::array({copy_op(0, 6), insert_op("there")})}});
	ASSERT_TRUE(reply.contains("r")) << reply.dump();
	EXPECT_EQ(read_text(dir / "derived"), "hello there");
	EXPECT_EQ(read_text(dir / "base"), "hello world");
}

TEST(PatchAction, CopyPastEndTakesAvailableBytes) {
	TempDir dir;
	TestAgent agent(dir);
	write_text(dir / "short", "ABC");

	auto reply = agent.call(4, "patch", {{"src", "short"}, {"ops", json::array({copy_op(1, 100), copy_op(10, 5)})}});
	ASSERT_TRUE(reply.contains("r")) << reply.dump();
	EXPECT_EQ(read_text(dir / "short"), "BC");
}

TEST(PatchAction, PreservesDestinationMode) {
	TempDir dir;
	TestAgent agent(dir);
	write_text(dir / "run.sh", "#!/bin/sh\n");
	ASSERT_EQ(::chmod((dir / "run.sh").c_str(), 0700), 0);

	agent.call(5, "patch", {{"src", "run.sh"}, {"ops", json::array({copy_op(0, 10), insert_op("true\n")})}});
	EXPECT_EQ(read_text(dir / "run.sh"), "#!/bin/sh\ntrue\n");

	struct stat st {};
	ASSERT_EQ(::stat((dir / "run.sh").c_str(), &st), 0);
	EXPECT_EQ(st.st_mode & 07777, 0700u);
}

TEST(PatchAction, InvalidOpLeavesFileUntouched) {
	TempDir dir;
	TestAgent agent(dir);
	write_text(dir / "keep", "original");

	auto reply = agent.call(6, "patch",
	                        {{"src", "keep"}, {"ops", json::array({copy_op(0, 4), json{{"delete", {{"len", 2}}}}})}});
	EXPECT_EQ(reply.value("e", ""), "invalid request: patch op must be copy or insert");
	EXPECT_EQ(read_text(dir / "keep"), "original");
	EXPECT_FALSE(fs::exists(fsagent::AtomicFile::temp_path_for(dir / "keep")));
}

TEST(PatchAction, MissingSourceReportsNotFound) {
	TempDir dir;
	TestAgent agent(dir);

	auto reply = agent.call(7, "patch", {{"src", "absent"}, {"dst", "out"}, {"ops", json::array({insert_op("x")})}});
	EXPECT_EQ(reply.value("e", "").rfind("not found: ", 0), 0u) << reply.dump();
	EXPECT_FALSE(fs::exists(dir / "out"));
}
