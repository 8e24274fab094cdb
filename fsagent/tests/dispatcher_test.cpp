#include <gtest/gtest.h>

#include "action/action.hpp"
#include "json_codec.hpp"
#include "stdio_server.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <sstream>

using namespace std::chrono_literals;
using nlohmann::json;

TEST(Dispatcher, UnknownMethodDoesNotAffectNextRequest) {
	TempDir dir;
	TestAgent agent(dir);

	auto reply = agent.call(1, "frobnicate");
	EXPECT_EQ(reply.value("e", ""), "unknown method: frobnicate");

	reply = agent.call(2, "info");
	EXPECT_TRUE(reply.contains("r")) << reply.dump();
}

TEST(Dispatcher, MalformedLineIsReportedAgainstIdZero) {
	TempDir dir;
	TestAgent agent(dir);

	fsagent::actions::handle_line("{oops", *agent.context);
	auto messages = agent.writer.messages_for(0);
	ASSERT_EQ(messages.size(), 1u);
	EXPECT_EQ(messages[0].value("e", "").rfind("parse error: ", 0), 0u) << messages[0].dump();

	EXPECT_TRUE(agent.call(3, "info").contains("r"));
}

TEST(Dispatcher, NonObjectParamsAreRejected) {
	TempDir dir;
	TestAgent agent(dir);

	fsagent::actions::handle_line(R"({"id":4,"m":"stat","p":[1]})", *agent.context);
	auto reply = agent.writer.wait_for_terminal(4, 1s);
	ASSERT_TRUE(reply.has_value());
	EXPECT_EQ(reply->value("e", ""), "invalid request: params must be an object");
}

TEST(Dispatcher, MissingParameterIsNamed) {
	TempDir dir;
	TestAgent agent(dir);

	auto reply = agent.call(5, "stat");
	EXPECT_EQ(reply.value("e", ""), "invalid request: missing parameter 'path'");

	reply = agent.call(6, "read", {{"path", 7}});
	EXPECT_EQ(reply.value("e", ""), "invalid request: parameter 'path' must be a string");
}

TEST(Dispatcher, EveryRequestGetsExactlyOneTerminal) {
	TempDir dir;
	TestAgent agent(dir);
	write_text(dir / "f", "x");

	agent.call(7, "read", {{"path", "f"}});
	agent.call(8, "read", {{"path", "missing"}});
	agent.call(9, "nope");

	for (int64_t id : {7, 8, 9}) {
		int terminals = 0;
		for (const auto& message : agent.writer.messages_for(id)) {
			terminals += is_terminal(message) ? 1 : 0;
		}
		EXPECT_EQ(terminals, 1) << "id " << id;
	}
}

TEST(Dispatcher, CatalogueIsComplete) {
	EXPECT_EQ(fsagent::actions::method_count(), 20u);
}

TEST(StdioServer, SessionStartsWithBannerAndSkipsBlankLines) {
	TempDir dir;
	TestAgent agent(dir);

	std::istringstream in("{\"id\":1,\"m\":\"info\"}\n"
	                      "\n"
	                      "   \n"
	                      "{\"id\":2,\"m\":\"exists\",\"p\":{\"path\":\"/\"}}\n");
	fsagent::StdioServer server(in, *agent.context);
	EXPECT_EQ(server.run(), 0);
	EXPECT_EQ(server.requests_handled(), 2u);

	auto lines = agent.writer.lines();
	ASSERT_EQ(lines.size(), 3u);
	EXPECT_EQ(lines[0], fsagent::codec::encode_ready(fsagent::codec::kProtocolVersion));
	EXPECT_TRUE(agent.writer.messages_for(1).at(0).contains("r"));
	EXPECT_EQ(agent.writer.messages_for(2).at(0)["r"]["exists"], true);
}

TEST(StdioServer, EndOfInputStopsRunningProcesses) {
	TempDir dir;
	TestAgent agent(dir);

	std::istringstream in("{\"id\":5,\"m\":\"exec\",\"p\":{\"cmd\":\"sleep\",\"args\":[\"30\"]}}\n");
	fsagent::StdioServer server(in, *agent.context);

	auto start = std::chrono::steady_clock::now();
	EXPECT_EQ(server.run(), 0);
	EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);

	EXPECT_EQ(agent.context->processes.tracked_count(), 0u);
	auto terminal = agent.writer.wait_for_terminal(5, 1s);
	ASSERT_TRUE(terminal.has_value());
	EXPECT_EQ(terminal->value("e", ""), "cancelled");
}
