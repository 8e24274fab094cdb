#include <gtest/gtest.h>

#include "agent_error.hpp"
#include "base64.hpp"
#include "json_codec.hpp"

#include <nlohmann/json.hpp>

using namespace fsagent;

TEST(JsonCodec, DecodesRequestWithParams) {
	std::string error;
	auto req = codec::decode_request(R"({"id":7,"m":"read","p":{"path":"/tmp/x","off":3}})", error);
	ASSERT_TRUE(req.has_value()) << error;
	EXPECT_EQ(req->id, 7);
	EXPECT_EQ(req->method, "read");
	EXPECT_EQ(req->params["path"], "/tmp/x");
	EXPECT_EQ(req->params["off"], 3);
}

TEST(JsonCodec, MissingParamsBecomeEmptyObject) {
	std::string error;
	auto req = codec::decode_request(R"({"id":3,"m":"info"})", error);
	ASSERT_TRUE(req.has_value());
	EXPECT_TRUE(req->params.is_object());
	EXPECT_TRUE(req->params.empty());

	req = codec::decode_request(R"({"id":3,"m":"info","p":null})", error);
	ASSERT_TRUE(req.has_value());
	EXPECT_TRUE(req->params.is_object());
}

TEST(JsonCodec, MissingIdDefaultsToZero) {
	std::string error;
	auto req = codec::decode_request(R"({"m":"info"})", error);
	ASSERT_TRUE(req.has_value());
	EXPECT_EQ(req->id, 0);
}

TEST(JsonCodec, MalformedLineIsReportedNotThrown) {
	std::string error;
	std::optional<codec::Request> req;
	EXPECT_NO_THROW(req = codec::decode_request("{not json", error));
	EXPECT_FALSE(req.has_value());
	EXPECT_FALSE(error.empty());
}

TEST(JsonCodec, NonObjectRootIsRejected) {
	std::string error;
	EXPECT_FALSE(codec::decode_request("[1,2]", error).has_value());
	EXPECT_EQ(error, "request must be a JSON object");
}

TEST(JsonCodec, EncodesEachMessageKind) {
	EXPECT_EQ(codec::encode_message(1, codec::MessageKind::Error, "boom"), R"({"e":"boom","id":1})");
	EXPECT_EQ(codec::encode_message(2, codec::MessageKind::Result, nlohmann::json::object()), R"({"id":2,"r":{}})");
	EXPECT_EQ(codec::encode_message(3, codec::MessageKind::Data, nlohmann::json{{"out", "aGk="}}),
	          R"({"d":{"out":"aGk="},"id":3})");
}

TEST(JsonCodec, ReadyBanner) {
	EXPECT_EQ(codec::encode_ready(codec::kProtocolVersion), R"({"id":0,"ok":true,"v":1})");
}

TEST(JsonCodec, BinaryPayloadStaysOnOneLine) {
	std::string bytes("line one\nline two\0\r\n", 20);
	auto line = codec::encode_message(5, codec::MessageKind::Data, nlohmann::json{{"data", codec::encode_base64(bytes)}});
	EXPECT_EQ(line.find('\n'), std::string::npos);

	auto parsed = nlohmann::json::parse(line);
	auto decoded = codec::decode_base64(parsed["d"]["data"].get<std::string>());
	ASSERT_TRUE(decoded.has_value());
	EXPECT_EQ(*decoded, bytes);
}

TEST(JsonCodec, InvalidUtf8InErrorTextIsReplaced) {
	std::string line;
	EXPECT_NO_THROW(line = codec::encode_message(1, codec::MessageKind::Error, std::string("bad \xff name")));
	EXPECT_EQ(line.find('\n'), std::string::npos);

	auto parsed = nlohmann::json::parse(line);
	EXPECT_EQ(parsed["e"].get<std::string>(), "bad \xEF\xBF\xBD name");
}

TEST(JsonCodec, ValidUtf8IsKeptVerbatim) {
	auto line = codec::encode_message(1, codec::MessageKind::Result, nlohmann::json{{"path", "/tmp/caf\xC3\xA9"}});
	EXPECT_EQ(nlohmann::json::parse(line)["r"]["path"].get<std::string>(), "/tmp/caf\xC3\xA9");
}

TEST(JsonCodec, ParameterAccessorsValidateTypes) {
	nlohmann::json params{{"path", 5}, {"len", nullptr}, {"args", {"a", 1}}, {"flag", "yes"}};

	EXPECT_THROW(codec::require_string(params, "path"), ValidationError);
	EXPECT_THROW(codec::require_string(params, "missing"), ValidationError);
	EXPECT_FALSE(codec::optional_int64(params, "len").has_value());
	EXPECT_TRUE(codec::optional_bool(params, "missing", true));
	EXPECT_THROW(codec::optional_bool(params, "flag", false), ValidationError);
	EXPECT_THROW(codec::optional_string_list(params, "args"), ValidationError);
	EXPECT_TRUE(codec::optional_string_list(params, "missing").empty());

	try {
		codec::require_int64(params, "off");
		FAIL() << "expected ValidationError";
	} catch (const ValidationError& exc) {
		EXPECT_STREQ(exc.what(), "missing parameter 'off'");
	}
}

TEST(JsonCodec, RequireBytesDecodesBase64) {
	nlohmann::json params{{"data", "aGVsbG8="}, {"bad", "a$b"}};
	EXPECT_EQ(codec::require_bytes(params, "data"), "hello");
	EXPECT_THROW(codec::require_bytes(params, "bad"), ValidationError);
}

TEST(Base64, EncodesKnownVectors) {
	EXPECT_EQ(codec::encode_base64(std::string()), "");
	EXPECT_EQ(codec::encode_base64(std::string("f")), "Zg==");
	EXPECT_EQ(codec::encode_base64(std::string("fo")), "Zm8=");
	EXPECT_EQ(codec::encode_base64(std::string("foo")), "Zm9v");
	EXPECT_EQ(codec::encode_base64(std::string("foobar")), "Zm9vYmFy");
}

TEST(Base64, DecodesKnownVectorsIgnoringWhitespace) {
	EXPECT_EQ(codec::decode_base64("Zg=="), std::optional<std::string>("f"));
	EXPECT_EQ(codec::decode_base64("Zm8="), std::optional<std::string>("fo"));
	EXPECT_EQ(codec::decode_base64("Zm9v\nYmFy"), std::optional<std::string>("foobar"));
	EXPECT_EQ(codec::decode_base64(""), std::optional<std::string>(""));
}

TEST(Base64, RejectsInvalidInput) {
	EXPECT_FALSE(codec::decode_base64("Zm9v!").has_value());
	EXPECT_FALSE(codec::decode_base64("Z").has_value());
	EXPECT_FALSE(codec::decode_base64("Zg==Zg").has_value());
}
