#pragma once

#include "agent_config.hpp"
#include "core_context.hpp"
#include "message_writer.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
	TempDir();
	~TempDir();

	TempDir(const TempDir&) = delete;
	TempDir& operator=(const TempDir&) = delete;

	const std::filesystem::path& path() const { return path_; }
	std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
	std::filesystem::path path_;
};

void write_text(const std::filesystem::path& path, const std::string& content);
std::string read_text(const std::filesystem::path& path);

/// Deterministic binary content of the given size.
std::string make_pattern(std::size_t size);

/// Keeps every line the agent sends, parsed, and lets tests wait for the
/// terminal message of a request.
class RecordingWriter final : public fsagent::MessageWriter {
public:
	std::vector<std::string> lines() const;
	std::vector<nlohmann::json> messages_for(int64_t id) const;

	/// Waits until `count` terminal messages (result or error) arrived for
	/// `id` and returns them in arrival order. Returns fewer on timeout.
	std::vector<nlohmann::json> wait_for_terminals(int64_t id, std::size_t count,
												   std::chrono::milliseconds timeout);
	std::optional<nlohmann::json> wait_for_terminal(int64_t id, std::chrono::milliseconds timeout);

	/// Waits until `predicate` holds for the messages sent so far for `id`.
	bool wait_until(int64_t id, const std::function<bool(const std::vector<nlohmann::json>&)>& predicate,
					std::chrono::milliseconds timeout);

protected:
	void write_line(const std::string& line) override;

private:
	std::vector<nlohmann::json> messages_for_locked(int64_t id) const;

	mutable std::mutex mutex_;
	std::condition_variable cv_;
	std::vector<std::string> lines_;
};

bool is_terminal(const nlohmann::json& message);

/// An AgentContext rooted in a TempDir: cwd is the temp dir, home is
/// `<tmp>/home`, and process timings are short.
class TestAgent {
public:
	explicit TestAgent(const TempDir& dir, const std::function<void(fsagent::AgentConfig&)>& customize = {});

	/// Dispatches one request and waits for its terminal message. Returns
	/// null on timeout.
	nlohmann::json call(int64_t id, const std::string& method, const nlohmann::json& params = nlohmann::json::object());

	/// Dispatches one request without waiting.
	void send(int64_t id, const std::string& method, const nlohmann::json& params = nlohmann::json::object());

	std::vector<nlohmann::json> data_for(int64_t id) const;

	/// Concatenation of the decoded base64 `key` field of every data message
	/// sent for `id`.
	std::string collected(int64_t id, const std::string& key) const;

	RecordingWriter writer;
	std::unique_ptr<fsagent::AgentContext> context;
};

std::string b64(const std::string& bytes);
