#include "patch_action.hpp"

#include "../agent_error.hpp"
#include "../atomic_file.hpp"
#include "../json_codec.hpp"
#include "../logger.hpp"
#include "../posix_file.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <vector>

#include <fcntl.h>

namespace fsagent::actions {

namespace {

constexpr std::size_t kCopyChunk = 64 * 1024;

// Copies up to `length` bytes starting at `offset`. A range running past the
// end of the source copies what exists.
void copy_range(int source, int64_t offset, int64_t length, AtomicFile& out, std::vector<char>& buffer) {
	int64_t copied = 0;
	while (copied < length) {
		std::size_t want = static_cast<std::size_t>(std::min<int64_t>(length - copied, kCopyChunk));
		std::size_t n = pread_some(source, buffer.data(), want, static_cast<off_t>(offset + copied));
		if (n == 0) {
			break;
		}
		out.write(buffer.data(), n);
		copied += static_cast<int64_t>(n);
	}
}

} // namespace

void PatchAction::handle(ActionContext& ctx) {
	auto src = resolve_path(ctx, "src");
	auto dst = codec::optional_string(ctx.params, "dst") ? resolve_path(ctx, "dst") : src;
	const nlohmann::json& ops = codec::require_array(ctx.params, "ops");

	FileDescriptor source = open_file(src, O_RDONLY);
	AtomicFile out(dst);
	std::vector<char> buffer(kCopyChunk);

	for (const auto& op : ops) {
		if (const nlohmann::json* copy = codec::find_key(op, "copy")) {
			int64_t offset = codec::require_int64(*copy, "off");
			int64_t length = codec::require_int64(*copy, "len");
			if (offset < 0 || length < 0) {
				throw ValidationError("copy off and len must not be negative");
			}
			copy_range(source.get(), offset, length, out, buffer);
		} else if (const nlohmann::json* insert = codec::find_key(op, "insert")) {
			out.write(codec::require_bytes(*insert, "data"));
		} else {
			throw ValidationError("patch op must be copy or insert");
		}
	}

	out.commit();
	LOG4CPLUS_INFO(fs_logger(), "patch " << src.string() << " -> " << dst.string() << " ops=" << ops.size()
	                                     << " bytes=" << out.bytes_written());
	send_result(ctx, nlohmann::json::object());
}

} // namespace fsagent::actions
