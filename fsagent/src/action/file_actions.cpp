#include "action_base.hpp"
#include "action_registry.hpp"
#include "patch_action.hpp"

#include "../agent_error.hpp"
#include "../atomic_file.hpp"
#include "../base64.hpp"
#include "../child_process.hpp"
#include "../file_transfer.hpp"
#include "../json_codec.hpp"
#include "../logger.hpp"
#include "../posix_file.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <log4cplus/loggingmacros.h>

namespace fsagent::actions {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;

nlohmann::json stat_to_json(const struct stat& st) {
    return nlohmann::json{
        {"size", static_cast<int64_t>(st.st_size)},
        {"mtime", static_cast<int64_t>(st.st_mtime)},
        {"mode", static_cast<uint32_t>(st.st_mode)},
        {"uid", static_cast<uint32_t>(st.st_uid)},
        {"gid", static_cast<uint32_t>(st.st_gid)},
        {"dir", S_ISDIR(st.st_mode) != 0},
        {"file", S_ISREG(st.st_mode) != 0},
    };
}

void check_non_negative(const std::string& key, int64_t value) {
    if (value < 0) {
        throw ValidationError("parameter '" + key + "' must not be negative");
    }
}

int64_t require_non_negative(const nlohmann::json& params, const std::string& key) {
    int64_t value = codec::require_int64(params, key);
    check_non_negative(key, value);
    return value;
}

std::optional<int64_t> optional_non_negative(const nlohmann::json& params, const std::string& key) {
    auto value = codec::optional_int64(params, key);
    if (value) {
        check_non_negative(key, *value);
    }
    return value;
}

std::string format_octal(int64_t mode) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%llo", static_cast<unsigned long long>(mode));
    return buffer;
}

std::string trim(std::string text) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    text.erase(text.begin(), std::find_if(text.begin(), text.end(), not_space));
    text.erase(std::find_if(text.rbegin(), text.rend(), not_space).base(), text.end());
    return text;
}

class ReadAction final : public ActionHandler {
public:
    const char* name() const override { return "read"; }

    void handle(ActionContext& ctx) override {
        auto path = resolve_path(ctx, "path");
        int64_t offset = codec::optional_int64(ctx.params, "off").value_or(0);
        auto length = codec::optional_int64(ctx.params, "len");
        if (offset < 0 || (length && *length < 0)) {
            throw ValidationError("off and len must not be negative");
        }

        FileDescriptor fd = open_file(path, O_RDONLY);
        if (offset > 0 && ::lseek(fd.get(), static_cast<off_t>(offset), SEEK_SET) < 0) {
            throw_errno("seek", path);
        }

        std::vector<char> buffer(kReadChunk);
        uint64_t total = 0;
        while (true) {
            std::size_t want = kReadChunk;
            if (length) {
                uint64_t left = static_cast<uint64_t>(*length) - total;
                if (left == 0) {
                    break;
                }
                want = static_cast<std::size_t>(std::min<uint64_t>(want, left));
            }

            std::size_t n = read_some(fd.get(), buffer.data(), want);
            if (n == 0) {
                break;
            }
            total += n;
            send_data(ctx, nlohmann::json{{"data", codec::encode_base64(buffer.data(), n)}});
        }

        LOG4CPLUS_DEBUG(fs_logger(), "read " << path.string() << " bytes=" << total);
        send_result(ctx, nlohmann::json{{"size", total}});
    }
};

class WriteAction final : public ActionHandler {
public:
    const char* name() const override { return "write"; }

    void handle(ActionContext& ctx) override {
        auto path = resolve_path(ctx, "path");
        std::string data = codec::require_bytes(ctx.params, "data");

        std::size_t written = write_file_atomically(path, data);
        LOG4CPLUS_INFO(fs_logger(), "write " << path.string() << " bytes=" << written);
        send_result(ctx, nlohmann::json{{"size", written}});
    }
};

/**
 * Writes through the elevated helper for files the agent's user cannot
 * write: `<helper> tee <path>`, then optional `<helper> chmod` and
 * `<helper> chown`. How the helper authenticates is up to the host.
 */
class SudoWriteAction final : public ActionHandler {
public:
    const char* name() const override { return "sudo_write"; }

    void handle(ActionContext& ctx) override {
        auto path = resolve_path(ctx, "path");
        std::string data = codec::require_bytes(ctx.params, "data");
        auto mode = optional_non_negative(ctx.params, "mode");
        auto uid = optional_non_negative(ctx.params, "uid");
        auto gid = optional_non_negative(ctx.params, "gid");
        const std::string& helper = ctx.context.config.helper;

        SpawnOptions tee_step;
        tee_step.argv = {helper, "tee", path.string()};
        tee_step.capture_stdout = false;
        run_step("tee", tee_step, data);

        if (mode) {
            SpawnOptions chmod_step;
            chmod_step.argv = {helper, "chmod", format_octal(*mode), path.string()};
            run_step("chmod", chmod_step, std::string());
        }
        if (uid && gid) {
            SpawnOptions chown_step;
            chown_step.argv = {helper, "chown", std::to_string(*uid) + ":" + std::to_string(*gid), path.string()};
            run_step("chown", chown_step, std::string());
        }

        LOG4CPLUS_INFO(fs_logger(), "sudo_write " << path.string() << " bytes=" << data.size());
        send_result(ctx, nlohmann::json{{"size", data.size()}});
    }

private:
    static void run_step(const char* step, const SpawnOptions& options, const std::string& input) {
        HelperResult result = run_helper(options, input);
        if (result.exit_code != 0) {
            std::string diagnostic = trim(result.error_output);
            if (diagnostic.empty()) {
                diagnostic = "exit code " + std::to_string(result.exit_code);
            }
            throw HelperFailure(std::string("sudo ") + step + " failed: " + diagnostic);
        }
    }
};

class StatAction final : public ActionHandler {
public:
    const char* name() const override { return "stat"; }

    void handle(ActionContext& ctx) override {
        auto path = resolve_path(ctx, "path");
        bool follow = codec::optional_bool(ctx.params, "link", true);

        struct stat st = stat_path(path, follow);
        bool is_link = false;
        if (follow) {
            struct stat lst {};
            is_link = ::lstat(path.c_str(), &lst) == 0 && S_ISLNK(lst.st_mode);
        }

        nlohmann::json result = stat_to_json(st);
        result["link"] = is_link;
        send_result(ctx, result);
    }
};

class LsAction final : public ActionHandler {
public:
    const char* name() const override { return "ls"; }

    void handle(ActionContext& ctx) override {
        auto path = resolve_path(ctx, "path");

        nlohmann::json entries = nlohmann::json::array();
        for (const auto& entry : std::filesystem::directory_iterator(path)) {
            const std::filesystem::path& entry_path = entry.path();

            struct stat lst {};
            if (::lstat(entry_path.c_str(), &lst) != 0) {
                // Removed between readdir and lstat.
                continue;
            }
            bool is_link = S_ISLNK(lst.st_mode);

            struct stat target {};
            bool resolved = ::stat(entry_path.c_str(), &target) == 0;
            bool is_dir = resolved && S_ISDIR(target.st_mode);
            bool is_file = resolved && S_ISREG(target.st_mode);

            entries.push_back(nlohmann::json{
                {"name", entry_path.filename().string()},
                {"path", entry_path.string()},
                {"dir", is_dir},
                {"file", is_file},
                {"link", is_link},
                {"link_dir", is_link && is_dir},
                {"size", static_cast<int64_t>(lst.st_size)},
                {"mtime", static_cast<int64_t>(lst.st_mtime)},
                {"mode", static_cast<uint32_t>(lst.st_mode)},
                {"uid", static_cast<uint32_t>(lst.st_uid)},
                {"gid", static_cast<uint32_t>(lst.st_gid)},
            });
        }

        send_result(ctx, nlohmann::json{{"entries", std::move(entries)}});
    }
};

class RmAction final : public ActionHandler {
public:
    const char* name() const override { return "rm"; }

    void handle(ActionContext& ctx) override {
        auto path = resolve_path(ctx, "path");
        if (::unlink(path.c_str()) != 0) {
            throw_errno("unlink", path);
        }
        LOG4CPLUS_INFO(fs_logger(), "rm " << path.string());
        send_result(ctx, nlohmann::json::object());
    }
};

class RmdirAction final : public ActionHandler {
public:
    const char* name() const override { return "rmdir"; }

    void handle(ActionContext& ctx) override {
        auto path = resolve_path(ctx, "path");
        if (::rmdir(path.c_str()) != 0) {
            throw_errno("rmdir", path);
        }
        LOG4CPLUS_INFO(fs_logger(), "rmdir " << path.string());
        send_result(ctx, nlohmann::json::object());
    }
};

class MkdirAction final : public ActionHandler {
public:
    const char* name() const override { return "mkdir"; }

    void handle(ActionContext& ctx) override {
        auto path = resolve_path(ctx, "path");
        if (codec::optional_bool(ctx.params, "parents", false)) {
            std::filesystem::create_directories(path);
        } else if (::mkdir(path.c_str(), 0777) != 0) {
            throw_errno("mkdir", path);
        }
        send_result(ctx, nlohmann::json::object());
    }
};

class MvAction final : public ActionHandler {
public:
    const char* name() const override { return "mv"; }

    void handle(ActionContext& ctx) override {
        auto from = resolve_path(ctx, "from");
        auto to = target_in_directory(from, resolve_path(ctx, "to"));

        if (::rename(from.c_str(), to.c_str()) != 0) {
            if (errno != EXDEV) {
                throw_errno("rename", from);
            }
            move_across_devices(from, to);
        }

        LOG4CPLUS_INFO(fs_logger(), "mv " << from.string() << " -> " << to.string());
        send_result(ctx, nlohmann::json::object());
    }
};

class CpAction final : public ActionHandler {
public:
    const char* name() const override { return "cp"; }

    void handle(ActionContext& ctx) override {
        auto from = resolve_path(ctx, "from");
        auto to = target_in_directory(from, resolve_path(ctx, "to"));

        auto size = copy_file_with_attributes(from, to);
        LOG4CPLUS_INFO(fs_logger(), "cp " << from.string() << " -> " << to.string());
        send_result(ctx, nlohmann::json{{"size", size}});
    }
};

class RealpathAction final : public ActionHandler {
public:
    const char* name() const override { return "realpath"; }

    void handle(ActionContext& ctx) override {
        send_result(ctx, nlohmann::json{{"path", resolve_path(ctx, "path").string()}});
    }
};

class ChmodAction final : public ActionHandler {
public:
    const char* name() const override { return "chmod"; }

    void handle(ActionContext& ctx) override {
        auto path = resolve_path(ctx, "path");
        int64_t mode = require_non_negative(ctx.params, "mode");
        if (::chmod(path.c_str(), static_cast<mode_t>(mode)) != 0) {
            throw_errno("chmod", path);
        }
        send_result(ctx, nlohmann::json::object());
    }
};

class AppendAction final : public ActionHandler {
public:
    const char* name() const override { return "append"; }

    void handle(ActionContext& ctx) override {
        auto path = resolve_path(ctx, "path");
        std::string data = codec::require_bytes(ctx.params, "data");

        FileDescriptor fd = open_file(path, O_WRONLY | O_APPEND | O_CREAT);
        write_all(fd.get(), data.data(), data.size());
        sync_file(fd.get(), path);
        fd.close();

        send_result(ctx, nlohmann::json{{"size", data.size()}});
    }
};

class TruncateAction final : public ActionHandler {
public:
    const char* name() const override { return "truncate"; }

    void handle(ActionContext& ctx) override {
        auto path = resolve_path(ctx, "path");
        int64_t length = require_non_negative(ctx.params, "len");
        if (::truncate(path.c_str(), static_cast<off_t>(length)) != 0) {
            throw_errno("truncate", path);
        }
        send_result(ctx, nlohmann::json::object());
    }
};

// Never fails: any problem resolving or inspecting the path means "no".
class ExistsAction final : public ActionHandler {
public:
    const char* name() const override { return "exists"; }

    void handle(ActionContext& ctx) override {
        bool exists = false;
        try {
            auto path = resolve_path(ctx, "path");
            std::error_code ec;
            exists = std::filesystem::exists(path, ec) && !ec;
        } catch (const std::exception& exc) {
            LOG4CPLUS_DEBUG(fs_logger(), "exists id=" << ctx.id << ": " << exc.what());
        }
        send_result(ctx, nlohmann::json{{"exists", exists}});
    }
};

class InfoAction final : public ActionHandler {
public:
    const char* name() const override { return "info"; }

    void handle(ActionContext& ctx) override {
        send_result(ctx, nlohmann::json{
                             {"home", ctx.context.resolver.home().string()},
                             {"cwd", ctx.context.resolver.cwd().string()},
                         });
    }
};

} // namespace

void register_file_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<ReadAction>());
    registry.add(std::make_unique<WriteAction>());
    registry.add(std::make_unique<SudoWriteAction>());
    registry.add(std::make_unique<StatAction>());
    registry.add(std::make_unique<LsAction>());
    registry.add(std::make_unique<RmAction>());
    registry.add(std::make_unique<RmdirAction>());
    registry.add(std::make_unique<MkdirAction>());
    registry.add(std::make_unique<MvAction>());
    registry.add(std::make_unique<CpAction>());
    registry.add(std::make_unique<RealpathAction>());
    registry.add(std::make_unique<ChmodAction>());
    registry.add(std::make_unique<AppendAction>());
    registry.add(std::make_unique<TruncateAction>());
    registry.add(std::make_unique<PatchAction>());
    registry.add(std::make_unique<ExistsAction>());
    registry.add(std::make_unique<InfoAction>());
}

} // namespace fsagent::actions
