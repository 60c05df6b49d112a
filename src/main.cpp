#include "core/log.hpp"
#include "core/types.hpp"
#include "lua/config_loader.hpp"
#include "lua/lua_state.hpp"
#include "vfs/mount_table.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace {

constexpr int EXIT_OP_ERROR = 1;
constexpr int EXIT_USAGE = 2;

struct CliConfig {
    tvfs::fs::path config_file = "trievfs.lua";
    tvfs::fs::path log_file;
    bool verbose = false;
    std::vector<std::string> command; ///< Command name followed by its arguments
};

} // namespace

static void print_usage() {
    std::cout << "TrieVFS v0.1.0\n"
              << "Trie-indexed virtual filesystem over bundled content\n\n"
              << "Usage:\n"
              << "  trievfs [options] <command> [args...]\n\n"
              << "Options:\n"
              << "  --config <path>    Lua config script (default: trievfs.lua)\n"
              << "  --log <path>       Also write the log to a file\n"
              << "  --verbose          Debug logging\n"
              << "  --help             Show this help message\n\n"
              << "Commands:\n"
              << "  ls [-d] <path>...              List entries\n"
              << "  stat <path> [--data]           Stat a path, optionally with content\n"
              << "  grep <pattern> <path>...       Leaves whose content matches\n"
              << "  cp <src>... <dst>              Copy bundled sources into the VFS\n"
              << "  rm <path>                      Remove an entry\n"
              << "  mkdir <path>                   Create a directory entry\n"
              << "  rmdir <path>                   Remove a directory entry\n"
              << "  write <path> <text>            Write a file entry\n"
              << "  slice <path> <offset> <len>    Print a byte range of a file\n"
              << "  mounts                         List mount points\n";
}

static bool parse_args(int argc, char* argv[], CliConfig& config) {
    int i = 1;
    for (; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config.config_file = argv[++i];
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        } else if (argv[i][0] == '-' && argv[i][1] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return false;
        } else {
            break;
        }
    }

    for (; i < argc; i++) {
        config.command.emplace_back(argv[i]);
    }
    return !config.command.empty();
}

static bool parse_u64(const std::string& s, tvfs::u64& out) {
    char* end = nullptr;
    unsigned long long val = std::strtoull(s.c_str(), &end, 10);
    if (s.empty() || s[0] == '-' || end == s.c_str() || *end != '\0') {
        return false;
    }
    out = static_cast<tvfs::u64>(val);
    return true;
}

static int report(const tvfs::Result<void>& result) {
    if (!result) {
        spdlog::error("{}", result.error().message);
        return EXIT_OP_ERROR;
    }
    return 0;
}

static int run_command(tvfs::vfs::MountTable& mounts,
                       const std::vector<std::string>& cmd) {
    const auto& name = cmd[0];
    std::vector<std::string> args(cmd.begin() + 1, cmd.end());

    if (name == "ls") {
        tvfs::vfs::LsOptions opts;
        std::vector<std::string> paths;
        for (const auto& a : args) {
            if (a == "-d") {
                opts.directory_only = true;
            } else {
                paths.push_back(a);
            }
        }
        if (paths.empty()) paths.push_back("/");

        for (const auto& s : mounts.ls(opts, paths)) {
            std::cout << s.dirent.permissions << "  " << s.name_for_display
                      << "  " << s.path << "\n";
        }
        return 0;
    }

    if (name == "stat" && !args.empty()) {
        bool with_data = args.size() > 1 && args[1] == "--data";
        auto result = mounts.fstat(args[0], with_data, false);
        if (!result) {
            spdlog::error("{}", result.error().message);
            return EXIT_OP_ERROR;
        }
        const auto& st = *result.value();
        std::cout << "path: " << st.fullpath << "\n"
                  << "type: " << (st.is_directory ? "directory" : "file") << "\n"
                  << "viewer: " << st.viewer << "\n";
        if (st.data) {
            std::cout << "\n" << *st.data;
        }
        return 0;
    }

    if (name == "grep" && args.size() >= 2) {
        std::vector<std::string> paths(args.begin() + 1, args.end());
        auto result = mounts.grepdir(paths, args[0]);
        if (!result) {
            spdlog::error("{}", result.error().message);
            return EXIT_OP_ERROR;
        }
        for (const auto& m : result.value()) {
            std::cout << m.path << "\n";
        }
        return 0;
    }

    if (name == "cp" && args.size() >= 2) {
        std::vector<std::string> srcs(args.begin(), args.end() - 1);
        return report(mounts.cp(srcs, args.back()));
    }

    if (name == "rm" && args.size() == 1) return report(mounts.rm(args[0]));
    if (name == "mkdir" && args.size() == 1) return report(mounts.mkdir(args[0]));
    if (name == "rmdir" && args.size() == 1) return report(mounts.rmdir(args[0]));

    if (name == "write" && args.size() == 2) {
        return report(mounts.fwrite(args[0], args[1]));
    }

    if (name == "slice" && args.size() == 3) {
        tvfs::u64 offset = 0;
        tvfs::u64 length = 0;
        if (!parse_u64(args[1], offset) || !parse_u64(args[2], length)) {
            spdlog::error("Invalid slice range: {} {}", args[1], args[2]);
            return EXIT_USAGE;
        }
        auto result = mounts.fslice(args[0], offset, length);
        if (!result) {
            spdlog::error("{}", result.error().message);
            return EXIT_OP_ERROR;
        }
        std::cout << result.value();
        return 0;
    }

    if (name == "mounts") {
        for (const auto* m : mounts.mounts()) {
            std::cout << m->mount_path();
            for (const auto& tag : m->tags()) {
                std::cout << " [" << tag << "]";
            }
            std::cout << "  (" << m->entry_count() << " entries)\n";
        }
        return 0;
    }

    spdlog::error("Unknown command or wrong arguments: {}", name);
    return EXIT_USAGE;
}

int main(int argc, char* argv[]) {
    CliConfig config;
    if (!parse_args(argc, argv, config)) {
        print_usage();
        return EXIT_USAGE;
    }

    tvfs::log::init(config.log_file, config.verbose ? spdlog::level::debug
                                                    : spdlog::level::info);

    tvfs::vfs::MountTable mounts;
    tvfs::lua::LuaState state;
    tvfs::lua::ConfigLoader loader;

    auto loaded = loader.execute_config(state, config.config_file, mounts);
    if (!loaded) {
        spdlog::error("{}", loaded.error().message);
        tvfs::log::shutdown();
        return EXIT_OP_ERROR;
    }

    auto seeded = loader.run_seed(state, mounts);
    if (!seeded) {
        spdlog::error("{}", seeded.error().message);
        tvfs::log::shutdown();
        return EXIT_OP_ERROR;
    }

    int rc = run_command(mounts, config.command);
    tvfs::log::shutdown();
    return rc;
}
