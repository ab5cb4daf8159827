#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <ssh/remote_path.hpp>
#include <iostream>
#include <fmt/format.h>

static ProgressCallback progress_printer() {
    if (!theme::interactive()) return nullptr;
    return [](uint64_t done, uint64_t total) {
        if (total > 0) {
            std::cout << theme::progress(fmt::format("{} / {} ({}%)", format_bytes(done),
                                         format_bytes(total), done * 100 / total))
                      << std::flush;
        } else {
            std::cout << theme::progress(format_bytes(done)) << std::flush;
        }
    };
}

static void finish_progress() {
    if (theme::interactive()) std::cout << "\r\033[K" << std::flush;
}

static void report_transfer(BaseCLI& cli, const std::string& what, const Result<uint64_t>& r) {
    if (r.kind == ErrorKind::PartialTransfer) {
        cli.report(what, fmt::format("{} ({} transferred)", r.error, format_bytes(r.value)));
    } else {
        cli.report(what, r.error);
    }
    if (r.kind == ErrorKind::Connection) cli.disconnect();
}

static void do_ls(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    std::string path = args.empty() ? "/" : args[0];

    auto* sftp = cli.transfers();
    if (!sftp) return;
    auto listing = sftp->list_directory(path);
    if (listing.is_err()) {
        cli.report("ls", listing.error);
        return;
    }

    const auto& l = listing.value;
    for (const auto& f : l.entries) {
        std::string name = f.is_dir ? theme::teal(f.name + "/") : f.name;
        std::cout << fmt::format("{}  {:>5} {:>5}  {:>8}  {}  ", f.mode, f.uid, f.gid,
                                 format_bytes(f.size), format_iso(f.mtime))
                  << name << "\n";
    }
    std::cout << theme::dim(fmt::format("{} file(s), {} dir(s), {} total", l.file_count,
                                        l.dir_count, format_bytes(l.total_size)))
              << "\n";
}

static void do_stat(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (args.size() != 1) {
        cli.report("Usage: stat <remote-path>", "", 2);
        return;
    }
    auto* sftp = cli.transfers();
    if (!sftp) return;
    auto info = sftp->stat(args[0]);
    if (info.is_err()) {
        cli.report("stat", info.error);
        return;
    }

    const auto& f = info.value;
    std::cout << theme::kv("Path", f.path);
    std::cout << theme::kv("Type", f.is_dir ? "directory" : "file");
    std::cout << theme::kv("Size", fmt::format("{} ({} bytes)", format_bytes(f.size), f.size));
    std::cout << theme::kv("Mode", fmt::format("{} ({})", f.mode, f.permissions));
    std::cout << theme::kv("Owner", fmt::format("{}:{}", f.uid, f.gid));
    std::cout << theme::kv("Modified", format_iso(f.mtime));
}

static void do_get(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (args.empty() || args.size() > 2) {
        cli.report("Usage: get <remote-path> [local-path]", "", 2);
        return;
    }
    std::string local = args.size() == 2 ? args[1] : base_name(args[0]);

    auto* sftp = cli.transfers();
    if (!sftp) return;
    auto r = sftp->download(args[0], local, progress_printer());
    finish_progress();
    if (r.is_err()) {
        report_transfer(cli, "get", r);
        return;
    }
    std::cout << theme::ok(fmt::format("{} -> {} ({})", args[0], local, format_bytes(r.value)));
}

static void do_put(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    bool overwrite = false;
    std::vector<std::string> paths;
    for (const auto& a : args) {
        if (a == "-f" || a == "--force") overwrite = true;
        else paths.push_back(a);
    }
    if (paths.size() != 2) {
        cli.report("Usage: put [-f] <local-path> <remote-path>", "", 2);
        return;
    }

    auto* sftp = cli.transfers();
    if (!sftp) return;
    auto r = sftp->upload(paths[0], paths[1], overwrite, progress_printer());
    finish_progress();
    if (r.is_err()) {
        report_transfer(cli, "put", r);
        if (!overwrite && r.kind == ErrorKind::Resource) {
            std::cerr << theme::step("Use 'put -f' to replace an existing file.");
        }
        return;
    }
    std::cout << theme::ok(fmt::format("{} -> {} ({})", paths[0], paths[1], format_bytes(r.value)));
}

static void do_rm(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (args.empty()) {
        cli.report("Usage: rm <remote-path>...", "", 2);
        return;
    }
    auto* sftp = cli.transfers();
    if (!sftp) return;
    for (const auto& path : args) {
        auto r = sftp->remove(path);
        if (r.is_err()) cli.report("rm", r.error);
    }
}

static void do_mv(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (args.size() != 2) {
        cli.report("Usage: mv <from> <to>", "", 2);
        return;
    }
    auto* sftp = cli.transfers();
    if (!sftp) return;
    auto r = sftp->rename(args[0], args[1]);
    if (r.is_err()) cli.report("mv", r.error);
}

static void do_mkdir(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (args.empty() || args.size() > 2) {
        cli.report("Usage: mkdir <remote-path> [mode]", "", 2);
        return;
    }
    std::string mode = args.size() == 2 ? args[1] : "";
    if (!mode.empty()) {
        // Reject a bad mode before connecting.
        auto parsed = parse_mode(mode);
        if (parsed.is_err()) {
            cli.report("mkdir", parsed.error, 2);
            return;
        }
    }
    auto* sftp = cli.transfers();
    if (!sftp) return;
    auto r = sftp->create_directory(args[0], mode);
    if (r.is_err()) cli.report("mkdir", r.error);
}

void register_file_commands(BaseCLI& cli) {
    cli.add_command("ls", do_ls, "List a remote directory");
    cli.add_command("stat", do_stat, "Show remote file details");
    cli.add_command("get", do_get, "Download a remote file");
    cli.add_command("put", do_put, "Upload a local file (-f to overwrite)");
    cli.add_command("rm", do_rm, "Remove remote files or empty directories");
    cli.add_command("mv", do_mv, "Rename a remote path");
    cli.add_command("mkdir", do_mkdir, "Create a remote directory");
}
