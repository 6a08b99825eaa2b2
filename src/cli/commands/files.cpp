#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>
#include <fmt/format.h>

static std::vector<std::string> split_args(const std::string& arg) {
    std::istringstream iss(arg);
    std::vector<std::string> out;
    std::string word;
    while (iss >> word) out.push_back(word);
    return out;
}

static void do_ls(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    std::string dir = arg.empty() ? "." : arg;

    auto listed = cli.conn->list_directory(dir, cli.cancel);
    if (listed.is_err()) {
        std::cout << theme::fail(listed.error);
        return;
    }

    for (const auto& entry : listed.value) {
        if (entry.name == "." || entry.name == "..") continue;
        if (entry.is_directory) {
            std::cout << theme::color::BLUE << "    " << entry.name << "/"
                      << theme::color::RESET << "\n";
        } else {
            std::cout << fmt::format("    {:<32} {:>10}\n", entry.name, entry.size);
        }
    }
}

static void do_put(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (args.size() != 2) {
        std::cout << "Usage: :put <local> <remote>\n";
        return;
    }

    std::ifstream in(args[0], std::ios::binary);
    if (!in) {
        std::cout << theme::fail("Cannot open " + args[0]);
        return;
    }

    auto uploaded = cli.conn->upload(in, args[1], true, nullptr, cli.cancel);
    if (uploaded.is_err()) {
        std::cout << theme::fail(uploaded.error);
        return;
    }
    std::cout << theme::ok(args[0] + " -> " + args[1]);
}

static void do_get(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (args.size() != 2) {
        std::cout << "Usage: :get <remote> <local>\n";
        return;
    }

    std::ofstream out(args[1], std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cout << theme::fail("Cannot write " + args[1]);
        return;
    }

    auto downloaded = cli.conn->download(args[0], out, cli.cancel);
    if (downloaded.is_err()) {
        std::cout << theme::fail(downloaded.error);
        return;
    }
    std::cout << theme::ok(args[0] + " -> " + args[1]);
}

static void do_mget(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (args.size() != 2) {
        std::cout << "Usage: :mget <glob> <dir>\n";
        return;
    }

    auto downloaded = cli.conn->download_files_by_glob(args[0], args[1], true, cli.cancel);
    if (downloaded.is_err()) {
        std::cout << theme::fail(downloaded.error);
        return;
    }
    std::cout << theme::ok(fmt::format("{} file(s) -> {}", downloaded.value, args[1]));
}

void register_file_commands(BaseCLI& cli) {
    cli.add_command("ls", do_ls, "List a remote directory");
    cli.add_command("put", do_put, "Upload a local file");
    cli.add_command("get", do_get, "Download a remote file");
    cli.add_command("mget", do_mget, "Download every file matching a glob");
}
