/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <filesystem>
#include <iostream>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <seastar/core/app-template.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/util/log.hh>

#include "store/client.hh"
#include "transfer/config.hh"
#include "transfer/downloader.hh"
#include "transfer/session_registry.hh"
#include "transfer/uploader.hh"
#include "utils/clocks.hh"

using namespace seastar;
namespace bpo = boost::program_options;
namespace fs = std::filesystem;

static logger blog("blobshare");

static std::string format_size(double bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    unsigned unit = 0;
    while (bytes >= 1024 && unit < std::size(units) - 1) {
        bytes /= 1024;
        ++unit;
    }
    return fmt::format("{:.2f} {}", bytes, units[unit]);
}

// Prints session events until the channel ends.
static future<> print_progress(lw_shared_ptr<transfer::transfer_session> session) {
    bool warned = false;
    while (auto ev = co_await session->events().next()) {
        if (ev->warning && !warned) {
            fmt::print(std::cerr, "{}: {}: {}\n", session->file_name(), transfer::describe(ev->warning->kind), ev->warning->message);
            warned = true;
        }
        if (ev->unit_state == transfer::unit_status::retrying) {
            fmt::print(std::cerr, "{}: chunk {} retry {}\n", session->file_name(), *ev->unit_index + 1, ev->unit_retry_count);
        }
        fmt::print(std::cerr, "\r{}: {} {:5.1f}% {}/s eta {:.0f}s   ", session->file_name(), ev->status, ev->fraction() * 100,
                format_size(ev->speed_bytes_per_sec), ev->eta_seconds);
        if (ev->status == transfer::session_status::completed || ev->status == transfer::session_status::error
                || ev->status == transfer::session_status::paused) {
            fmt::print(std::cerr, "\n");
            break;
        }
    }
}

static void print_record(const transfer::file_record& r, std::chrono::seconds retention) {
    fmt::print("id:          {}\n", r.id);
    fmt::print("name:        {}\n", r.original_name);
    fmt::print("size:        {} ({} stored{})\n", format_size(r.original_size), format_size(r.size),
            r.compressed ? fmt::format(", gzip {:.1f}% smaller", r.compression_ratio) : "");
    fmt::print("uploaded at: {}\n", utils::timepoint_to_iso8601ts(r.uploaded_at));
    fmt::print("expires at:  {}\n", utils::timepoint_to_iso8601ts(r.expires_at(retention)));
    fmt::print("location:    {}\n", r.blob_locator);
}

static int report(const transfer::transfer_failure& f) {
    fmt::print(std::cerr, "{}: {}\n", transfer::describe(f.kind), f.message);
    return 1;
}

static future<int> do_upload(store::remote_store& remote, transfer::session_registry& sessions, transfer::transfer_config_ptr cfg,
        const std::vector<std::string>& files) {
    transfer::uploader up(remote, sessions, cfg);
    int rc = 0;
    for (const auto& f : files) {
        transfer::upload_source src;
        try {
            src = co_await transfer::read_upload_source(fs::path(f));
        } catch (...) {
            fmt::print(std::cerr, "Cannot read {}: {}\n", f, std::current_exception());
            rc = 1;
            continue;
        }
        auto session = up.prepare(src);
        auto printer = print_progress(session);
        auto res = co_await up.upload(session, std::move(src));
        co_await std::move(printer);
        if (!res) {
            rc = report(res.failure());
            continue;
        }
        fmt::print("{} -> {}\n", f, res.value().id);
    }
    co_return rc;
}

static future<int> do_download(store::remote_store& remote, transfer::session_registry& sessions, transfer::transfer_config_ptr cfg,
        const std::string& id, std::optional<std::string> output, bool background, bool restart) {
    auto rec = co_await transfer::fetch_record(remote, id, cfg->retention);
    if (!rec) {
        co_return report(rec.failure());
    }
    transfer::file_sink sink(output ? fs::path(*output) : fs::path(rec.value().original_name));
    uint64_t resume_offset = 0;
    if (!restart && co_await sink.adopt_partial()) {
        if (sink.size() <= rec.value().size) {
            resume_offset = sink.size();
            blog.info("Resuming {} from {} of {} bytes", sink.path().native(), resume_offset, rec.value().size);
        } else {
            blog.warn("{}.part is larger than {}, starting over", sink.path().native(), id);
        }
    }
    transfer::downloader down(remote, sessions, cfg, rec.value(), sink);
    auto printer = print_progress(down.session());
    auto res = co_await down.download(transfer::download_options{.resume_offset = resume_offset, .foreground = !background});
    co_await std::move(printer);
    co_await sink.close();
    if (!res) {
        co_return report(res.failure());
    }
    fmt::print("{} -> {}\n", id, sink.path().native());
    co_return 0;
}

static future<int> run_command(const bpo::variables_map& vm, store::client& remote, transfer::session_registry& sessions,
        transfer::transfer_config_ptr cfg) {
    auto command = vm["command"].as<std::string>();
    auto args = vm["args"].as<std::vector<std::string>>();

    if (command == "upload" && !args.empty()) {
        co_return co_await do_upload(remote, sessions, cfg, args);
    }
    if (args.size() != 1) {
        fmt::print(std::cerr, "Usage: blobshare upload FILE... | info ID | download ID [-o PATH] [--restart] | delete ID\n");
        co_return 2;
    }
    const auto id = args.front();
    if (command == "info") {
        auto rec = co_await transfer::fetch_record(remote, id, cfg->retention);
        if (!rec) {
            co_return report(rec.failure());
        }
        print_record(rec.value(), cfg->retention);
        co_return 0;
    }
    if (command == "download") {
        std::optional<std::string> output;
        if (vm.contains("output")) {
            output = vm["output"].as<std::string>();
        }
        co_return co_await do_download(remote, sessions, cfg, id, std::move(output), vm.contains("background"), vm.contains("restart"));
    }
    if (command == "delete") {
        std::exception_ptr ex;
        try {
            co_await remote.delete_file(id);
        } catch (...) {
            ex = std::current_exception();
        }
        if (ex) {
            co_return report(transfer::transfer_failure::from(transfer::classify(ex)));
        }
        blog.info("Deleted {}", id);
        co_return 0;
    }
    fmt::print(std::cerr, "Unknown command {}\n", command);
    co_return 2;
}

int main(int argc, char** argv) {
    app_template app;
    app.add_options()
        ("output,o", bpo::value<std::string>(), "where to write a downloaded file")
        ("background", "sample download progress less often")
        ("restart", "discard a partial download instead of resuming it")
    ;
    store::add_options(app.add_options());
    transfer::add_options(app.add_options());
    app.add_positional_options({
        {"command", bpo::value<std::string>()->required(), "upload, info, download or delete", 1},
        {"args", bpo::value<std::vector<std::string>>()->default_value({}, ""), "files to upload or a file id", -1},
    });

    return app.run(argc, argv, [&app] () -> future<int> {
        const auto& vm = app.configuration();
        auto cfg = make_lw_shared<transfer::transfer_config>(transfer::from_options(vm));
        auto ecfg = make_lw_shared<store::endpoint_config>();
        auto host = store::from_options(vm, *ecfg);

        auto remote = store::client::make(std::move(host), ecfg);
        transfer::session_registry sessions(cfg->session_grace_period, cfg->progress_channel_capacity);
        std::exception_ptr ex;
        int rc = 1;
        try {
            rc = co_await run_command(vm, *remote, sessions, cfg);
        } catch (...) {
            ex = std::current_exception();
        }
        co_await sessions.close();
        co_await remote->close();
        if (ex) {
            blog.error("{}", ex);
        }
        co_return rc;
    });
}
