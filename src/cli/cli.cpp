#include "cli.hpp"
#include <guid/config.hpp>
#include <guid/generator.hpp>
#include <guid/log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <ctime>
#include <fstream>
#include <future>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <thread>

namespace guid::cli {

static const char* kGreen = "\033[0;32m";

// ---- Arguments ----

std::string usage() {
    return
        "usage: guid [options]\n"
        "\n"
        "  -p <prefix>     two-character guid prefix\n"
        "  -n <count>      number of guids to generate (default 1)\n"
        "  -sep <text>     separator between guids (default CRLF)\n"
        "  -serial         generate on a single thread\n"
        "  -o <file>       write to file instead of stdout\n"
        "  -slug           print slugs instead of full guids\n"
        "  -scan <guid>    print the fields of a guid\n"
        "  -json           with -scan, print a JSON object\n"
        "  -config <file>  config file layered over ~/.guid/config.toml\n"
        "  -v              debug logging\n"
        "  -h              this help\n";
}

static std::string flag_name(const std::string& arg) {
    size_t dashes = arg.compare(0, 2, "--") == 0 ? 2 : 1;
    return arg.substr(dashes);
}

Result<Options> parse_args(const std::vector<std::string>& args) {
    Options opts;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.empty() || arg[0] != '-') {
            return GuidError(GuidError::InvalidArg,
                "unexpected argument '" + arg + "'", "", "run 'guid -h' for usage");
        }
        std::string name = flag_name(arg);

        auto next = [&](std::string& out) -> Status {
            if (i + 1 >= args.size()) {
                return GuidError(GuidError::InvalidArg,
                    "flag -" + name + " needs a value", "", "run 'guid -h' for usage");
            }
            out = args[++i];
            return ok_status();
        };

        if (name == "p") {
            GUID_TRY(next(opts.prefix));
        } else if (name == "n") {
            std::string v;
            GUID_TRY(next(v));
            try {
                size_t used = 0;
                unsigned long n = std::stoul(v, &used);
                if (used != v.size() || v[0] == '-') throw std::invalid_argument(v);
                if (n > std::numeric_limits<unsigned>::max()) throw std::out_of_range(v);
                opts.count = static_cast<unsigned>(n);
            } catch (const std::exception&) {
                return GuidError(GuidError::InvalidArg,
                    "-n expects a non-negative integer, got '" + v + "'");
            }
        } else if (name == "sep") {
            std::string v;
            GUID_TRY(next(v));
            opts.separator = v;
        } else if (name == "serial") {
            opts.serial = true;
        } else if (name == "o") {
            GUID_TRY(next(opts.output));
        } else if (name == "slug") {
            opts.slug = true;
        } else if (name == "scan") {
            GUID_TRY(next(opts.scan));
        } else if (name == "json") {
            opts.json = true;
        } else if (name == "config") {
            GUID_TRY(next(opts.config_path));
        } else if (name == "v") {
            opts.verbose = true;
        } else if (name == "h" || name == "help") {
            opts.help = true;
        } else {
            return GuidError(GuidError::InvalidArg,
                "unknown flag '" + arg + "'", "", "run 'guid -h' for usage");
        }
    }

    // At least one guid is always produced
    if (opts.count == 0) opts.count = 1;
    return Result<Options>::ok(std::move(opts));
}

// ---- Generation ----

static Result<std::vector<Guid>> generate_serially(unsigned n) {
    std::vector<Guid> out;
    out.reserve(n);
    for (unsigned i = 0; i < n; ++i) {
        auto g = new_guid();
        GUID_TRY(g);
        out.push_back(g.value());
    }
    return Result<std::vector<Guid>>::ok(std::move(out));
}

Result<std::vector<Guid>> generate(unsigned n, bool serial) {
    unsigned workers = std::max(1u, std::thread::hardware_concurrency());
    workers = std::min(workers, n);
    if (serial || workers <= 1) {
        return generate_serially(n);
    }

    log::debug("generating %u guids on %u threads", n, workers);

    std::vector<std::future<Result<std::vector<Guid>>>> jobs;
    for (unsigned w = 0; w < workers; ++w) {
        unsigned share = n / workers + (w < n % workers ? 1 : 0);
        jobs.push_back(std::async(std::launch::async, generate_serially, share));
    }

    std::vector<Guid> out;
    out.reserve(n);
    std::optional<GuidError> failure;
    for (auto& job : jobs) {
        auto part = job.get();
        if (part.is_err()) {
            if (!failure) failure = part.error();
            continue;
        }
        out.insert(out.end(), part.value().begin(), part.value().end());
    }
    if (failure) return *failure;
    return Result<std::vector<Guid>>::ok(std::move(out));
}

std::string render(const std::vector<Guid>& guids, bool slug,
                   const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < guids.size(); ++i) {
        if (i > 0) out += separator;
        out += slug ? guids[i].slug() : guids[i].to_string();
    }
    return out;
}

// ---- Scan ----

std::string format_time(Guid::Clock::time_point t) {
    std::time_t secs = Guid::Clock::to_time_t(t);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &secs);
#else
    localtime_r(&secs, &tm);
#endif
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), "%a %b %e %H:%M:%S %Y", &tm);
    return std::string(buf, n);
}

static Result<Guid> parse_for_scan(const std::string& text) {
    auto g = Guid::parse(text);
    if (g.is_err()) {
        g.error().hint = "'" + text + "' is not a valid guid; only a full guid can be scanned";
    }
    return g;
}

Result<std::string> scan_json(const std::string& text) {
    auto parsed = parse_for_scan(text);
    GUID_TRY(parsed);
    const Guid& g = parsed.value();
    auto [p1, p2] = g.prefix_bytes();

    nlohmann::json out = {
        {"prefix", std::string{static_cast<char>(p1), static_cast<char>(p2)}},
        {"timestamp", format_time(g.time())},
        {"fingerprint", std::to_string(g.fingerprint())},
        {"increment_counter", std::to_string(g.increment_counter())},
        {"decrement_counter", std::to_string(g.decrement_counter())},
        {"random", std::to_string(g.random())},
    };
    return Result<std::string>::ok(out.dump());
}

std::string json_error(const GuidError& err) {
    nlohmann::json out = {
        {"error", err.message},
        {"code", GuidError::code_name(err.code)},
    };
    if (!err.cause.empty()) out["cause"] = err.cause;
    if (!err.hint.empty()) out["hint"] = err.hint;
    return out.dump();
}

Result<std::string> scan_text(const std::string& text) {
    auto parsed = parse_for_scan(text);
    GUID_TRY(parsed);
    const Guid& g = parsed.value();
    auto [p1, p2] = g.prefix_bytes();

    auto line = [](const char* label, const std::string& value) {
        return log::colorize(kGreen, label) + std::string(":") + value + "\n";
    };

    std::string out;
    out += line("PREFIX", "      " + std::string{static_cast<char>(p1), static_cast<char>(p2)});
    out += line("TIMESTAMP", "   " + format_time(g.time()));
    out += line("FINGERPRINT", " " + std::to_string(g.fingerprint()));
    out += line("COUNTER \xe2\x86\x91", "   " + std::to_string(g.increment_counter()));
    out += line("COUNTER \xe2\x86\x93", "   " + std::to_string(g.decrement_counter()));
    out += line("RANDOM", "      " + std::to_string(g.random()));
    return Result<std::string>::ok(out);
}

// ---- Entry point ----

static Result<Config> load_config(const Options& opts) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && std::ifstream(global_path).good()) {
        auto r = Config::load(global_path);
        GUID_TRY(r);
        global = r.value();
        log::debug("loaded %s", global_path.c_str());
    }

    std::optional<Config> local;
    if (!opts.config_path.empty()) {
        auto r = Config::load(opts.config_path);
        GUID_TRY(r);
        local = r.value();
        log::debug("loaded %s", opts.config_path.c_str());
    }
    return Result<Config>::ok(Config::effective(global, local));
}

static Status write_output(const std::string& path, const std::string& data) {
    if (path.empty()) {
        std::cout << data;
        std::cout.flush();
        if (!std::cout) {
            return GuidError(GuidError::IO, "write to stdout failed");
        }
        return ok_status();
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return GuidError(GuidError::IO, "cannot open output file: " + path);
    }
    out << data;
    out.close();
    if (!out) {
        return GuidError(GuidError::IO, "write to " + path + " failed");
    }
    return ok_status();
}

static Status run_with(const Options& opts) {
    auto cfg = load_config(opts);
    GUID_TRY(cfg);
    cfg.value().apply();
    if (opts.verbose) log::set_level(log::Debug);

    if (!opts.scan.empty()) {
        if (opts.json) {
            auto s = scan_json(opts.scan);
            GUID_TRY(s);
            std::cout << s.value();
        } else {
            auto s = scan_text(opts.scan);
            GUID_TRY(s);
            std::cerr << s.value();
        }
        return ok_status();
    }

    if (opts.prefix.size() >= 2) {
        set_global_prefix_bytes(static_cast<uint8_t>(opts.prefix[0]),
                                static_cast<uint8_t>(opts.prefix[1]));
    } else if (!opts.prefix.empty()) {
        log::warn("ignoring prefix '%s': a prefix needs two bytes", opts.prefix.c_str());
    }

    auto guids = generate(opts.count, opts.serial);
    GUID_TRY(guids);

    bool slug = opts.slug.value_or(cfg.value().output.slug);
    std::string sep = opts.separator.value_or(cfg.value().output.separator);
    return write_output(opts.output, render(guids.value(), slug, sep));
}

int run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto opts = parse_args(args);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 2;
    }
    if (opts.value().help) {
        std::cout << usage();
        return 0;
    }

    auto st = run_with(opts.value());
    if (st.is_err()) {
        // -scan -json keeps stderr machine-readable
        if (opts.value().json && !opts.value().scan.empty()) {
            std::cerr << json_error(st.error()) << "\n";
        } else {
            std::cerr << st.error().format() << "\n";
        }
        return 1;
    }
    return 0;
}

} // namespace guid::cli
