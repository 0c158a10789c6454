#include "accrete/cli.hpp"

#include <charconv>
#include <format>

namespace accrete {

namespace {

template <typename T>
std::optional<T> parse_int(std::string_view text) {
    T value{};
    auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (res.ec != std::errc() || res.ptr != text.data() + text.size())
        return std::nullopt;
    return value;
}

bool is_option(std::string_view arg) {
    return arg.size() > 1 && arg.front() == '-';
}

class ArgCursor {
public:
    explicit ArgCursor(const std::vector<std::string_view> &args) : args_(args) {
    }

    bool done() const {
        return pos_ >= args_.size();
    }
    std::string_view next() {
        return args_[pos_++];
    }

    Result<std::string_view> value(std::string_view flag) {
        if (done()) {
            return fail(ErrorKind::Usage, std::format("Missing argument for {}", flag));
        }
        return next();
    }

    // Consumes values up to the next option. `accept` may claim option-looking
    // values such as negative return codes.
    template <typename Accept>
    Result<std::vector<std::string>> values(std::string_view flag, Accept accept) {
        std::vector<std::string> out;
        while (!done() && (!is_option(args_[pos_]) || accept(args_[pos_]))) {
            out.emplace_back(next());
        }
        if (out.empty()) {
            return fail(ErrorKind::Usage, std::format("{} expects at least one argument", flag));
        }
        return out;
    }

    Result<std::vector<std::string>> values(std::string_view flag) {
        return values(flag, [](std::string_view) { return false; });
    }

private:
    const std::vector<std::string_view> &args_;
    size_t pos_ = 0;
};

Result<void> parse_add_job(ArgCursor &cursor, Config &config, AddJobOptions &opts) {
    bool have_command = false;

    while (!cursor.done()) {
        std::string_view arg = cursor.next();
        if (arg == "-i" || arg == "--inputs") {
            auto vals = cursor.values(arg);
            if (!vals)
                return std::unexpected(vals.error());
            opts.inputs = std::move(*vals);
        } else if (arg == "-o" || arg == "--outputs") {
            auto vals = cursor.values(arg);
            if (!vals)
                return std::unexpected(vals.error());
            opts.outputs = std::move(*vals);
        } else if (arg == "-c" || arg == "--command") {
            auto val = cursor.value(arg);
            if (!val)
                return std::unexpected(val.error());
            opts.command = *val;
            have_command = true;
        } else if (arg == "--description") {
            auto val = cursor.value(arg);
            if (!val)
                return std::unexpected(val.error());
            opts.description = std::string(*val);
        } else if (arg == "-p" || arg == "--pipeline-name") {
            auto val = cursor.value(arg);
            if (!val)
                return std::unexpected(val.error());
            opts.pipeline_name = std::string(*val);
        } else if (arg == "-s" || arg == "--ci-stage") {
            auto val = cursor.value(arg);
            if (!val)
                return std::unexpected(val.error());
            opts.ci_stage = parse_ci_stage(*val);
            if (!opts.ci_stage) {
                return fail(ErrorKind::Usage,
                            std::format("Invalid CI stage: {} (must be one of build, test, report)", *val));
            }
        } else if (arg == "--timeout") {
            auto val = cursor.value(arg);
            if (!val)
                return std::unexpected(val.error());
            auto seconds = parse_int<int64_t>(*val);
            if (!seconds || *seconds < 0) {
                return fail(ErrorKind::Usage, std::format("Invalid timeout: {}", *val));
            }
            opts.timeout = *seconds;
        } else if (arg == "--timeout-ok") {
            opts.timeout_ok = true;
        } else if (arg == "--ok-returns") {
            auto vals = cursor.values(arg, [](std::string_view v) { return parse_int<int>(v).has_value(); });
            if (!vals)
                return std::unexpected(vals.error());
            std::vector<int> codes;
            for (const auto &v : *vals) {
                auto code = parse_int<int>(v);
                if (!code) {
                    return fail(ErrorKind::Usage, std::format("Invalid return code: {}", v));
                }
                codes.push_back(*code);
            }
            opts.ok_returns = std::move(codes);
        } else if (arg == "-v" || arg == "--verbose") {
            if (config.verbosity == Verbosity::Quiet)
                config.verbosity = Verbosity::Verbose;
        } else if (arg == "-w" || arg == "--very-verbose") {
            config.verbosity = Verbosity::VeryVerbose;
        } else {
            return fail(ErrorKind::Usage, std::format("Unknown add-job argument: {}", arg));
        }
    }

    if (opts.inputs.empty())
        return fail(ErrorKind::Usage, "add-job requires -i/--inputs");
    if (opts.outputs.empty())
        return fail(ErrorKind::Usage, "add-job requires -o/--outputs");
    if (!have_command)
        return fail(ErrorKind::Usage, "add-job requires -c/--command");
    return {};
}

Result<void> parse_run_build(ArgCursor &cursor, Config &config) {
    while (!cursor.done()) {
        std::string_view arg = cursor.next();
        if (arg == "-v" || arg == "--verbose") {
            config.verbosity = Verbosity::Verbose;
        } else {
            return fail(ErrorKind::Usage, std::format("Unknown run-build argument: {}", arg));
        }
    }
    return {};
}

} // namespace

Result<Invocation> parse_args(const std::vector<std::string_view> &args) {
    Invocation inv{.config = {}, .action = ShowHelp{}};
    ArgCursor cursor(args);

    while (!cursor.done()) {
        std::string_view arg = cursor.next();
        if (arg == "-h" || arg == "--help") {
            inv.action = ShowHelp{};
            return inv;
        } else if (arg == "--version") {
            inv.action = ShowVersion{};
            return inv;
        } else if (arg == "-C") {
            auto val = cursor.value(arg);
            if (!val)
                return std::unexpected(val.error());
            inv.config.work_dir = *val;
        } else if (arg == "--cache") {
            auto val = cursor.value(arg);
            if (!val)
                return std::unexpected(val.error());
            inv.config.cache_path = *val;
        } else if (arg == "-f") {
            auto val = cursor.value(arg);
            if (!val)
                return std::unexpected(val.error());
            inv.config.build_file = *val;
        } else if (arg == "add-job") {
            AddJobOptions opts;
            if (auto res = parse_add_job(cursor, inv.config, opts); !res)
                return std::unexpected(res.error());
            inv.action = std::move(opts);
            return inv;
        } else if (arg == "run-build") {
            if (auto res = parse_run_build(cursor, inv.config); !res)
                return std::unexpected(res.error());
            inv.action = RunBuild{};
            return inv;
        } else {
            return fail(ErrorKind::Usage, std::format("Unknown argument: {}", arg));
        }
    }
    return fail(ErrorKind::Usage, "Missing subcommand (add-job or run-build)");
}

JobRecord to_record(const AddJobOptions &options) {
    return JobRecord{
        .inputs = options.inputs,
        .outputs = options.outputs,
        .command = options.command,
        .description = options.description,
        .pipeline_name = options.pipeline_name,
        .ci_stage = options.ci_stage,
        .timeout = options.timeout,
        .timeout_ok = options.timeout_ok,
        .ok_returns = options.ok_returns,
    };
}

std::string usage() {
    return "Usage: accrete [global options] <add-job|run-build> [options]\n"
           "Incrementally build up a dependency graph of jobs to execute.\n"
           "\n"
           "Global options:\n"
           "  -h, --help             Show this help message\n"
           "  --version              Show version\n"
           "  -C <dir>               Change working directory before doing anything\n"
           "  --cache <file>         Job registry (default: /tmp/accrete_cache.json)\n"
           "  -f <file>              Build file written by run-build (default: accrete.ninja)\n"
           "\n"
           "add-job:\n"
           "  -i, --inputs F...      Files this job depends on (required)\n"
           "  -c, --command C        Command to run once dependencies are satisfied (required)\n"
           "  -o, --outputs F...     Files this job generates (required)\n"
           "  -p, --pipeline-name P  Pipeline this job is a member of\n"
           "  -s, --ci-stage S       CI stage: build, test or report\n"
           "  --timeout N            Max number of seconds this job should run for\n"
           "  --timeout-ok           Treat a timeout as success\n"
           "  --ok-returns RC...     Return codes that count as success\n"
           "  --description DESC     Text printed while the job runs\n"
           "  -v, --verbose          Verbose output\n"
           "  -w, --very-verbose     Very verbose output\n"
           "\n"
           "run-build:\n"
           "  -v, --verbose          Verbose output\n";
}

} // namespace accrete
