#include "client/Client.hpp"
#include "client/Object.hpp"
#include "config/ConfigRegistry.hpp"
#include "http/errors.hpp"
#include "logging/LogRegistry.hpp"
#include "util/cmdLineHelpers.hpp"
#include "util/httpHelpers.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace ais;
using namespace ais::client;
using namespace ais::config;
using namespace ais::logging;

namespace {

constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct CliOptions {
    std::optional<std::filesystem::path> configPath;
    std::optional<std::string> endpoint;
    std::string provider = PROVIDER_AIS;
    std::string ns;
    std::string archpath;
    size_t chunkSize = DEFAULT_CHUNK_SIZE;
    bool verbose = false;
    bool help = false;
    std::vector<std::string> positional;
};

void printUsage(std::ostream& out) {
    const auto width = static_cast<size_t>(util::term_width());
    out << "usage: aisobj [--config FILE] [--endpoint URL] [--provider P] [--namespace NS] [--verbose]\n"
           "              <command> [args...]\n\n"
           "commands:\n"
           "  head   BUCKET/OBJECT\n"
           "  get    BUCKET/OBJECT [OUT|-] [--archpath PATH] [--chunk-size N]\n"
           "  put    FILE BUCKET/OBJECT\n"
           "  rm     BUCKET/OBJECT\n"
           "  config\n\n"
        << util::wrap_text("The endpoint defaults to " + std::string(DEFAULT_ENDPOINT) + " and may be set with "
                           + ENDPOINT_ENV_VAR + ", the config file, or --endpoint (highest precedence). "
                           "head and put print the response headers as JSON; get writes to stdout unless OUT is given.",
                           width, 2)
        << "\n";
}

CliOptions parseArgs(const int argc, char** argv) {
    CliOptions opts;

    const auto valueOf = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw UsageError(fmt::format("{} requires a value", flag));
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") opts.help = true;
        else if (arg == "-v" || arg == "--verbose") opts.verbose = true;
        else if (arg == "--config") opts.configPath = valueOf(i, arg);
        else if (arg == "--endpoint") opts.endpoint = valueOf(i, arg);
        else if (arg == "--provider") opts.provider = valueOf(i, arg);
        else if (arg == "--namespace") opts.ns = valueOf(i, arg);
        else if (arg == "--archpath") opts.archpath = valueOf(i, arg);
        else if (arg == "--chunk-size") {
            try {
                opts.chunkSize = util::parse_size_arg(valueOf(i, arg), MAX_CHUNK_SIZE);
            } catch (const std::invalid_argument& e) {
                throw UsageError(fmt::format("--chunk-size: {}", e.what()));
            }
        }
        else if (arg.size() > 1 && arg.front() == '-' && arg != "-")
            throw UsageError("unknown option: " + arg);
        else opts.positional.push_back(arg);
    }

    return opts;
}

void expectArgs(const CliOptions& opts, const size_t min, const size_t max) {
    const size_t n = opts.positional.size() - 1;
    if (n < min || n > max)
        throw UsageError(fmt::format("'{}' takes {} argument(s), got {}", opts.positional[0],
                                     min == max ? std::to_string(min) : fmt::format("{}-{}", min, max), n));
}

std::pair<std::string, std::string> objectArg(const std::string& uri) {
    try {
        return util::parseObjectUri(uri);
    } catch (const std::invalid_argument& e) {
        throw UsageError(e.what());
    }
}

nlohmann::json headersToJson(const http::Headers& headers) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [k, v] : headers) j[k] = v;
    return j;
}

int runHead(const Client& client, const CliOptions& opts) {
    expectArgs(opts, 1, 1);
    const auto [bck, obj] = objectArg(opts.positional[1]);

    const auto bucket = client.bucket(bck, opts.provider, opts.ns);
    std::cout << headersToJson(bucket.object(obj).headObject()).dump(2) << std::endl;
    return 0;
}

int runGet(const Client& client, const CliOptions& opts) {
    expectArgs(opts, 1, 2);
    const auto [bck, obj] = objectArg(opts.positional[1]);
    const std::string out = opts.positional.size() > 2 ? opts.positional[2] : "-";

    const auto bucket = client.bucket(bck, opts.provider, opts.ns);
    auto stream = bucket.object(obj).getObject(opts.archpath, opts.chunkSize);

    uintmax_t written = 0;
    if (out == "-") {
        written = stream.copyTo(std::cout);
        std::cout.flush();
    } else {
        written = stream.saveTo(out);
    }

    LogRegistry::cli()->info("GET {}/{} => {} ({})", bck, obj, out == "-" ? "stdout" : out, util::human_bytes(written));
    if (stream.contentLength() && written != stream.contentLength())
        LogRegistry::cli()->warn("GET {}/{}: received {} bytes, content-length was {}",
                                 bck, obj, written, stream.contentLength());
    return 0;
}

int runPut(const Client& client, const CliOptions& opts) {
    expectArgs(opts, 2, 2);
    const std::filesystem::path file = opts.positional[1];
    const auto [bck, obj] = objectArg(opts.positional[2]);

    const auto bucket = client.bucket(bck, opts.provider, opts.ns);
    const auto headers = bucket.object(obj).putObject(file);

    LogRegistry::cli()->info("PUT {} => {}/{}", file.string(), bck, obj);
    std::cout << headersToJson(headers).dump(2) << std::endl;
    return 0;
}

int runRm(const Client& client, const CliOptions& opts) {
    expectArgs(opts, 1, 1);
    const auto [bck, obj] = objectArg(opts.positional[1]);

    const auto bucket = client.bucket(bck, opts.provider, opts.ns);
    bucket.object(obj).deleteObject();

    LogRegistry::cli()->info("deleted {}/{}", bck, obj);
    return 0;
}

}

int main(int argc, char** argv) {
    CliOptions opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(std::cerr);
        return EXIT_USAGE;
    }

    if (opts.help) {
        printUsage(std::cout);
        return 0;
    }
    if (opts.positional.empty()) {
        printUsage(std::cerr);
        return EXIT_USAGE;
    }

    try {
        Config cfg = opts.configPath ? loadConfig(*opts.configPath) : Config{};
        applyEnvOverrides(cfg);
        if (opts.endpoint) cfg.client.endpoint = *opts.endpoint;

        ConfigRegistry::init(cfg);
        LogRegistry::init(cfg.logging);
        if (opts.verbose) LogRegistry::setConsoleLevel(spdlog::level::debug);

        const std::string& cmd = opts.positional[0];
        if (cmd == "config") {
            expectArgs(opts, 0, 0);
            std::cout << nlohmann::json(ConfigRegistry::get()).dump(2) << std::endl;
            return 0;
        }

        const Client client(ConfigRegistry::get().client);
        LogRegistry::aisobj()->debug("[aisobj] endpoint {}", ConfigRegistry::get().client.endpoint);

        if (cmd == "head") return runHead(client, opts);
        if (cmd == "get") return runGet(client, opts);
        if (cmd == "put") return runPut(client, opts);
        if (cmd == "rm") return runRm(client, opts);

        throw UsageError("unknown command: " + cmd);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(std::cerr);
        return EXIT_USAGE;
    } catch (const http::HttpError& e) {
        LogRegistry::cli()->debug("request failed with status {}", e.status());
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILED;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILED;
    }
}
