#include "python/executor.h"
#include "python/result_renderer.h"
#include "python/serialization.h"
#include "utils/config.h"
#include "utils/logger.h"

#include <getopt.h>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

namespace snipguard {

struct RunnerOptions {
    std::string configPath;
    std::string profile;
    std::string contextPath;
    std::string logLevel;
    std::string snippetPath;
    int64_t timeoutSeconds = 0;
    int64_t memoryMb = 0;
    bool analyzeOnly = false;
    bool showHelp = false;
    bool showVersion = false;
};

enum ExitCode {
    EXIT_OK = 0,
    EXIT_SNIPPET_FAILED = 1,
    EXIT_USAGE = 2
};

void printHelp(const char* progName) {
    std::cout << "snipguard - guarded execution of Python analysis snippets\n\n";
    std::cout << "Usage: " << progName << " [options] [snippet.py]\n";
    std::cout << "Reads the snippet from stdin when no file is given.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help            Show this help\n";
    std::cout << "  -v, --version         Show version\n";
    std::cout << "  -c, --config FILE     Load settings from a key=value file\n";
    std::cout << "  -p, --profile NAME    Sandbox profile (permissive/hardened)\n";
    std::cout << "  -t, --timeout SEC     Time limit in seconds (default: 120)\n";
    std::cout << "  -m, --memory MB       Memory limit in MB (default: 2048)\n";
    std::cout << "  -x, --context FILE    JSON object bound as snippet locals\n";
    std::cout << "  -a, --analyze         Print the static policy report only\n";
    std::cout << "  -l, --loglevel LEVEL  Log level (trace/debug/info/warn/error/off)\n";
}

void printVersion() {
    std::cout << "snipguard v0.1.0\n";
    std::cout << "Builtin table version: " << python::kBuiltinTableVersion << "\n";
}

bool parsePositive(const char* text, int64_t& out) {
    char* end = nullptr;
    long long v = std::strtoll(text, &end, 10);
    if (!end || *end != '\0' || v <= 0) return false;
    out = v;
    return true;
}

bool parseArgs(int argc, char* argv[], RunnerOptions& opts) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 'c'},
        {"profile", required_argument, nullptr, 'p'},
        {"timeout", required_argument, nullptr, 't'},
        {"memory", required_argument, nullptr, 'm'},
        {"context", required_argument, nullptr, 'x'},
        {"analyze", no_argument, nullptr, 'a'},
        {"loglevel", required_argument, nullptr, 'l'},
        {nullptr, 0, nullptr, 0}
    };
    
    int opt;
    int optionIndex = 0;
    while ((opt = getopt_long(argc, argv, "hvc:p:t:m:x:al:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                opts.showHelp = true;
                return true;
            case 'v':
                opts.showVersion = true;
                return true;
            case 'c':
                opts.configPath = optarg;
                break;
            case 'p':
                opts.profile = optarg;
                break;
            case 't':
                if (!parsePositive(optarg, opts.timeoutSeconds)) {
                    std::cerr << "Invalid timeout: " << optarg << "\n";
                    return false;
                }
                break;
            case 'm':
                if (!parsePositive(optarg, opts.memoryMb)) {
                    std::cerr << "Invalid memory limit: " << optarg << "\n";
                    return false;
                }
                break;
            case 'x':
                opts.contextPath = optarg;
                break;
            case 'a':
                opts.analyzeOnly = true;
                break;
            case 'l':
                opts.logLevel = optarg;
                break;
            default:
                return false;
        }
    }
    
    if (optind < argc) opts.snippetPath = argv[optind++];
    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        return false;
    }
    return true;
}

bool loadContext(const std::string& path, python::ExecutionContext& context) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "Cannot open context file: " << path << "\n";
        return false;
    }
    nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        std::cerr << "Context file is not valid JSON: " << path << "\n";
        return false;
    }
    if (!python::contextFromJson(doc, context)) {
        std::cerr << "Context file must hold a JSON object: " << path << "\n";
        return false;
    }
    return true;
}

bool configureLogging(const RunnerOptions& opts, const utils::Config& config) {
    utils::LogSettings log = config.getLogSettings();
    std::string level = opts.logLevel.empty() ? log.level : opts.logLevel;
    utils::LogLevel parsed;
    if (!utils::Logger::parseLevel(level, parsed)) {
        std::cerr << "Unknown log level: " << level << "\n";
        return false;
    }
    if (!log.file.empty()) utils::Logger::init(log.file);
    utils::Logger::setLevel(parsed);
    return true;
}

int run(const RunnerOptions& opts) {
    utils::Config config;
    if (!opts.configPath.empty() && !config.load(opts.configPath)) {
        std::cerr << "Cannot load config file: " << opts.configPath << "\n";
        return EXIT_USAGE;
    }
    if (!opts.profile.empty()) config.set("sandbox.profile", opts.profile);
    if (opts.timeoutSeconds > 0) config.set("sandbox.max_time_seconds", opts.timeoutSeconds);
    if (opts.memoryMb > 0) config.set("sandbox.max_memory_mb", opts.memoryMb);
    
    if (!configureLogging(opts, config)) return EXIT_USAGE;
    
    auto executorConfig = python::ExecutorConfig::fromConfig(config);
    if (executorConfig.failed()) {
        std::cerr << formatError(executorConfig.error()) << "\n";
        return EXIT_USAGE;
    }
    
    std::string code;
    if (opts.snippetPath.empty()) {
        code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        auto loaded = python::readSnippetFile(opts.snippetPath);
        if (loaded.failed()) {
            std::cerr << formatError(loaded.error()) << "\n";
            return EXIT_USAGE;
        }
        code = loaded.value();
    }
    
    python::ExecutionContext context;
    if (!opts.contextPath.empty() && !loadContext(opts.contextPath, context)) return EXIT_USAGE;
    
    python::CodeExecutor executor(executorConfig.value());
    SG_INFO("cli", std::string("profile ") + python::profileToString(executor.config().profile) +
            ", time limit " + std::to_string(executor.config().limits.maxTimeSeconds) + "s");
    
    if (opts.analyzeOnly) {
        python::PolicyReport report = executor.analyze(code);
        std::cout << python::toJson(report).dump(2) << "\n";
        return report.safe ? EXIT_OK : EXIT_SNIPPET_FAILED;
    }
    
    python::ExecutionOutcome outcome = executor.execute(code, context);
    nlohmann::json out = python::toJson(outcome);
    if (outcome.ok() && outcome.success().hasReturnValue) {
        python::ResultRenderer renderer(python::ResultRenderer::kDefaultPreviewRows, executor.config().limits);
        out["summary"] = python::toJson(renderer.summarize(outcome.success().returnValue));
    }
    std::cout << out.dump(2) << "\n";
    utils::Logger::flush();
    return outcome.ok() ? EXIT_OK : EXIT_SNIPPET_FAILED;
}

}

int main(int argc, char* argv[]) {
    snipguard::RunnerOptions opts;
    if (!snipguard::parseArgs(argc, argv, opts)) {
        snipguard::printHelp(argv[0]);
        return snipguard::EXIT_USAGE;
    }
    if (opts.showHelp) {
        snipguard::printHelp(argv[0]);
        return snipguard::EXIT_OK;
    }
    if (opts.showVersion) {
        snipguard::printVersion();
        return snipguard::EXIT_OK;
    }
    return snipguard::run(opts);
}
