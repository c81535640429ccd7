#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include <CLI/CLI.hpp>

#include <citestream/citation/citation_store.h>
#include <citestream/config/citestream_config.h>
#include <citestream/pipeline/pipeline_factory.h>
#include <citestream/pipeline/session_registry.h>
#include <citestream/pipeline/worker_pool.h>
#include <citestream/stream/stream_protocol.h>
#include <citestream/vector/corpus_loader.h>

namespace {

using citestream::config::CitestreamConfig;

struct CommonOptions {
    std::string configPath;
    std::string logLevel;
    std::string storeBackend;
    std::string storePath;
};

void setupLogging(const std::string& level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("citestream", sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

// Defaults < file < environment < flags
bool loadConfig(const CommonOptions& opts, CitestreamConfig& out) {
    auto cfg = CitestreamConfig::load(opts.configPath);
    if (!cfg) {
        std::cerr << "Configuration error: " << cfg.error().message << std::endl;
        return false;
    }
    out = std::move(cfg).value();

    std::vector<std::tuple<std::string, std::string, std::string>> overrides;
    if (!opts.logLevel.empty())
        overrides.emplace_back("logging", "level", opts.logLevel);
    if (!opts.storeBackend.empty())
        overrides.emplace_back("store", "backend", opts.storeBackend);
    if (!opts.storePath.empty())
        overrides.emplace_back("store", "path", opts.storePath);
    for (const auto& [section, key, value] : overrides) {
        if (auto r = out.set(section, key, value); !r) {
            std::cerr << "Invalid option: " << r.error().message << std::endl;
            return false;
        }
    }

    if (auto r = out.validate(); !r) {
        std::cerr << "Configuration error: " << r.error().message << std::endl;
        return false;
    }
    setupLogging(out.logging.level);
    return true;
}

bool loadCorpus(const std::string& corpusPath,
                const citestream::pipeline::PipelineServices& services) {
    if (corpusPath.empty()) {
        spdlog::warn("No corpus given; every query will return no citations");
        return true;
    }
    auto provider = services.embedder->get();
    if (!provider) {
        spdlog::error("Embedding model unavailable: {}", provider.error().message);
        return false;
    }
    auto loaded = citestream::vector::loadCorpusJsonl(corpusPath, *provider.value(),
                                                      *services.index);
    if (!loaded) {
        spdlog::error("Failed to load corpus {}: {}", corpusPath, loaded.error().message);
        return false;
    }
    return true;
}

int runQuery(const CommonOptions& opts, const std::string& corpus, const std::string& session,
             const std::string& text, int64_t windowIndex, const std::string& fragmentId) {
    CitestreamConfig config;
    if (!loadConfig(opts, config))
        return 2;

    auto services = citestream::pipeline::createServices(config);
    if (!services) {
        spdlog::error("Startup failed: {}", services.error().message);
        return 1;
    }
    if (!loadCorpus(corpus, services.value()))
        return 1;

    citestream::pipeline::WorkerPool pool(1);
    auto pipeline =
        citestream::pipeline::createPipeline(config, services.value(), pool.executor());
    std::optional<std::string> fragment;
    if (!fragmentId.empty())
        fragment = fragmentId;

    auto response = pipeline->query(session, text, windowIndex, fragment);
    // Finish the citation write before the process exits
    pool.drain();
    if (!response) {
        std::cout << citestream::stream::encodeError(citestream::stream::kProcessingError,
                                                     response.error().message)
                         .dump()
                  << std::endl;
        return 1;
    }
    std::cout << response.value().toJson().dump(2) << std::endl;
    return 0;
}

int runStream(const CommonOptions& opts, const std::string& corpus, const std::string& session) {
    CitestreamConfig config;
    if (!loadConfig(opts, config))
        return 2;

    auto services = citestream::pipeline::createServices(config);
    if (!services) {
        spdlog::error("Startup failed: {}", services.error().message);
        return 1;
    }
    if (!loadCorpus(corpus, services.value()))
        return 1;
    if (auto warm = services.value().warmUp(); !warm) {
        spdlog::error("Embedding model unavailable: {}", warm.error().message);
        return 1;
    }

    citestream::pipeline::WorkerPool pool(config.runtime.workerThreads);
    auto pipeline =
        citestream::pipeline::createPipeline(config, services.value(), pool.executor());
    citestream::pipeline::SessionRegistry registry(pipeline, config.buffer, pool.executor());

    auto processor = registry.open(session);
    if (!processor) {
        spdlog::error("Cannot open session {}: {}", session, processor.error().message);
        return 1;
    }

    auto writer = std::make_shared<citestream::stream::NdjsonWriter>(std::cout);
    citestream::stream::StreamHandler handler(processor.value(), writer);
    const auto lines = handler.run(std::cin);

    // End of input: let queued windows finish before exiting
    processor.value()->flush().wait();
    const auto status = processor.value()->status();
    registry.close(session);
    pool.drain();

    spdlog::info("Session {}: {} lines, {} windows, {} citations, {} failures", session, lines,
                 status.windowsProcessed, status.citationsEmitted, status.failures);
    return 0;
}

int runCitations(const CommonOptions& opts, const std::string& session) {
    CitestreamConfig config;
    if (!loadConfig(opts, config))
        return 2;
    if (config.store.backend != "sqlite") {
        spdlog::error("Listing citations needs the sqlite store (--store sqlite)");
        return 2;
    }

    auto store = citestream::citation::SqliteCitationStore::open(config.resolvedStorePath());
    if (!store) {
        spdlog::error("Cannot open citation store: {}", store.error().message);
        return 1;
    }
    auto rows = store.value()->list(session);
    if (!rows) {
        spdlog::error("Cannot list citations: {}", rows.error().message);
        return 1;
    }

    nlohmann::json out;
    out["session_id"] = session;
    out["citations"] = nlohmann::json::array();
    for (const auto& row : rows.value()) {
        out["citations"].push_back(row.toJson());
    }
    std::cout << out.dump(2) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"citestream - live transcript citation pipeline"};
    app.require_subcommand(1);

    CommonOptions opts;
    app.add_option("--config", opts.configPath, "Config file (default ~/.config/citestream/config.toml)");
    app.add_option("-l,--log-level", opts.logLevel, "Log level (trace, debug, info, warn, error)");
    app.add_option("--store", opts.storeBackend, "Citation store backend")
        ->check(CLI::IsMember({"memory", "sqlite"}));
    app.add_option("--db", opts.storePath, "SQLite citation database path");

    std::string corpus;
    std::string session;
    std::string text;
    int64_t windowIndex = 0;
    std::string fragmentId;

    auto* query = app.add_subcommand("query", "Run one citation query against a JSONL corpus");
    query->add_option("-c,--corpus", corpus, "Passages, one JSON object per line");
    query->add_option("-s,--session", session, "Session id")->required();
    query->add_option("-t,--text", text, "Transcript window text")->required();
    query->add_option("-w,--window", windowIndex, "Window index")->check(CLI::NonNegativeNumber);
    query->add_option("-f,--fragment", fragmentId, "Transcript fragment id");

    auto* stream = app.add_subcommand("stream", "Read NDJSON segments on stdin, write citations");
    stream->add_option("-c,--corpus", corpus, "Passages, one JSON object per line");
    stream->add_option("-s,--session", session, "Session id")->required();

    auto* citations = app.add_subcommand("citations", "List stored citations of a session");
    citations->add_option("-s,--session", session, "Session id")->required();

    CLI11_PARSE(app, argc, argv);

    // Until the config is read, log warnings and errors only
    setupLogging("warn");

    try {
        if (*query)
            return runQuery(opts, corpus, session, text, windowIndex, fragmentId);
        if (*stream)
            return runStream(opts, corpus, session);
        if (*citations)
            return runCitations(opts, session);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
