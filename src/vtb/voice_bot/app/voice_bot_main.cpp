#include "vtb/voice_bot/service/AudioCache.h"
#include "vtb/voice_bot/service/ConfigManager.h"
#include "vtb/voice_bot/service/ContextRetriever.h"
#include "vtb/voice_bot/service/ErrorHandler.h"
#include "vtb/voice_bot/service/GenerationCoordinator.h"
#include "vtb/voice_bot/service/InteractionTrigger.h"
#include "vtb/voice_bot/service/LanguageModel.h"
#include "vtb/voice_bot/service/PipelineExecutor.h"
#include "vtb/voice_bot/service/ServiceErrors.h"
#include "vtb/voice_bot/service/SessionRegistry.h"
#include "vtb/voice_bot/service/SpeechSynthesizer.h"
#include "vtb/voice_bot/service/SynthesisCoordinator.h"
#include "vtb/voice_bot/service/transport/MockTtsServer.h"
#include "vtb/voice_bot/service/transport/VoiceBotServer.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace vtb::voice_bot::service;

namespace {

struct CliOptions {
    std::string command{"server"};
    std::string configPath{"config/voice_bot_config.json"};
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<std::string> logLevel;
};

void printUsage() {
    std::cout << "Usage: vtb_voice_bot [server|mock-tts] [options]\n\n"
              << "Commands:\n"
              << "  server     run the WebSocket voice bot backend (default)\n"
              << "  mock-tts   run the local mock TTS server\n\n"
              << "Options:\n"
              << "  --config <path>     config file (default config/voice_bot_config.json)\n"
              << "  --host <host>       listen address\n"
              << "  --port <port>       listen port\n"
              << "  --log-level <lvl>   error|warning|info|debug\n"
              << "  -h, --help          show this help\n";
}

// 返回 nullopt 表示应退出（帮助或参数错误已输出）
std::optional<CliOptions> parseArgs(int argc, char** argv, int& exitCode) {
    CliOptions opts;
    exitCode = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto needValue = [&](const char* name) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "[ERR ] missing value for " << name << "\n";
                exitCode = 2;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            printUsage();
            return std::nullopt;
        } else if (arg == "server" || arg == "mock-tts") {
            opts.command = arg;
        } else if (arg == "--config") {
            auto v = needValue("--config");
            if (!v) return std::nullopt;
            opts.configPath = *v;
        } else if (arg == "--host") {
            auto v = needValue("--host");
            if (!v) return std::nullopt;
            opts.host = *v;
        } else if (arg == "--port") {
            auto v = needValue("--port");
            if (!v) return std::nullopt;
            try {
                const int p = std::stoi(*v);
                if (p < 0 || p > 65535) throw std::out_of_range("port");
                opts.port = p;
            } catch (const std::exception&) {
                std::cerr << "[ERR ] invalid port: " << *v << "\n";
                exitCode = 2;
                return std::nullopt;
            }
        } else if (arg == "--log-level") {
            auto v = needValue("--log-level");
            if (!v) return std::nullopt;
            if (!ErrorHandler::parseLogLevel(*v).has_value()) {
                std::cerr << "[ERR ] invalid log level: " << *v << "\n";
                exitCode = 2;
                return std::nullopt;
            }
            opts.logLevel = *v;
        } else {
            std::cerr << "[ERR ] unknown argument: " << arg << "\n";
            printUsage();
            exitCode = 2;
            return std::nullopt;
        }
    }
    return opts;
}

// 阻塞直到 SIGINT/SIGTERM
void waitForShutdownSignal() {
    boost::asio::io_context signalContext;
    boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code&, int) {});
    signalContext.run();
}

int runMockTts(const CliOptions& opts, ErrorHandler& log) {
    const std::string host = opts.host.value_or("127.0.0.1");
    const int port = opts.port.value_or(8080);

    transport::MockTtsServer server(host, port, &log);
    try {
        server.start();
    } catch (const std::exception& e) {
        log.error(std::string("Failed to start mock TTS server: ") + e.what());
        return 1;
    }
    std::cout << "Mock TTS server running at http://" << host << ":" << server.port() << " (Ctrl+C to stop)\n";
    waitForShutdownSignal();
    server.stop();
    return 0;
}

int runServer(const CliOptions& opts, const ConfigManager& cfg, ErrorHandler& log) {
    const auto issues = cfg.validate();
    if (ConfigManager::hasHardValidationErrors(issues)) {
        log.error("Configuration is invalid, refusing to start");
        return 1;
    }

    // 外部能力
    std::shared_ptr<SpeechSynthesizer> synthesizer;
    try {
        synthesizer = makeSpeechSynthesizer(TtsProviderConfig::fromConfig(cfg));
    } catch (const ServiceError& e) {
        log.error("Failed to create speech synthesizer", e.errorInfo());
        return 1;
    }
    auto model = std::make_shared<OpenAiCompatibleModel>(LlmProviderConfig::fromConfig(cfg));

    // 共享组件
    const auto cacheCfg = CacheConfig::fromConfig(cfg);
    std::shared_ptr<AudioCacheStore> cache;
    if (cacheCfg.enabled) {
        cache = std::make_shared<LruAudioCache>(cacheCfg.capacity);
    }

    const auto sessionCfg = SessionConfig::fromConfig(cfg);

    SessionServices services;
    const auto retrievalCfg = RetrievalConfig::fromConfig(cfg);
    services.generation = std::make_shared<GenerationCoordinator>(
        model, CharacterConfig::fromConfig(cfg), GenerationParams::fromConfig(cfg), &log,
        makeContextRetriever(retrievalCfg, &log), retrievalCfg);
    services.synthesis = std::make_shared<SynthesisCoordinator>(
        synthesizer, cache, VoiceConfig::fromConfig(cfg), &log);
    services.trigger = std::make_shared<InteractionTrigger>(TriggerPolicy::fromConfig(cfg), &log);
    services.executor = std::make_shared<PipelineExecutor>(sessionCfg.pipelineWorkers, &log);
    services.errorHandler = &log;

    // 启动时即检查默认语言能否解析到音色
    try {
        (void)services.synthesis->resolveVoice(sessionCfg.language);
    } catch (const UnsupportedVoiceError& e) {
        log.warning(std::string("Replies will be text-only: ") + e.what());
    }

    SessionRegistry registry(services, sessionCfg);

    auto serverCfg = transport::ServerConfig::fromConfig(cfg);
    if (opts.host) serverCfg.host = *opts.host;
    if (opts.port) serverCfg.port = static_cast<uint16_t>(*opts.port);

    transport::VoiceBotServer server(serverCfg, registry, &log);

    services.executor->start();
    try {
        server.start();
    } catch (const std::exception& e) {
        log.error(std::string("Failed to start server: ") + e.what());
        services.executor->stop();
        return 1;
    }
    registry.startIdleSweep([&server](const std::string& id) { server.closeConnection(id); });

    log.info("LLM model: " + services.generation->params().model + ", TTS provider: " + synthesizer->name());
    std::cout << "Voice bot running: ws://" << serverCfg.host << ":" << server.boundPort() << "/ws (Ctrl+C to stop)\n";

    waitForShutdownSignal();

    log.info("Shutting down...");
    registry.stopIdleSweep();
    server.stop();
    registry.closeAll();
    services.executor->stop();

    if (cache) {
        const auto stats = cache->getStatistics();
        log.info("Audio cache: entries=" + std::to_string(stats.totalEntries) + " hits=" +
                 std::to_string(stats.totalHits) + " misses=" + std::to_string(stats.totalMisses) +
                 " evicted=" + std::to_string(stats.evictedEntries));
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    int exitCode = 0;
    const auto opts = parseArgs(argc, argv, exitCode);
    if (!opts) {
        return exitCode;
    }

    ConfigManager cfg;
    ErrorInfo err;

    // 配置文件不存在时会回退默认配置并生成模板；密钥通过环境变量注入
    if (!cfg.loadFromFile(opts->configPath, &err)) {
        std::cerr << "Failed to load config: " << err.toString() << "\n";
        return 1;
    }
    cfg.applyEnvironmentOverrides();
    if (opts->logLevel && !cfg.set("logging.level", *opts->logLevel, &err)) {
        std::cerr << "Failed to apply --log-level: " << err.toString() << "\n";
        return 1;
    }

    ErrorHandler log(ErrorHandler::loggerConfigFrom(cfg));

    const auto issues = cfg.validate();
    for (const auto& s : issues) {
        if (s.rfind("WARN:", 0) == 0) {
            std::cerr << "[WARN] " << s << "\n";
        } else {
            std::cerr << "[ERR ] " << s << "\n";
        }
    }

    if (opts->command == "mock-tts") {
        return runMockTts(*opts, log);
    }
    return runServer(*opts, cfg, log);
}
