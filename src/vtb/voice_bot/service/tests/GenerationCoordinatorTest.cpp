#include "vtb/voice_bot/service/ConfigManager.h"
#include "vtb/voice_bot/service/GenerationCoordinator.h"
#include "vtb/voice_bot/service/ServiceErrors.h"

#include "MiniTest.h"
#include "TestFakes.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vtb::voice_bot::service;
using namespace vtb::voice_bot::service::types;
using test_fakes::FakeLanguageModel;

static std::vector<Turn> makeHistory(size_t n, size_t contentLen = 10) {
    std::vector<Turn> h;
    for (size_t i = 0; i < n; ++i) {
        std::string content = "t" + std::to_string(i) + ":";
        content.resize(contentLen, 'x');
        h.push_back(i % 2 == 0 ? Turn::user(content) : Turn::assistant(content));
    }
    return h;
}

// 固定返回给定片段，并记录收到的问题
class StaticRetriever : public ContextRetriever {
public:
    explicit StaticRetriever(std::vector<std::string> chunks) : m_chunks(std::move(chunks)) {}

    std::vector<std::string> retrieve(const std::string& query, size_t topK) const override {
        queries.push_back(query);
        if (failing) throw std::runtime_error("index unavailable");
        std::vector<std::string> out = m_chunks;
        if (out.size() > topK) out.resize(topK);
        return out;
    }
    std::string name() const override { return "static"; }

    mutable std::vector<std::string> queries;
    bool failing{false};

private:
    std::vector<std::string> m_chunks;
};

static RetrievalConfig simpleTemplate() {
    RetrievalConfig cfg;
    cfg.enabled = true;
    cfg.topK = 2;
    cfg.promptTemplate = "Docs: {retrieved_chunks} | Q: {question}";
    return cfg;
}

static size_t totalChars(const std::vector<ChatMessage>& msgs) {
    size_t n = 0;
    for (const auto& m : msgs) n += m.content.size();
    return n;
}

int main() {
    using namespace mini_test;

    std::vector<TestCase> tests;

    // ========== Character ==========
    tests.push_back({"Character_DefaultPersonaUsesName", []() {
        CharacterConfig c;
        c.name = "Mika";
        c.language = "en";
        const auto pre = c.systemPreamble();
        CHECK_TRUE(pre.find("You are Mika") == 0);
        CHECK_TRUE(pre.find("Always reply in English.") != std::string::npos);
    }});

    tests.push_back({"Character_CustomPersonaAndUnknownLanguage", []() {
        CharacterConfig c;
        c.persona = "You are a pirate.";
        c.language = "xx";
        CHECK_EQ(c.systemPreamble(), std::string("You are a pirate. Always reply in xx."));
    }});

    tests.push_back({"Character_FromConfig", []() {
        ConfigManager config;
        config.loadFromString(R"({"character":{"name":"Rin","language":"ja"}})");
        const auto c = CharacterConfig::fromConfig(config);
        CHECK_EQ(c.name, std::string("Rin"));
        CHECK_EQ(c.language, std::string("ja"));
        CHECK_TRUE(c.persona.empty());
    }});

    tests.push_back({"Params_FromConfig", []() {
        ConfigManager config;
        config.loadFromString(R"({"llm":{"model_id":"m1","max_tokens":64,"max_history_turns":0,"transcript_budget_chars":500}})");
        const auto p = GenerationParams::fromConfig(config);
        CHECK_EQ(p.model, std::string("m1"));
        CHECK_EQ(p.maxTokens, static_cast<uint32_t>(64));
        CHECK_EQ(p.maxHistoryTurns, static_cast<size_t>(0));
        CHECK_EQ(p.transcriptBudgetChars, static_cast<size_t>(500));
    }});

    // ========== Transcript ==========
    tests.push_back({"Transcript_PreambleFirst", []() {
        const auto msgs = GenerationCoordinator::buildTranscript(makeHistory(3), "PRE", 10, 4000);
        CHECK_EQ(msgs.size(), static_cast<size_t>(4));
        CHECK_TRUE(msgs[0].role == MessageRole::System);
        CHECK_EQ(msgs[0].content, std::string("PRE"));
        CHECK_TRUE(msgs[1].role == MessageRole::User);
        CHECK_TRUE(msgs[2].role == MessageRole::Assistant);
    }});

    tests.push_back({"Transcript_MaxHistoryTurnsKeepsNewest", []() {
        const auto history = makeHistory(8);
        const auto msgs = GenerationCoordinator::buildTranscript(history, "PRE", 3, 4000);
        CHECK_EQ(msgs.size(), static_cast<size_t>(4));
        CHECK_EQ(msgs[1].content, history[5].content);
        CHECK_EQ(msgs[3].content, history[7].content);
    }});

    tests.push_back({"Transcript_ZeroMaxTurnsMeansUnlimited", []() {
        const auto msgs = GenerationCoordinator::buildTranscript(makeHistory(30), "PRE", 0, 100000);
        CHECK_EQ(msgs.size(), static_cast<size_t>(31));
    }});

    tests.push_back({"Transcript_BudgetDropsOldestFirst", []() {
        const auto history = makeHistory(10, 100);
        const size_t budget = 350;
        const auto msgs = GenerationCoordinator::buildTranscript(history, "PRE", 0, budget);
        CHECK_TRUE(totalChars(msgs) <= budget);
        // 3 + 3*100 <= 350，4 条则超出
        CHECK_EQ(msgs.size(), static_cast<size_t>(4));
        CHECK_EQ(msgs.back().content, history.back().content);
        CHECK_EQ(msgs[1].content, history[7].content);
    }});

    tests.push_back({"Transcript_NewestTurnKeptEvenOverBudget", []() {
        std::vector<Turn> history{Turn::user("old"), Turn::user(std::string(500, 'y'))};
        const auto msgs = GenerationCoordinator::buildTranscript(history, "PREAMBLE", 10, 50);
        CHECK_EQ(msgs.size(), static_cast<size_t>(2));
        CHECK_EQ(msgs[0].content, std::string("PREAMBLE"));
        CHECK_EQ(msgs[1].content.size(), static_cast<size_t>(500));
    }});

    tests.push_back({"Transcript_SkipsSystemTurns", []() {
        std::vector<Turn> history{Turn{MessageRole::System, "stale system", std::chrono::system_clock::now()},
                                  Turn::user("hi")};
        const auto msgs = GenerationCoordinator::buildTranscript(history, "PRE", 10, 4000);
        CHECK_EQ(msgs.size(), static_cast<size_t>(2));
        CHECK_EQ(msgs[1].content, std::string("hi"));
    }});

    // ========== Generate ==========
    tests.push_back({"Generate_SendsParamsAndReturnsContent", []() {
        auto model = std::make_shared<FakeLanguageModel>();
        GenerationParams params;
        params.model = "test-model";
        params.maxTokens = 42;
        GenerationCoordinator gen(model, CharacterConfig{}, params);

        const auto reply = gen.generate({Turn::user("Hello")});
        CHECK_EQ(reply, std::string("echo: Hello"));

        const auto reqs = model->recorded();
        CHECK_EQ(reqs.size(), static_cast<size_t>(1));
        CHECK_EQ(reqs[0].model, std::string("test-model"));
        CHECK_TRUE(reqs[0].maxTokens.has_value());
        CHECK_EQ(*reqs[0].maxTokens, static_cast<uint32_t>(42));
        CHECK_TRUE(reqs[0].messages[0].role == MessageRole::System);
    }});

    tests.push_back({"Generate_CharacterOverride", []() {
        auto model = std::make_shared<FakeLanguageModel>();
        GenerationCoordinator gen(model, CharacterConfig{}, GenerationParams{});
        CharacterConfig other;
        other.persona = "You are terse.";
        other.language = "";
        (void)gen.generate({Turn::user("Hi")}, other);
        CHECK_EQ(model->recorded()[0].messages[0].content, std::string("You are terse."));
    }});

    tests.push_back({"Generate_EmptyHistoryRejected", []() {
        auto model = std::make_shared<FakeLanguageModel>();
        GenerationCoordinator gen(model, CharacterConfig{}, GenerationParams{});
        CHECK_THROWS_AS(gen.generate({}), InvalidInputError);
        CHECK_EQ(model->calls.load(), 0);
    }});

    tests.push_back({"Generate_GenerationErrorPropagates", []() {
        auto model = std::make_shared<FakeLanguageModel>();
        model->failWith = []() {
            ErrorInfo info;
            info.errorType = ErrorType::RateLimitError;
            info.errorCode = 429;
            info.message = "slow down";
            throw GenerationError(info, true);
        };
        GenerationCoordinator gen(model, CharacterConfig{}, GenerationParams{});
        bool retryable = false;
        try {
            (void)gen.generate({Turn::user("Hi")});
        } catch (const GenerationError& e) {
            retryable = e.retryable();
        }
        CHECK_TRUE(retryable);
    }});

    tests.push_back({"Generate_UnexpectedExceptionWrapped", []() {
        auto model = std::make_shared<FakeLanguageModel>();
        model->failWith = []() { throw std::runtime_error("boom"); };
        GenerationCoordinator gen(model, CharacterConfig{}, GenerationParams{});
        bool caught = false;
        try {
            (void)gen.generate({Turn::user("Hi")});
        } catch (const GenerationError& e) {
            caught = true;
            CHECK_FALSE(e.retryable());
            CHECK_EQ(std::string(e.code()), std::string("generation_failed"));
            CHECK_TRUE(std::string(e.what()).find("boom") != std::string::npos);
        }
        CHECK_TRUE(caught);
    }});

    tests.push_back({"Generate_BlankReplyIsGenerationError", []() {
        auto model = std::make_shared<FakeLanguageModel>();
        GenerationCoordinator gen(model, CharacterConfig{}, GenerationParams{});
        for (const char* reply : {"", "   ", " \n\t "}) {
            model->responder = [reply](const ChatRequest&) { return std::string(reply); };
            bool caught = false;
            bool retryable = true;
            std::string code;
            try {
                (void)gen.generate({Turn::user("Hi")});
            } catch (const GenerationError& e) {
                caught = true;
                retryable = e.retryable();
                code = e.code();
            }
            CHECK_TRUE(caught);
            CHECK_FALSE(retryable);
            CHECK_EQ(code, std::string("generation_failed"));
        }
        CHECK_EQ(model->calls.load(), 3);
    }});

    // ========== Retrieval ==========
    tests.push_back({"Retrieval_WrapsLatestUserInput", []() {
        auto model = std::make_shared<FakeLanguageModel>();
        auto retriever = std::make_shared<StaticRetriever>(std::vector<std::string>{"d1", "d2", "d3"});
        GenerationCoordinator gen(model, CharacterConfig{}, GenerationParams{}, nullptr, retriever, simpleTemplate());

        const std::vector<Turn> history{Turn::user("earlier"), Turn::assistant("ok"), Turn::user("where?")};
        (void)gen.generate(history);

        const auto req = model->recorded()[0];
        CHECK_EQ(req.messages.back().content, std::string("Docs: d1\n\nd2 | Q: where?"));
        // 更早的轮次不受影响
        CHECK_EQ(req.messages[1].content, std::string("earlier"));
        CHECK_EQ(retriever->queries.size(), static_cast<size_t>(1));
        CHECK_EQ(retriever->queries[0], std::string("where?"));
    }});

    tests.push_back({"Retrieval_PlainModeSkipsRetriever", []() {
        auto model = std::make_shared<FakeLanguageModel>();
        auto retriever = std::make_shared<StaticRetriever>(std::vector<std::string>{"d1"});
        GenerationCoordinator gen(model, CharacterConfig{}, GenerationParams{}, nullptr, retriever, simpleTemplate());

        (void)gen.generate({Turn::user("The user looks sad.")}, GenerationCoordinator::ContextMode::Plain);
        CHECK_EQ(model->recorded()[0].messages.back().content, std::string("The user looks sad."));
        CHECK_TRUE(retriever->queries.empty());
    }});

    tests.push_back({"Retrieval_NoHitsOrFailureUsesRawInput", []() {
        auto model = std::make_shared<FakeLanguageModel>();
        auto empty = std::make_shared<StaticRetriever>(std::vector<std::string>{});
        GenerationCoordinator gen(model, CharacterConfig{}, GenerationParams{}, nullptr, empty, simpleTemplate());
        (void)gen.generate({Turn::user("hello")});
        CHECK_EQ(model->recorded()[0].messages.back().content, std::string("hello"));

        auto broken = std::make_shared<StaticRetriever>(std::vector<std::string>{"d1"});
        broken->failing = true;
        GenerationCoordinator gen2(model, CharacterConfig{}, GenerationParams{}, nullptr, broken, simpleTemplate());
        CHECK_EQ(gen2.generate({Turn::user("hello")}), std::string("echo: hello"));
        CHECK_EQ(broken->queries.size(), static_cast<size_t>(1));
    }});

    tests.push_back({"Retrieval_KeywordRetrieverEndToEnd", []() {
        auto model = std::make_shared<FakeLanguageModel>();
        auto retriever = std::make_shared<KeywordContextRetriever>(
            std::vector<std::string>{"Office hours are Monday to Friday.", "Parking is behind building B."});
        GenerationCoordinator gen(model, CharacterConfig{}, GenerationParams{}, nullptr, retriever, simpleTemplate());
        (void)gen.generate({Turn::user("Where is parking?")});
        CHECK_EQ(model->recorded()[0].messages.back().content,
                 std::string("Docs: Parking is behind building B. | Q: Where is parking?"));
    }});

    return run(tests);
}
