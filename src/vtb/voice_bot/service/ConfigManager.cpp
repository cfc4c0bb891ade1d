#include "vtb/voice_bot/service/ConfigManager.h"

#include "vtb/voice_bot/service/ContextRetriever.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace vtb::voice_bot::service {

static std::string trimCopy(std::string s) {
    auto notSpace = [](int ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

ConfigManager::ConfigManager()
    : m_cfg(makeDefaultConfig())
{}

bool ConfigManager::loadFromFile(const std::string& path, ErrorInfo* err) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        // 1) 回退默认配置（内存）
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_cfg = makeDefaultConfig();
            applyEnvMappingOverrides(m_cfg);
            replaceEnvPlaceholdersRecursive(m_cfg);
        }

        // 2) 自动生成配置文件。落盘的是模板，仍保持 ${OPENROUTER_API_KEY} 占位符
        ErrorInfo saveErr;
        const bool saved = saveToFile(path, &saveErr);

        if (err) {
            err->errorType = ErrorType::UnknownError;
            err->errorCode = 0;
            err->message = "Config file not found, using default config: " + path;
            err->details = nlohmann::json{
                {"path", path},
                {"fallback", "default_config"},
                {"auto_created", saved}
            };
            if (!saved) {
                (*err->details)["auto_create_failed"] = saveErr.toJson();
            }
        }
        return true;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return loadFromString(buffer.str(), err);
}

bool ConfigManager::loadFromString(const std::string& jsonText, ErrorInfo* err) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(jsonText);
    } catch (const std::exception& e) {
        if (err) {
            err->errorType = ErrorType::InvalidRequest;
            err->errorCode = 0;
            err->message = std::string("Config JSON parse failed: ") + e.what();
            err->details = nlohmann::json{{"snippet", jsonText.substr(0, 256)}};
        }
        return false;
    }

    if (!parsed.is_object()) {
        if (err) {
            err->errorType = ErrorType::InvalidRequest;
            err->errorCode = 0;
            err->message = "Config root must be a JSON object";
        }
        return false;
    }

    // 用户文件只需写想覆盖的字段：以默认配置为底合并
    nlohmann::json merged = makeDefaultConfig();
    merged.merge_patch(parsed);

    // 在锁外处理 env 逻辑，避免长期占用
    applyEnvMappingOverrides(merged);
    replaceEnvPlaceholdersRecursive(merged);

    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_cfg = std::move(merged);
    }
    return true;
}

nlohmann::json ConfigManager::getRaw() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_cfg;
}

bool ConfigManager::saveToFile(const std::string& path, ErrorInfo* err) const {
    try {
        const std::filesystem::path p(path);
        const auto parent = p.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec && !std::filesystem::exists(parent)) {
                if (err) {
                    err->errorType = ErrorType::UnknownError;
                    err->errorCode = 1;
                    err->message = "Failed to create config directory: " + parent.string();
                    err->details = nlohmann::json{{"path", path}, {"ec", ec.value()}, {"what", ec.message()}};
                }
                return false;
            }
        }

        std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            if (err) {
                err->errorType = ErrorType::UnknownError;
                err->errorCode = 2;
                err->message = "Failed to open config file for write: " + path;
                err->details = nlohmann::json{{"path", path}};
            }
            return false;
        }

        // 写盘时避免写入 env 替换后的敏感信息：始终以默认模板为准
        const auto tmpl = makeDefaultConfig();
        ofs << tmpl.dump(2) << "\n";
        ofs.flush();
        return true;
    } catch (const std::exception& e) {
        if (err) {
            err->errorType = ErrorType::UnknownError;
            err->errorCode = 3;
            err->message = std::string("Failed to save config file: ") + e.what();
            err->details = nlohmann::json{{"path", path}};
        }
        return false;
    }
}

std::optional<nlohmann::json> ConfigManager::get(const std::string& keyPath) const {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lk(m_mu);
    const nlohmann::json* p = getPtrByPath(m_cfg, parts);
    if (!p) return std::nullopt;
    return std::optional<nlohmann::json>{*p};
}

bool ConfigManager::set(const std::string& keyPath, const nlohmann::json& v, ErrorInfo* err) {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) {
        if (err) {
            err->errorType = ErrorType::InvalidRequest;
            err->errorCode = 0;
            err->message = "Empty keyPath";
        }
        return false;
    }

    std::lock_guard<std::mutex> lk(m_mu);
    nlohmann::json* p = getOrCreatePtrByPath(m_cfg, parts);
    if (!p) {
        if (err) {
            err->errorType = ErrorType::InvalidRequest;
            err->errorCode = 0;
            err->message = "Failed to create keyPath: " + keyPath;
        }
        return false;
    }
    *p = v;
    return true;
}

void ConfigManager::applyEnvironmentOverrides() {
    std::lock_guard<std::mutex> lk(m_mu);
    applyEnvMappingOverrides(m_cfg);
    replaceEnvPlaceholdersRecursive(m_cfg);
}

std::vector<std::string> ConfigManager::validate() const {
    return validateJson(getRaw());
}

nlohmann::json ConfigManager::makeDefaultConfig() {
    nlohmann::json j;
    j["_comment"] = "VTuber voice bot config template (auto-generated). JSON has no comments; use _comment fields.";
    j["character"] = {
        {"_comment", "persona empty -> built-in persona derived from name."},
        {"name", "Nana"},
        {"persona", ""},
        {"language", "zh"}
    };
    j["llm"] = {
        {"_comment", "OpenAI-compatible chat completions endpoint. api_key is recommended to be injected via env var."},
        {"base_url", "https://openrouter.ai/api/v1"},
        {"api_key", "${OPENROUTER_API_KEY}"},
        {"model_id", "deepseek/deepseek-chat-v3-0324:free"},
        {"max_tokens", 1000},
        {"temperature", 0.7},
        {"timeout_ms", 30000},
        {"transcript_budget_chars", 4000},
        {"max_history_turns", 10}
    };
    j["tts"] = {
        {"_comment", "provider: openai (POST /audio/speech) or mock (POST /tts of the bundled mock server)."},
        {"provider", "mock"},
        {"base_url", "http://127.0.0.1:8080"},
        {"api_key", ""},
        {"model_id", "tts-1"},
        {"response_format", "mp3"},
        {"timeout_ms", 10000},
        {"default_language", "zh"},
        {"auto_language", false},
        {"voices", {
            {"zh", "zh-CN-XiaoxiaoNeural"},
            {"en", "en-US-AriaNeural"},
            {"ja", "ja-JP-NanamiNeural"},
            {"ko", "ko-KR-SunHiNeural"},
            {"fr", "fr-FR-DeniseNeural"},
            {"de", "de-DE-KatjaNeural"},
            {"es", "es-ES-ElviraNeural"},
            {"it", "it-IT-ElsaNeural"},
            {"ru", "ru-RU-SvetlanaNeural"},
            {"pt", "pt-BR-FranciscaNeural"}
        }}
    };
    j["retrieval"] = {
        {"_comment", "Keyword retrieval over local documents; matches are inserted into prompt_template "
                     "({retrieved_chunks}, {question}). documents_file: chunks separated by blank lines."},
        {"enabled", false},
        {"top_k", 4},
        {"prompt_template", RetrievalConfig::defaultPromptTemplate()},
        {"documents", nlohmann::json::array()},
        {"documents_file", ""}
    };
    j["cache"] = {
        {"enabled", true},
        {"capacity", 100}
    };
    j["session"] = {
        {"history_max_turns", 20},
        {"idle_timeout_seconds", 600},
        {"sweep_interval_seconds", 30},
        {"pipeline_workers", 4},
        {"max_queue_per_session", 16}
    };
    j["emotion"] = {
        {"cooldown_seconds", 30},
        {"trigger_emotions", nlohmann::json::array({"sad", "angry"})},
        {"prompts", {
            {"happy", "The user looks happy. Respond in a cheerful way, matching their positive mood."},
            {"sad", "The user looks sad. Respond with empathy and ask if they're okay."},
            {"angry", "The user looks upset. Respond calmly and ask if something is bothering them."},
            {"surprise", "The user looks surprised. Respond with curiosity about what surprised them."},
            {"fear", "The user looks worried or scared. Respond with reassurance and offer support."},
            {"disgust", "The user looks disgusted. Respond with concern and ask what's wrong."},
            {"neutral", "The user has a neutral expression. Respond normally and perhaps ask how they're doing."}
        }}
    };
    j["server"] = {
        {"host", "0.0.0.0"},
        {"port", 8000},
        {"threads", 2},
        {"health_message", "VTuber backend is running"}
    };
    j["logging"] = {
        {"level", "info"},
        {"enabled", true}
    };
    return j;
}

std::string ConfigManager::redactSensitive(const std::string& keyPath, const std::string& value) {
    if (!isSensitiveKeyPath(keyPath)) return value;
    const auto v = trimCopy(value);
    if (v.size() <= 8) return "******";
    return v.substr(0, 2) + "******" + v.substr(v.size() - 2);
}

std::optional<std::string> ConfigManager::getEnv(const std::string& name) {
    if (name.empty()) return std::nullopt;
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    std::string s = v;
    if (s.empty()) return std::nullopt;
    return s;
}

bool ConfigManager::isSensitiveKeyPath(const std::string& keyPath) {
    std::string low = keyPath;
    std::transform(low.begin(), low.end(), low.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return low.find("api_key") != std::string::npos || low.find("apikey") != std::string::npos || low.find("secret") != std::string::npos;
}

std::vector<std::string> ConfigManager::splitKeyPath(const std::string& keyPath) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : keyPath) {
        if (c == '.') {
            if (!cur.empty()) parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

const nlohmann::json* ConfigManager::getPtrByPath(const nlohmann::json& root, const std::vector<std::string>& parts) {
    const nlohmann::json* p = &root;
    for (const auto& k : parts) {
        if (!p->is_object()) return nullptr;
        if (!p->contains(k)) return nullptr;
        p = &((*p)[k]);
    }
    return p;
}

nlohmann::json* ConfigManager::getOrCreatePtrByPath(nlohmann::json& root, const std::vector<std::string>& parts) {
    nlohmann::json* p = &root;
    for (size_t i = 0; i < parts.size(); ++i) {
        const auto& k = parts[i];
        if (!p->is_object()) {
            *p = nlohmann::json::object();
        }
        if (i == parts.size() - 1) {
            return &((*p)[k]);
        }
        p = &((*p)[k]);
    }
    return p;
}

void ConfigManager::applyEnvMappingOverrides(nlohmann::json& root) {
    // 固定映射：env -> keyPath
    struct MapItem {
        const char* env;
        const char* keyPath;
        bool integer;
    };
    const MapItem mapping[] = {
        {"OPENROUTER_API_KEY", "llm.api_key", false},
        {"OPENROUTER_BASE_URL", "llm.base_url", false},
        {"VTB_LLM_MODEL", "llm.model_id", false},
        {"VTB_TTS_BASE_URL", "tts.base_url", false},
        {"VTB_TTS_API_KEY", "tts.api_key", false},
        {"VTB_SERVER_PORT", "server.port", true},
    };

    for (const auto& m : mapping) {
        auto v = getEnv(m.env);
        if (!v.has_value()) continue;
        // 空字符串视为“未提供”
        const auto val = trimCopy(v.value());
        if (val.empty()) continue;
        const auto parts = splitKeyPath(m.keyPath);
        nlohmann::json* p = getOrCreatePtrByPath(root, parts);
        if (!p) continue;
        if (m.integer) {
            try {
                *p = std::stoll(val);
            } catch (const std::exception&) {
                // 保留字符串，validate() 会报告类型错误
                *p = val;
            }
        } else {
            *p = val;
        }
    }
}

void ConfigManager::replaceEnvPlaceholdersRecursive(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            replaceEnvPlaceholdersRecursive(it.value());
        }
        return;
    }
    if (node.is_array()) {
        for (auto& v : node) {
            replaceEnvPlaceholdersRecursive(v);
        }
        return;
    }
    if (node.is_string()) {
        node = replaceEnvPlaceholdersInString(node.get<std::string>());
    }
}

std::string ConfigManager::replaceEnvPlaceholdersInString(const std::string& s) {
    // 替换 ${ENV_NAME} 形式的占位符；未找到 env 时保留原样
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        if (i + 2 < s.size() && s[i] == '$' && s[i + 1] == '{') {
            const auto end = s.find('}', i + 2);
            if (end != std::string::npos) {
                const auto name = s.substr(i + 2, end - (i + 2));
                auto v = getEnv(name);
                if (v.has_value()) {
                    out += v.value();
                } else {
                    out += s.substr(i, end - i + 1);
                }
                i = end + 1;
                continue;
            }
        }
        out.push_back(s[i]);
        i++;
    }
    return out;
}

static void checkHttpUrl(const nlohmann::json& section, const std::string& prefix, std::vector<std::string>& out) {
    if (!section.contains("base_url") || !section["base_url"].is_string() || trimCopy(section["base_url"].get<std::string>()).empty()) {
        out.push_back("Missing or invalid '" + prefix + ".base_url' (string required)");
        return;
    }
    const auto baseUrl = trimCopy(section["base_url"].get<std::string>());
    if (baseUrl.rfind("http://", 0) != 0 && baseUrl.rfind("https://", 0) != 0) {
        out.push_back("Invalid '" + prefix + ".base_url' (must start with http:// or https://)");
    }
}

static void checkIntRange(const nlohmann::json& section, const std::string& prefix, const char* key,
                          long long lo, long long hi, std::vector<std::string>& out) {
    if (!section.contains(key)) return;
    const std::string path = prefix + "." + key;
    if (!section[key].is_number_integer()) {
        out.push_back("Invalid '" + path + "' (integer required)");
        return;
    }
    const auto v = section[key].get<long long>();
    if (v < lo || v > hi) {
        out.push_back("Invalid '" + path + "' (range " + std::to_string(lo) + ".." + std::to_string(hi) + ")");
    }
}

std::vector<std::string> ConfigManager::validateJson(const nlohmann::json& cfgCopy) {
    std::vector<std::string> out;

    // llm
    if (!cfgCopy.contains("llm") || !cfgCopy["llm"].is_object()) {
        out.push_back("Missing or invalid 'llm' object");
    } else {
        const auto& llm = cfgCopy["llm"];
        checkHttpUrl(llm, "llm", out);

        if (!llm.contains("api_key") || !llm["api_key"].is_string()) {
            out.push_back("Missing or invalid 'llm.api_key' (string required)");
        } else {
            const auto key = trimCopy(llm["api_key"].get<std::string>());
            if (key.empty()) {
                out.push_back("Invalid 'llm.api_key' (empty)");
            } else if (startsWith(key, "${") && key.find('}') != std::string::npos) {
                // 仍为占位符，通常意味着 env 未提供
                out.push_back("Invalid 'llm.api_key' (unresolved env placeholder): " + redactSensitive("llm.api_key", key));
            }
        }
        if (!llm.contains("model_id") || !llm["model_id"].is_string() || trimCopy(llm["model_id"].get<std::string>()).empty()) {
            out.push_back("Missing or invalid 'llm.model_id' (string required)");
        }
        checkIntRange(llm, "llm", "max_tokens", 1, 32768, out);
        checkIntRange(llm, "llm", "timeout_ms", 1, 300000, out);
        checkIntRange(llm, "llm", "transcript_budget_chars", 1, 1000000, out);
        checkIntRange(llm, "llm", "max_history_turns", 0, 1000, out);
        if (llm.contains("temperature")) {
            if (!llm["temperature"].is_number()) {
                out.push_back("Invalid 'llm.temperature' (number required)");
            } else {
                const auto t = llm["temperature"].get<double>();
                if (t < 0.0 || t > 2.0) out.push_back("Invalid 'llm.temperature' (range 0..2)");
            }
        }
    }

    // tts
    if (!cfgCopy.contains("tts") || !cfgCopy["tts"].is_object()) {
        out.push_back("Missing or invalid 'tts' object");
    } else {
        const auto& tts = cfgCopy["tts"];
        checkHttpUrl(tts, "tts", out);
        const auto provider = tts.contains("provider") && tts["provider"].is_string() ? tts["provider"].get<std::string>() : "";
        if (provider != "openai" && provider != "mock") {
            out.push_back("Invalid 'tts.provider' (openai or mock required)");
        }
        checkIntRange(tts, "tts", "timeout_ms", 1, 300000, out);
        if (!tts.contains("voices") || !tts["voices"].is_object() || tts["voices"].empty()) {
            out.push_back("Missing or invalid 'tts.voices' (non-empty object required)");
        } else {
            for (auto it = tts["voices"].begin(); it != tts["voices"].end(); ++it) {
                if (!it.value().is_string() || trimCopy(it.value().get<std::string>()).empty()) {
                    out.push_back("Invalid voice mapping for language '" + it.key() + "' (string voice id required)");
                }
            }
            const auto lang = tts.contains("default_language") && tts["default_language"].is_string()
                                  ? tts["default_language"].get<std::string>() : "";
            if (!lang.empty() && !tts["voices"].contains(lang)) {
                out.push_back("WARN: tts.default_language has no voice mapping: " + lang);
            }
        }
        if (provider == "openai" && (!tts.contains("api_key") || !tts["api_key"].is_string() ||
                                     trimCopy(tts["api_key"].get<std::string>()).empty())) {
            out.push_back("WARN: 'tts.api_key' is empty for provider openai");
        }
    }

    // character
    if (cfgCopy.contains("character")) {
        const auto& c = cfgCopy["character"];
        if (!c.is_object()) {
            out.push_back("Invalid 'character' (object required)");
        } else {
            if (!c.contains("name") || !c["name"].is_string() || trimCopy(c["name"].get<std::string>()).empty()) {
                out.push_back("Missing or invalid 'character.name' (string required)");
            }
            const auto lang = c.contains("language") && c["language"].is_string() ? c["language"].get<std::string>() : "";
            if (!lang.empty() && cfgCopy.contains("tts") && cfgCopy["tts"].is_object() &&
                cfgCopy["tts"].contains("voices") && cfgCopy["tts"]["voices"].is_object() &&
                !cfgCopy["tts"]["voices"].contains(lang)) {
                out.push_back("WARN: character.language has no voice mapping: " + lang);
            }
        }
    }

    // retrieval
    if (cfgCopy.contains("retrieval") && cfgCopy["retrieval"].is_object()) {
        const auto& r = cfgCopy["retrieval"];
        checkIntRange(r, "retrieval", "top_k", 1, 50, out);
        if (r.contains("documents") && !r["documents"].is_array()) {
            out.push_back("Invalid 'retrieval.documents' (array required)");
        }
        if (r.contains("prompt_template")) {
            if (!r["prompt_template"].is_string()) {
                out.push_back("Invalid 'retrieval.prompt_template' (string required)");
            } else if (r["prompt_template"].get<std::string>().find("{question}") == std::string::npos) {
                out.push_back("WARN: retrieval.prompt_template has no {question} placeholder");
            }
        }
    }

    // cache
    if (cfgCopy.contains("cache") && cfgCopy["cache"].is_object()) {
        checkIntRange(cfgCopy["cache"], "cache", "capacity", 1, 1000000, out);
    }

    // session
    if (cfgCopy.contains("session") && cfgCopy["session"].is_object()) {
        const auto& s = cfgCopy["session"];
        checkIntRange(s, "session", "history_max_turns", 1, 100000, out);
        checkIntRange(s, "session", "idle_timeout_seconds", 0, 86400 * 7, out);
        checkIntRange(s, "session", "sweep_interval_seconds", 1, 3600, out);
        checkIntRange(s, "session", "pipeline_workers", 1, 256, out);
        checkIntRange(s, "session", "max_queue_per_session", 1, 10000, out);
    }

    // emotion
    if (cfgCopy.contains("emotion") && cfgCopy["emotion"].is_object()) {
        const auto& e = cfgCopy["emotion"];
        checkIntRange(e, "emotion", "cooldown_seconds", 0, 86400, out);
        if (e.contains("trigger_emotions")) {
            if (!e["trigger_emotions"].is_array()) {
                out.push_back("Invalid 'emotion.trigger_emotions' (array required)");
            } else {
                for (const auto& v : e["trigger_emotions"]) {
                    if (!v.is_string()) {
                        out.push_back("Invalid 'emotion.trigger_emotions' entry (string required)");
                        break;
                    }
                }
            }
        }
        if (e.contains("prompts") && !e["prompts"].is_object()) {
            out.push_back("Invalid 'emotion.prompts' (object required)");
        }
    }

    // server
    if (cfgCopy.contains("server") && cfgCopy["server"].is_object()) {
        checkIntRange(cfgCopy["server"], "server", "port", 1, 65535, out);
        checkIntRange(cfgCopy["server"], "server", "threads", 1, 256, out);
    }

    // logging
    if (cfgCopy.contains("logging") && cfgCopy["logging"].is_object() && cfgCopy["logging"].contains("level")) {
        const auto& lv = cfgCopy["logging"]["level"];
        static const std::set<std::string> kLevels{"error", "warning", "warn", "info", "debug"};
        if (!lv.is_string() || kLevels.find(lv.get<std::string>()) == kLevels.end()) {
            out.push_back("WARN: unknown 'logging.level', falling back to info");
        }
    }

    return out;
}

bool ConfigManager::hasHardValidationErrors(const std::vector<std::string>& issues) {
    for (const auto& s : issues) {
        if (!startsWith(s, "WARN:")) return true;
    }
    return false;
}

bool ConfigManager::startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace vtb::voice_bot::service
