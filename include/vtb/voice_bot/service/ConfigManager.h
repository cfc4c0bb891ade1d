#pragma once

#include "vtb/voice_bot/service/ErrorTypes.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace vtb::voice_bot::service {

/**
 * @brief 配置管理器：加载/缓存/校验/环境变量覆盖
 *
 * - 以 nlohmann::json 为底座；各组件在构造时把所需字段转换为不可变的强类型配置结构
 * - 支持 key-path（a.b.c）读取/更新
 * - 支持 env 映射覆盖与 ${ENV_VAR} 占位符替换
 */
class ConfigManager {
public:
    ConfigManager();

    // 从文件加载；
    // - 文件存在：读取并解析
    // - 文件不存在：回退默认配置，并自动生成配置文件模板
    bool loadFromFile(const std::string& path, ErrorInfo* err = nullptr);

    // 从 JSON 字符串加载；解析失败返回 false，且不覆盖旧配置
    bool loadFromString(const std::string& jsonText, ErrorInfo* err = nullptr);

    // 获取完整配置的拷贝
    nlohmann::json getRaw() const;

    // 按 key-path 获取；不存在返回 nullopt
    std::optional<nlohmann::json> get(const std::string& keyPath) const;

    // 按 key-path 获取并转换为 T；不存在或类型不符时返回 fallback
    template <typename T>
    T getOr(const std::string& keyPath, const T& fallback) const {
        auto v = get(keyPath);
        if (!v.has_value() || v->is_null()) return fallback;
        try {
            return v->get<T>();
        } catch (const nlohmann::json::exception&) {
            return fallback;
        }
    }

    // 按 key-path 写入；中间节点不存在会自动创建 object
    bool set(const std::string& keyPath, const nlohmann::json& v, ErrorInfo* err = nullptr);

    // 应用环境变量覆盖（映射覆盖 + ${ENV_VAR} 替换）
    void applyEnvironmentOverrides();

    // 校验配置有效性；返回所有错误/警告（警告以 "WARN:" 前缀）
    std::vector<std::string> validate() const;

    // 是否存在非 WARN 的硬错误
    static bool hasHardValidationErrors(const std::vector<std::string>& issues);

    // 默认配置（最小可用）
    static nlohmann::json makeDefaultConfig();

    // 将默认模板写入文件（会创建父目录）。成功返回 true。
    bool saveToFile(const std::string& path, ErrorInfo* err = nullptr) const;

    // keyPath 命中敏感字段时，对 value 脱敏
    static std::string redactSensitive(const std::string& keyPath, const std::string& value);

private:
    mutable std::mutex m_mu;
    nlohmann::json m_cfg;

    static std::optional<std::string> getEnv(const std::string& name);
    static bool isSensitiveKeyPath(const std::string& keyPath);

    static std::vector<std::string> splitKeyPath(const std::string& keyPath);
    static const nlohmann::json* getPtrByPath(const nlohmann::json& root, const std::vector<std::string>& parts);
    static nlohmann::json* getOrCreatePtrByPath(nlohmann::json& root, const std::vector<std::string>& parts);

    static void applyEnvMappingOverrides(nlohmann::json& root);
    static void replaceEnvPlaceholdersRecursive(nlohmann::json& node);
    static std::string replaceEnvPlaceholdersInString(const std::string& s);
    static std::vector<std::string> validateJson(const nlohmann::json& cfgCopy);

    static bool startsWith(const std::string& s, const std::string& prefix);
};

} // namespace vtb::voice_bot::service
