#ifndef XCONFIG_H
#define XCONFIG_H

#include "mcp_json.h"

#include <QString>
#include <QtGlobal>
#include <string>

//默认约定
#define DEFAULT_REGISTRY_URL "https://chains.blockscout.com/api/chains/" // 链注册表，按 chain id 查询浏览器地址
#define DEFAULT_HTTP_TIMEOUT_MS 30000                                     // 单次请求超时
#define DEFAULT_HTTP_MAX_RETRIES 2                                        // 短暂故障的最大重试次数
#define DEFAULT_HTTP_RETRY_BASE_MS 400
#define DEFAULT_HTTP_RETRY_MAX_MS 4000
#define DEFAULT_MAX_CONCURRENT_CALLS 8 // 并发执行的 tools/call 上限
#define DEFAULT_LOG_LEVEL "info"
#define EXPLORER_API_PREFIX "api/v2/"

#define DEFAULT_INSTRUCTIONS "This server provides a tool for query blockchains on-chain data"

// Merlin 链不在注册表中，使用固定浏览器地址
#define MERLIN_CHAIN_ID 4200
#define MERLIN_EXPLORER_URL "https://scan.merlinverify.com/"
#define MERLIN_NATIVE_TOKEN_SYMBOL "BTC"
#define MERLIN_NATIVE_TOKEN_DECIMALS "18"
#define MERLIN_NATIVE_TOKEN_NOTE "The native token on merlin is BTC, but the decimals of merlin BTC is 18, so 1 merlin BTC = 1 * 10^18 wei"

// 进程退出码
enum ONCHAIN_EXIT_CODE
{
    ONCHAIN_EXIT_OK = 0,
    ONCHAIN_EXIT_RUNTIME = 1,
    ONCHAIN_EXIT_CONFIG = 2,
};

// 安全获取字符串（支持默认值）
inline std::string get_string_safely(const mcp::json &json_, const std::string &key, const std::string &default_val = "")
{
    if (!json_.is_object()) return default_val;
    const auto it = json_.find(key);
    if (it == json_.end()) return default_val;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump(); // 将数值转换为字符串形式
    return default_val;
}

// 安全获取对象，非对象时返回空对象
inline mcp::json get_json_object_safely(const mcp::json &json_, const std::string &key)
{
    if (!json_.is_object()) return mcp::json::object();
    const auto it = json_.find(key);
    if (it == json_.end() || !it->is_object()) return mcp::json::object();
    return *it;
}

#endif // XCONFIG_H
