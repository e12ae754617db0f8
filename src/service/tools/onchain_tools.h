#ifndef ONCHAIN_TOOLS_H
#define ONCHAIN_TOOLS_H

#include "mcp_json.h"
#include "service/tools/tool_registry.h"

class ExplorerApi;

// 链上数据工具目录：每个工具校验参数后调用 ExplorerApi 对应接口
namespace OnchainTools
{
// 请求参数形态，对应 inputSchema 中的必填字段
enum class Shape
{
    Empty,
    Base,          // chain_id
    Search,        // chain_id, q
    Transaction,   // chain_id, transaction_hash
    Block,         // chain_id, number_or_hash
    Address,       // chain_id, address_hash
    Token,         // chain_id, token_address
    TokenInstance, // chain_id, token_address, token_id
};

mcp::json inputSchema(Shape shape);

// Merlin 链原生代币说明，get_merlin_chain_info 直接返回
mcp::json merlinChainInfo();

// api 需在返回的注册表使用期间保持有效
ToolRegistry build(ExplorerApi &api);
} // namespace OnchainTools

#endif // ONCHAIN_TOOLS_H
