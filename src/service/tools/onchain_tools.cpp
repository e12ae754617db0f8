#include "service/tools/onchain_tools.h"

#include "service/explorer/explorer_api.h"
#include "service/tools/tool_args.h"
#include "utils/log_categories.h"
#include "xconfig.h"

namespace OnchainTools
{
namespace
{
mcp::json stringProperty(const char *description)
{
    mcp::json property;
    property["type"] = "string";
    property["description"] = description;
    return property;
}

mcp::json chainIdProperty()
{
    mcp::json property;
    property["type"] = "integer";
    property["format"] = "int32";
    property["description"] = "the chain id to query";
    return property;
}

mcp::json tokenIdProperty()
{
    mcp::json property;
    property["type"] = "integer";
    property["format"] = "uint64";
    property["minimum"] = 0;
    property["description"] = "the token id to query";
    return property;
}

using Api = ExplorerApi;

// 各形态的处理函数签名，参数已按 schema 读取
using BaseCall = mcp::json (Api::*)(int);
using HashCall = mcp::json (Api::*)(int, const QString &);
using InstanceCall = mcp::json (Api::*)(int, const QString &, quint64);

struct Builder
{
    ToolRegistry &registry;
    ExplorerApi &api;

    void add(const char *name, const char *description, Shape shape, ToolRegistry::Handler handler)
    {
        ToolRegistry::Entry entry;
        entry.name = QString::fromLatin1(name);
        entry.description = QString::fromLatin1(description);
        entry.inputSchema = inputSchema(shape);
        entry.handler = std::move(handler);
        if (!registry.add(std::move(entry)))
        {
            qCWarning(lcMcp) << "duplicate tool ignored:" << name;
        }
    }

    void base(const char *name, const char *description, BaseCall call)
    {
        ExplorerApi *target = &api;
        add(name, description, Shape::Base, [target, call](const mcp::json &args)
            { return (target->*call)(tool_args::requireChainId(args)); });
    }

    void hash(const char *name, const char *description, Shape shape, const char *key, HashCall call)
    {
        ExplorerApi *target = &api;
        add(name, description, shape, [target, call, key](const mcp::json &args)
            {
                const int chainId = tool_args::requireChainId(args);
                return (target->*call)(chainId, tool_args::requireString(args, key));
            });
    }

    void instance(const char *name, const char *description, InstanceCall call)
    {
        ExplorerApi *target = &api;
        add(name, description, Shape::TokenInstance, [target, call](const mcp::json &args)
            {
                const int chainId = tool_args::requireChainId(args);
                const QString token = tool_args::requireString(args, "token_address");
                return (target->*call)(chainId, token, tool_args::requireUnsigned(args, "token_id"));
            });
    }
};
} // namespace

mcp::json inputSchema(Shape shape)
{
    mcp::json properties = mcp::json::object();
    mcp::json required = mcp::json::array();
    auto require = [&](const char *key, mcp::json property)
    {
        properties[key] = std::move(property);
        required.push_back(key);
    };

    if (shape != Shape::Empty) require("chain_id", chainIdProperty());
    switch (shape)
    {
    case Shape::Search:
        require("q", stringProperty("the query to search, it can be token name, token symbol, address, transaction hash, block number, block hash"));
        break;
    case Shape::Transaction:
        require("transaction_hash", stringProperty("the transaction hash to query"));
        break;
    case Shape::Block:
        require("number_or_hash", stringProperty("the block number or block hash to query"));
        break;
    case Shape::Address:
        require("address_hash", stringProperty("the address hash to query"));
        break;
    case Shape::Token:
        require("token_address", stringProperty("the token address to query"));
        break;
    case Shape::TokenInstance:
        require("token_address", stringProperty("the token address to query"));
        require("token_id", tokenIdProperty());
        break;
    case Shape::Empty:
    case Shape::Base:
    default:
        break;
    }

    mcp::json schema;
    schema["type"] = "object";
    schema["properties"] = std::move(properties);
    if (!required.empty()) schema["required"] = std::move(required);
    return schema;
}

mcp::json merlinChainInfo()
{
    mcp::json info;
    info["chain_id"] = std::to_string(MERLIN_CHAIN_ID);
    info["native_token_symbol"] = MERLIN_NATIVE_TOKEN_SYMBOL;
    info["native_token_decimals"] = MERLIN_NATIVE_TOKEN_DECIMALS;
    info["note"] = MERLIN_NATIVE_TOKEN_NOTE;
    return info;
}

ToolRegistry build(ExplorerApi &api)
{
    ToolRegistry registry;
    Builder b{registry, api};
    ExplorerApi *target = &api;

    // 带可选查询参数的接口在工具层一律使用默认参数
    b.add("search", "Search chain data with token name, token symbol, account name, address, transaction hash", Shape::Search,
          [target](const mcp::json &args)
          {
              const int chainId = tool_args::requireChainId(args);
              SearchParams params;
              params.q = tool_args::requireString(args, "q");
              return target->search(chainId, params);
          });
    b.add("get_merlin_chain_info", "Get Merlin chain info", Shape::Empty,
          [](const mcp::json &) { return merlinChainInfo(); });

    b.add("get_transactions", "List latest 50 transactions", Shape::Base,
          [target](const mcp::json &args) { return target->getTransactions(tool_args::requireChainId(args)); });
    b.add("get_blocks", "List latest 50 blocks", Shape::Base,
          [target](const mcp::json &args) { return target->getBlocks(tool_args::requireChainId(args)); });
    b.base("get_transfers", "List latest 50 token transfers", &Api::getTransfers);
    b.base("get_internal_transactions", "List latest 50 internal transactions", &Api::getInternalTransactions);
    b.base("get_withdrawals", "List latest 50 withdrawals", &Api::getWithdrawals);
    b.base("get_chain_stats", "Get chain stats counters", &Api::getStats);

    b.hash("get_transaction_info", "Get transaction info", Shape::Transaction, "transaction_hash", &Api::getTransactionInfo);
    b.add("get_transaction_token_transfers", "Get transaction token transfers", Shape::Transaction,
          [target](const mcp::json &args)
          {
              const int chainId = tool_args::requireChainId(args);
              return target->getTransactionTokenTransfers(chainId, tool_args::requireString(args, "transaction_hash"));
          });
    b.hash("get_transaction_internal_transactions", "Get transaction internal transactions", Shape::Transaction, "transaction_hash",
           &Api::getTransactionInternalTransactions);
    b.hash("get_transaction_logs", "Get transaction logs", Shape::Transaction, "transaction_hash", &Api::getTransactionLogs);
    b.hash("get_transaction_summary", "Get transaction summary", Shape::Transaction, "transaction_hash", &Api::getTransactionSummary);

    b.hash("get_block_info", "Get block info", Shape::Block, "number_or_hash", &Api::getBlockInfo);
    b.hash("get_block_transactions", "Get block transactions", Shape::Block, "number_or_hash", &Api::getBlockTransactions);
    b.hash("get_block_withdrawals", "Get block withdrawals", Shape::Block, "number_or_hash", &Api::getBlockWithdrawals);

    b.base("get_addresses", "List top 50 native coin holders", &Api::getAddresses);
    b.hash("get_address_info", "Get address info", Shape::Address, "address_hash", &Api::getAddressInfo);
    b.hash("get_address_counters", "Get address counters", Shape::Address, "address_hash", &Api::getAddressCounters);
    b.add("get_address_transactions", "List latest 50 transactions of the address", Shape::Address,
          [target](const mcp::json &args)
          {
              const int chainId = tool_args::requireChainId(args);
              return target->getAddressTransactions(chainId, tool_args::requireString(args, "address_hash"));
          });
    b.add("get_address_token_transfers", "List latest 50 token transfers of the address", Shape::Address,
          [target](const mcp::json &args)
          {
              const int chainId = tool_args::requireChainId(args);
              return target->getAddressTokenTransfers(chainId, tool_args::requireString(args, "address_hash"));
          });
    b.add("get_address_internal_transactions", "List latest 50 internal transactions of the address", Shape::Address,
          [target](const mcp::json &args)
          {
              const int chainId = tool_args::requireChainId(args);
              return target->getAddressInternalTransactions(chainId, tool_args::requireString(args, "address_hash"));
          });
    b.add("get_address_tokens", "Get address tokens", Shape::Address,
          [target](const mcp::json &args)
          {
              const int chainId = tool_args::requireChainId(args);
              return target->getAddressTokens(chainId, tool_args::requireString(args, "address_hash"));
          });
    b.hash("get_address_coin_balance_history", "Get address coin balance history", Shape::Address, "address_hash",
           &Api::getAddressCoinBalanceHistory);
    b.hash("get_address_coin_balance_history_by_day", "Get address coin balance history by day", Shape::Address, "address_hash",
           &Api::getAddressCoinBalanceHistoryByDay);
    b.hash("get_address_withdrawals", "Get address withdrawals", Shape::Address, "address_hash", &Api::getAddressWithdrawals);
    b.add("get_address_nfts", "Get address NFTs", Shape::Address,
          [target](const mcp::json &args)
          {
              const int chainId = tool_args::requireChainId(args);
              return target->getAddressNfts(chainId, tool_args::requireString(args, "address_hash"));
          });
    b.add("get_address_nft_collections", "Get address NFT collections", Shape::Address,
          [target](const mcp::json &args)
          {
              const int chainId = tool_args::requireChainId(args);
              return target->getAddressNftCollections(chainId, tool_args::requireString(args, "address_hash"));
          });

    b.add("get_tokens", "List top 50 tokens with the most holders", Shape::Base,
          [target](const mcp::json &args) { return target->getTokens(tool_args::requireChainId(args)); });
    b.hash("get_token_info", "Get token info", Shape::Token, "token_address", &Api::getTokenInfo);
    b.hash("get_token_transfers", "List latest 50 transfers of the token", Shape::Token, "token_address", &Api::getTokenTransfers);
    b.hash("get_token_holders", "List top 50 holders of the token", Shape::Token, "token_address", &Api::getTokenHolders);
    b.hash("get_token_counters", "Get token counters", Shape::Token, "token_address", &Api::getTokenCounters);
    b.hash("get_token_instances", "List first 50 instances of the NFT", Shape::Token, "token_address", &Api::getTokenInstances);
    b.instance("get_token_instance_info", "Get NFT instance info", &Api::getTokenInstanceInfo);
    b.instance("get_token_instance_transfers", "List latest 50 transfers of the NFT instance", &Api::getTokenInstanceTransfers);
    b.instance("get_token_instance_holders", "List first 50 holders of the NFT instance", &Api::getTokenInstanceHolders);
    b.instance("get_token_instance_transfers_count", "Get the NFT instance transfers count", &Api::getTokenInstanceTransfersCount);

    return registry;
}
} // namespace OnchainTools
