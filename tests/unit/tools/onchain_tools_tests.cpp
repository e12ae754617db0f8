#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <memory>

#include "common/FakeHttpFetcher.h"
#include "common/TestUtils.h"
#include "service/explorer/explorer_api.h"
#include "service/tools/onchain_tools.h"
#include "utils/onchain_error.h"

using onchain::test::FakeHttpFetcher;

namespace
{
const QString kRegistry = QStringLiteral("https://chains.blockscout.com/api/chains/");
const QString kMerlin = QStringLiteral("https://scan.merlinverify.com/api/v2/");

struct ToolsFixture
{
    FakeHttpFetcher *fetcher = nullptr;
    std::unique_ptr<ExplorerApi> api;
    ToolRegistry registry;

    ToolsFixture()
    {
        auto owned = std::make_unique<FakeHttpFetcher>();
        fetcher = owned.get();
        api = std::make_unique<ExplorerApi>(std::move(owned), kRegistry);
        registry = OnchainTools::build(*api);
    }
};

QStringList toolNames(const ToolRegistry &registry)
{
    QStringList names;
    for (const auto &entry : registry.entries()) names << entry.name;
    return names;
}
} // namespace

TEST_CASE("catalogue lists every tool in order")
{
    ToolsFixture f;
    const QStringList expected = {
        "search", "get_merlin_chain_info", "get_transactions", "get_blocks", "get_transfers", "get_internal_transactions",
        "get_withdrawals", "get_chain_stats", "get_transaction_info", "get_transaction_token_transfers",
        "get_transaction_internal_transactions", "get_transaction_logs", "get_transaction_summary", "get_block_info",
        "get_block_transactions", "get_block_withdrawals", "get_addresses", "get_address_info", "get_address_counters",
        "get_address_transactions", "get_address_token_transfers", "get_address_internal_transactions", "get_address_tokens",
        "get_address_coin_balance_history", "get_address_coin_balance_history_by_day", "get_address_withdrawals",
        "get_address_nfts", "get_address_nft_collections", "get_tokens", "get_token_info", "get_token_transfers",
        "get_token_holders", "get_token_counters", "get_token_instances", "get_token_instance_info",
        "get_token_instance_transfers", "get_token_instance_holders", "get_token_instance_transfers_count"};
    CHECK(toolNames(f.registry) == expected);
    CHECK(f.registry.size() == 38);
    CHECK(f.registry.find(QStringLiteral("get_address_logs")) == nullptr);
}

TEST_CASE("descriptions match the catalogue")
{
    ToolsFixture f;
    CHECK(f.registry.find(QStringLiteral("search"))->description ==
          QStringLiteral("Search chain data with token name, token symbol, account name, address, transaction hash"));
    CHECK(f.registry.find(QStringLiteral("get_chain_stats"))->description == QStringLiteral("Get chain stats counters"));
    CHECK(f.registry.find(QStringLiteral("get_tokens"))->description == QStringLiteral("List top 50 tokens with the most holders"));
    CHECK(f.registry.find(QStringLiteral("get_token_instance_transfers_count"))->description ==
          QStringLiteral("Get the NFT instance transfers count"));
}

TEST_CASE("input schemas declare the required fields per shape")
{
    const mcp::json empty = OnchainTools::inputSchema(OnchainTools::Shape::Empty);
    CHECK(empty["type"] == "object");
    CHECK(empty["properties"].empty());
    CHECK_FALSE(empty.contains("required"));

    const mcp::json base = OnchainTools::inputSchema(OnchainTools::Shape::Base);
    CHECK(base["required"] == mcp::json::array({"chain_id"}));
    CHECK(base["properties"]["chain_id"]["type"] == "integer");
    CHECK(base["properties"]["chain_id"]["description"] == "the chain id to query");

    const mcp::json instance = OnchainTools::inputSchema(OnchainTools::Shape::TokenInstance);
    CHECK(instance["required"] == mcp::json::array({"chain_id", "token_address", "token_id"}));
    CHECK(instance["properties"]["token_id"]["minimum"] == 0);
    CHECK(instance["properties"]["token_address"]["type"] == "string");

    CHECK(OnchainTools::inputSchema(OnchainTools::Shape::Block)["required"] == mcp::json::array({"chain_id", "number_or_hash"}));
    CHECK(OnchainTools::inputSchema(OnchainTools::Shape::Address)["required"] == mcp::json::array({"chain_id", "address_hash"}));
    CHECK(OnchainTools::inputSchema(OnchainTools::Shape::Transaction)["required"] == mcp::json::array({"chain_id", "transaction_hash"}));
    CHECK(OnchainTools::inputSchema(OnchainTools::Shape::Search)["required"] == mcp::json::array({"chain_id", "q"}));
}

TEST_CASE("get_merlin_chain_info answers locally")
{
    ToolsFixture f;
    const mcp::json result = f.registry.call(QStringLiteral("get_merlin_chain_info"), mcp::json::object());
    const mcp::json info = mcp::json::parse(result["content"][0]["text"].get<std::string>());
    CHECK(info == OnchainTools::merlinChainInfo());
    CHECK(info["chain_id"] == "4200");
    CHECK(info["native_token_symbol"] == "BTC");
    CHECK(info["native_token_decimals"] == "18");
    CHECK(info.begin().key() == "chain_id");
    CHECK(f.fetcher->requests().isEmpty());
}

TEST_CASE("search forwards the query string")
{
    ToolsFixture f;
    f.fetcher->respondJson(kMerlin + QStringLiteral("search?q=MBTC"), mcp::json::parse(R"({"items":[{"name":"MBTC"}]})"));
    const mcp::json result = f.registry.call(QStringLiteral("search"), mcp::json{{"chain_id", 4200}, {"q", "MBTC"}});
    CHECK(result["isError"] == false);
    CHECK(mcp::json::parse(result["content"][0]["text"].get<std::string>())["items"][0]["name"] == "MBTC");
}

TEST_CASE("token instance tools pass the numeric id through")
{
    ToolsFixture f;
    f.fetcher->respondJson(kMerlin + QStringLiteral("tokens/0xnft/instances/12/holders"), mcp::json::object());
    const mcp::json args = mcp::json::parse(R"({"chain_id":4200,"token_address":"0xnft","token_id":12})");
    CHECK_NOTHROW(f.registry.call(QStringLiteral("get_token_instance_holders"), args));
    CHECK(f.fetcher->requestCount(kMerlin + QStringLiteral("tokens/0xnft/instances/12/holders")) == 1);
}

TEST_CASE("block tools accept numbers or hashes as strings")
{
    ToolsFixture f;
    f.fetcher->respondJson(kMerlin + QStringLiteral("blocks/latest/transactions"), mcp::json::object());
    CHECK_NOTHROW(f.registry.call(QStringLiteral("get_block_transactions"),
                                  mcp::json{{"chain_id", 4200}, {"number_or_hash", "latest"}}));
}

TEST_CASE("dot path segments are invalid arguments")
{
    ToolsFixture f;
    f.fetcher->respondJson(kMerlin + QStringLiteral("transactions"), mcp::json::array());
    CHECK_THROWS_AS(f.registry.call(QStringLiteral("get_block_transactions"),
                                    mcp::json{{"chain_id", 4200}, {"number_or_hash", ".."}}),
                    tool_argument_exception);
    CHECK_THROWS_AS(f.registry.call(QStringLiteral("get_address_info"), mcp::json{{"chain_id", 4200}, {"address_hash", "."}}),
                    tool_argument_exception);
    CHECK(f.fetcher->requests().isEmpty());
}

TEST_CASE("argument errors are raised before any request")
{
    ToolsFixture f;
    CHECK_THROWS_AS(f.registry.call(QStringLiteral("get_chain_stats"), mcp::json::object()), tool_argument_exception);
    CHECK_THROWS_AS(f.registry.call(QStringLiteral("get_address_info"), mcp::json{{"chain_id", 4200}}), tool_argument_exception);
    CHECK_THROWS_AS(f.registry.call(QStringLiteral("get_token_instance_info"),
                                    mcp::json::parse(R"({"chain_id":4200,"token_address":"0x1","token_id":-3})")),
                    tool_argument_exception);
    CHECK(f.fetcher->requests().isEmpty());
}

TEST_CASE("explorer failures surface as explorer_exception")
{
    ToolsFixture f;
    CHECK_THROWS_WITH_AS(f.registry.call(QStringLiteral("get_chain_stats"), mcp::json{{"chain_id", 4200}}), "request failed: 404 Not Found",
                         explorer_exception);
}
