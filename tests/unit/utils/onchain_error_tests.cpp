#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include "utils/onchain_error.h"

TEST_CASE("onchain error code tags stay stable")
{
    CHECK(onchainErrorCodeTag(OnchainErrorCode::NetRequestFailed) == QStringLiteral("ONC-NET-001"));
    CHECK(onchainErrorCodeTag(OnchainErrorCode::NetTimeout) == QStringLiteral("ONC-NET-002"));
    CHECK(onchainErrorCodeTag(OnchainErrorCode::RegistryLookupFailed) == QStringLiteral("ONC-REG-001"));
    CHECK(onchainErrorCodeTag(OnchainErrorCode::RegistryNoExplorers) == QStringLiteral("ONC-REG-002"));
    CHECK(onchainErrorCodeTag(OnchainErrorCode::ApiInvalidJson) == QStringLiteral("ONC-API-001"));
    CHECK(onchainErrorCodeTag(OnchainErrorCode::ToolInvalidArguments) == QStringLiteral("ONC-TOOL-001"));
    CHECK(onchainErrorCodeTag(OnchainErrorCode::ToolUnknown) == QStringLiteral("ONC-TOOL-002"));
    CHECK(onchainErrorCodeTag(OnchainErrorCode::ConfigInvalid) == QStringLiteral("ONC-CFG-001"));
}

TEST_CASE("formatOnchainError keeps message unchanged for None")
{
    const QString message = QStringLiteral("request failed: 404 Not Found");
    CHECK(formatOnchainError(OnchainErrorCode::None, message) == message);
}

TEST_CASE("formatOnchainError prefixes message with code tag")
{
    const QString formatted = formatOnchainError(OnchainErrorCode::NetTimeout, QStringLiteral("request failed: timeout"));
    CHECK(formatted == QStringLiteral("[ONC-NET-002] request failed: timeout"));
}

TEST_CASE("unknown enum values fallback to ONC-UNKNOWN tag")
{
    const OnchainErrorCode unknown = static_cast<OnchainErrorCode>(9999);
    CHECK(onchainErrorCodeTag(unknown) == QStringLiteral("ONC-UNKNOWN"));
}

TEST_CASE("exceptions carry the client-facing message and the code")
{
    const explorer_exception explorerError(OnchainErrorCode::RegistryNoExplorers, QStringLiteral("no explorers"));
    CHECK(std::string(explorerError.what()) == "no explorers");
    CHECK(explorerError.code() == OnchainErrorCode::RegistryNoExplorers);

    const tool_argument_exception argumentError(QStringLiteral("missing required argument: chain_id"));
    CHECK(argumentError.code() == OnchainErrorCode::ToolInvalidArguments);
    const tool_argument_exception unknownTool(QStringLiteral("tool not found: foo"), OnchainErrorCode::ToolUnknown);
    CHECK(unknownTool.code() == OnchainErrorCode::ToolUnknown);
}
