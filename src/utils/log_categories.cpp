#include "log_categories.h"

Q_LOGGING_CATEGORY(lcApp, "onchain.app")
Q_LOGGING_CATEGORY(lcMcp, "onchain.mcp")
Q_LOGGING_CATEGORY(lcExplorer, "onchain.explorer")
Q_LOGGING_CATEGORY(lcNet, "onchain.net")
Q_LOGGING_CATEGORY(lcFlow, "onchain.flow")
