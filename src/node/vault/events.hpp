#pragma once
#include "defi/cash_managed.hpp"
#include "defi/fee.hpp"
#include "defi/pool_id.hpp"
#include "nlohmann/json_fwd.hpp"
#include <optional>
#include <variant>
#include <vector>

namespace vault {
namespace events {
    struct PoolRegistered {
        defi::PoolId pool;
    };
    struct PoolBalanceChanged {
        defi::PoolId pool;
        Address account;
        bool added;
        std::vector<Address> tokens;
        std::vector<Funds> amounts;
    };
    struct Swap {
        defi::PoolId pool;
        Address tokenIn;
        Address tokenOut;
        Funds amountIn;
        Funds amountOut;
        Funds protocolFee;
    };
    struct ManagerChanged {
        defi::PoolId pool;
        Address token;
        std::optional<Address> manager;
    };
    struct ManagedBalanceChanged {
        defi::PoolId pool;
        Address token;
        Address manager;
        defi::CashManaged balance;
    };
    struct UserBalanceChanged {
        Address user;
        Address token;
        Funds balance;
    };
    struct FlashLoan {
        Address receiver;
        Address token;
        Funds amount;
        Funds fee;
    };
    struct ProtocolFeeChanged {
        const char* kind; // "swap", "flash-loan" or "withdraw"
        defi::FeePercentage fee;
    };
}

using Event = std::variant<events::PoolRegistered,
    events::PoolBalanceChanged,
    events::Swap,
    events::ManagerChanged,
    events::ManagedBalanceChanged,
    events::UserBalanceChanged,
    events::FlashLoan,
    events::ProtocolFeeChanged>;

const char* event_name(const Event&);
nlohmann::json to_json(const Event&);
}
