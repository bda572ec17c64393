#pragma once
#include "crypto/address.hpp"
#include "defi/pool_id.hpp"
#include "general/funds.hpp"
#include <cstdint>
#include <vector>

namespace vault {

// Physical token movement in and out of the vault's custody.
// Implementations signal failure by throwing.
class TokenTransfer {
public:
    virtual ~TokenTransfer() = default;
    // moves tokens from `from` into vault custody
    virtual void pull(const Address& token, const Address& from, Funds amount) = 0;
    // moves tokens from vault custody to `to`
    virtual void push(const Address& token, const Address& to, Funds amount) = 0;
    // amount of `token` currently held by the vault
    virtual Funds custody(const Address& token) const = 0;
    // account holding the vault's tokens
    virtual Address custody_account() const = 0;
};

enum class SwapKind : uint8_t {
    GivenIn, // amount specifies the input, quote is the output
    GivenOut // amount specifies the output, quote is the input
};
const char* swap_kind_name(SwapKind);

struct SwapRequest {
    defi::PoolId pool;
    SwapKind kind;
    Address tokenIn;
    Address tokenOut;
    Funds amount;
    Funds balanceIn; // pool total of tokenIn
    Funds balanceOut; // pool total of tokenOut
};

struct SwapQuote {
    enum class Status : uint8_t {
        Ok,
        Rejected,
        InsufficientLiquidity
    } status;
    Funds amount;
    static SwapQuote ok(Funds amount) { return { Status::Ok, amount }; }
    static SwapQuote rejected() { return { Status::Rejected, 0 }; }
    static SwapQuote insufficient_liquidity() { return { Status::InsufficientLiquidity, 0 }; }
};

// Trading math of a pool controller.
class SwapStrategy {
public:
    virtual ~SwapStrategy() = default;
    virtual SwapQuote quote(const SwapRequest&) = 0;
};

class FlashLoanReceiver {
public:
    virtual ~FlashLoanReceiver() = default;
    // must have returned amounts plus fees to the vault when returning
    virtual void receive_flash_loan(const std::vector<Address>& tokens,
        const std::vector<Funds>& amounts,
        const std::vector<Funds>& fees,
        const std::vector<uint8_t>& data)
        = 0;
};

enum class Action : uint8_t {
    ManageUniversalAgentManagers,
    SetProtocolFees,
    WithdrawCollectedFees
};
const char* action_name(Action);

class Authorizer {
public:
    virtual ~Authorizer() = default;
    virtual bool can_perform(Action, const Address& caller) const = 0;
};
}
