#pragma once
#include "vault/collaborators.hpp"

namespace vault {

// x * y = k pool math with a pool fee in basis points taken from the
// output. Swaps leaving less than minBalance of the output token are
// rejected for insufficient liquidity.
class ConstantProductStrategy : public SwapStrategy {
public:
    ConstantProductStrategy(uint16_t feeE4 = 30, Funds minBalance = 1);
    SwapQuote quote(const SwapRequest&) override;

    static Funds amount_out(Funds balanceIn, Funds amountIn, Funds balanceOut, uint16_t feeE4);
    // smallest input that yields at least amountOut, nullopt on overflow
    static std::optional<Funds> amount_in(Funds balanceIn, Funds amountOut, Funds balanceOut, uint16_t feeE4);

private:
    uint16_t feeE4;
    Funds minBalance;
};
}
