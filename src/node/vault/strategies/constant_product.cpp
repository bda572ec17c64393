#include "constant_product.hpp"
#include "defi/uint64/prod.hpp"

namespace vault {
namespace {
    constexpr uint64_t E4 { 10000 };

    uint64_t discount(uint64_t value, uint16_t feeE4)
    {
        return *Prod128(value, E4 - feeE4).divide_floor(E4);
    }
}

ConstantProductStrategy::ConstantProductStrategy(uint16_t feeE4, Funds minBalance)
    : feeE4(feeE4)
    , minBalance(minBalance)
{
    if (feeE4 >= E4)
        throw Error(EBADFEE);
}

Funds ConstantProductStrategy::amount_out(Funds balanceIn, Funds amountIn, Funds balanceOut, uint16_t feeE4)
{
    auto a0 { balanceIn.value() };
    auto b0 { balanceOut.value() };
    auto a1 { Funds::sum_throw(balanceIn, amountIn).value() };
    if (a1 == 0)
        return Funds::zero();
    // a0 * b0 / a1 <= b0 cannot overflow
    auto b1 { *Prod128(a0, b0).divide_ceil(a1) };
    return discount(b0 - b1, feeE4);
}

std::optional<Funds> ConstantProductStrategy::amount_in(Funds balanceIn, Funds amountOut, Funds balanceOut, uint16_t feeE4)
{
    auto b0 { balanceOut.value() };
    auto out { amountOut.value() };
    if (out == 0)
        return Funds::zero();
    // gross output before the pool fee
    auto gross { Prod128(out, E4).divide_ceil(E4 - feeE4) };
    if (!gross || *gross >= b0)
        return {};
    auto a0 { balanceIn.value() };
    auto a1 { Prod128(a0, b0).divide_ceil(b0 - *gross) };
    if (!a1)
        return {};
    return Funds(*a1 - a0);
}

SwapQuote ConstantProductStrategy::quote(const SwapRequest& r)
{
    if (r.balanceIn.is_zero() || r.balanceOut <= minBalance)
        return SwapQuote::insufficient_liquidity();
    const auto available { Funds::diff_throw(r.balanceOut, minBalance) };
    if (r.kind == SwapKind::GivenIn) {
        auto sum { Funds::sum(r.balanceIn, r.amount) };
        if (!sum)
            return SwapQuote::rejected();
        auto out { amount_out(r.balanceIn, r.amount, r.balanceOut, feeE4) };
        if (out > available)
            return SwapQuote::insufficient_liquidity();
        return SwapQuote::ok(out);
    } else {
        if (r.amount > available)
            return SwapQuote::insufficient_liquidity();
        auto in { amount_in(r.balanceIn, r.amount, r.balanceOut, feeE4) };
        if (!in)
            return SwapQuote::insufficient_liquidity();
        if (!Funds::sum(r.balanceIn, *in))
            return SwapQuote::rejected();
        return SwapQuote::ok(*in);
    }
}
}
