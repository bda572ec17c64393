#include "settlement.hpp"
#include "general/logging.hpp"
#include "vault.hpp"

namespace vault {

namespace {
    struct PreviousStep {
        size_t tokenInIndex;
        size_t tokenOutIndex;
        Funds amountIn;
        Funds amountOut;
    };

    // amount given by a step, resolving multihop continuation
    Funds given_amount(SwapKind kind, const SwapStep& s, const std::optional<PreviousStep>& prev)
    {
        if (!s.amount.is_zero())
            return s.amount;
        if (!prev)
            throw Error(EBADMULTIHOP);
        if (kind == SwapKind::GivenIn) {
            if (prev->tokenOutIndex != s.tokenInIndex)
                throw Error(EBADMULTIHOP);
            return prev->amountOut;
        }
        if (prev->tokenInIndex != s.tokenOutIndex)
            throw Error(EBADMULTIHOP);
        return prev->amountIn;
    }
}

BatchSwapResult Vault::swap(SwapKind kind, const std::vector<SwapStep>& steps,
    const std::vector<Address>& tokens, const FundManagement& funds,
    const std::vector<SwapLimit>& limits, TransferPlan& plan)
{
    if (!limits.empty() && limits.size() != tokens.size())
        throw Error(ELENGTHMISMATCH);
    check_tokens(tokens);
    if (funds.sender == custodyAccount || funds.recipient == custodyAccount)
        throw Error(ECUSTODYACCOUNT);
    const auto swapFee { protocolFees.settings().swap };
    NetFlows flows(tokens.size());
    std::optional<PreviousStep> prev;

    for (size_t i = 0; i < steps.size(); ++i) {
        auto& s { steps[i] };
        if (s.tokenInIndex >= tokens.size() || s.tokenOutIndex >= tokens.size())
            throw Error(ETOKENINDEX);
        if (s.tokenInIndex == s.tokenOutIndex)
            throw Error(ESAMETOKEN);
        auto& tokenIn { tokens[s.tokenInIndex] };
        auto& tokenOut { tokens[s.tokenOutIndex] };
        auto given { given_amount(kind, s, prev) };

        auto& strategy { registry.strategy(s.pool) };
        if (!poolLedger.has_token(s.pool, tokenIn) || !poolLedger.has_token(s.pool, tokenOut))
            throw Error(ENOTOKEN);
        const auto balanceIn { poolLedger.balance(s.pool, tokenIn) };
        const auto balanceOut { poolLedger.balance(s.pool, tokenOut) };

        const SwapRequest request {
            .pool { s.pool },
            .kind = kind,
            .tokenIn { tokenIn },
            .tokenOut { tokenOut },
            .amount { given },
            .balanceIn { balanceIn.total() },
            .balanceOut { balanceOut.total() }
        };
        auto quote { external_call(ESWAPREJECTED, [&]() { return strategy.quote(request); }) };
        switch (quote.status) {
        case SwapQuote::Status::Ok:
            break;
        case SwapQuote::Status::Rejected:
            throw Error(ESWAPREJECTED);
        case SwapQuote::Status::InsufficientLiquidity:
            throw Error(EPOOLLIQUIDITY);
        }

        const Funds amountIn { kind == SwapKind::GivenIn ? given : quote.amount };
        const Funds amountOut { kind == SwapKind::GivenIn ? quote.amount : given };
        if (amountOut > balanceOut.get_cash())
            throw Error(EPOOLLIQUIDITY);

        // protocol share of the input never reaches the pool
        auto fee { swapFee.of_ceil(amountIn) };
        poolLedger.increase_cash(s.pool, tokenIn, Funds::diff_throw(amountIn, fee));
        poolLedger.decrease_cash(s.pool, tokenOut, amountOut);
        protocolFees.collect(tokenIn, fee);
        flows.add_in(s.tokenInIndex, amountIn);
        flows.add_out(s.tokenOutIndex, amountOut);

        emit(events::Swap { s.pool, tokenIn, tokenOut, amountIn, amountOut, fee });
        log_settlement("Swap step {} on pool {}: {} of {} in, {} of {} out, protocol fee {}",
            i, s.pool.to_string(), amountIn.value(), tokenIn.to_string(),
            amountOut.value(), tokenOut.to_string(), fee.value());
        prev = PreviousStep { s.tokenInIndex, s.tokenOutIndex, amountIn, amountOut };
    }

    // settle once per token
    BatchSwapResult res;
    for (size_t i = 0; i < tokens.size(); ++i) {
        auto& token { tokens[i] };
        const auto in { flows.net_in(i) };
        const auto out { flows.net_out(i) };
        if (!limits.empty() && (in > limits[i].maxIn || out < limits[i].minOut))
            throw Error(ESWAPLIMIT);
        if (!in.is_zero()) {
            Funds fromUser { 0 };
            if (funds.fromUserBalance) {
                fromUser = min(userLedger.balance(funds.sender, token), in);
                debit_user(funds.sender, token, fromUser);
            }
            plan.pull(token, funds.sender, Funds::diff_throw(in, fromUser));
        }
        if (!out.is_zero()) {
            if (funds.toUserBalance)
                credit_user(funds.recipient, token, out);
            else
                plan.push(token, funds.recipient, out);
        }
        log_settlement("Settle {}: {} in, {} out", token.to_string(), in.value(), out.value());
        res.sentIn.push_back(in);
        res.receivedOut.push_back(out);
    }
    return res;
}
}
