#pragma once
#include "vault/memory_bank.hpp"
#include "vault/vault.hpp"
#include <cassert>
#include <functional>
#include <iostream>
#include <set>

// asserts that f throws an Error with the given code
template <typename F>
void expect_error(int32_t code, F&& f)
{
    try {
        f();
    } catch (const Error& e) {
        if (e.code != code)
            std::cerr << "expected " << Error(code).err_name() << ", got " << e.err_name() << std::endl;
        assert(e.code == code);
        return;
    }
    std::cerr << "expected " << Error(code).err_name() << ", nothing thrown" << std::endl;
    assert(false);
}

inline const Address vaultAccount { Address::from_number(0x7661756c74) };
inline const Address alice { Address::from_number(0x2001) };
inline const Address bob { Address::from_number(0x2002) };
inline const Address carol { Address::from_number(0x2003) };
inline const Address admin { Address::from_number(0x2004) };
inline const Address tokA { Address::from_number(0x1001) };
inline const Address tokB { Address::from_number(0x1002) };
inline const Address tokC { Address::from_number(0x1003) };

inline defi::FeePercentage fee(std::string_view s)
{
    return *defi::FeePercentage::parse(s);
}

class AdminOnly : public vault::Authorizer {
public:
    bool can_perform(vault::Action, const Address& caller) const override
    {
        return caller == admin;
    }
};

// quotes a fixed ratio: out = in * num / den for given in,
// in = out * den / num for given out
class FixedRate : public vault::SwapStrategy {
public:
    FixedRate(uint64_t num = 1, uint64_t den = 1)
        : num(num)
        , den(den)
    {
    }
    vault::SwapQuote quote(const vault::SwapRequest& r) override
    {
        requests.push_back(r);
        if (r.kind == vault::SwapKind::GivenIn)
            return vault::SwapQuote::ok(r.amount.value() * num / den);
        return vault::SwapQuote::ok(r.amount.value() * den / num);
    }
    std::vector<vault::SwapRequest> requests;

private:
    uint64_t num;
    uint64_t den;
};

class Rejecting : public vault::SwapStrategy {
public:
    vault::SwapQuote quote(const vault::SwapRequest&) override
    {
        return vault::SwapQuote::rejected();
    }
};

class Throwing : public vault::SwapStrategy {
public:
    vault::SwapQuote quote(const vault::SwapRequest&) override
    {
        throw std::runtime_error("pool math failed");
    }
};

// Vault with an in-memory bank and an admin-only authorizer. Every
// account starts with 1000000 of each test token.
struct Fixture {
    Fixture(vault::FeeSettings fees = {})
        : bank(vaultAccount)
        , vault(bank, authorizer, fees)
    {
        for (auto& t : { tokA, tokB, tokC })
            for (auto& a : { alice, bob, carol, admin })
                bank.mint(t, a, 1000000);
        vault.subscribe([this](const vault::Event& e) { events.push_back(e); });
    }

    // pool of alice holding 1000 of tokA and tokB
    defi::PoolId funded_pool(defi::StrategyType type = defi::StrategyType::Pair)
    {
        auto id { vault.register_pool(alice, type, rate) };
        vault.add_liquidity(alice, id, alice, { tokA, tokB }, { 1000, 1000 }, false);
        return id;
    }

    // custody equals what the ledgers account for
    void check_custody() const
    {
        for (auto& t : { tokA, tokB, tokC })
            assert(bank.custody(t) == vault.accounted_custody(t));
    }

    template <typename T>
    size_t count_events() const
    {
        size_t n { 0 };
        for (auto& e : events)
            if (std::holds_alternative<T>(e))
                n += 1;
        return n;
    }

    AdminOnly authorizer;
    vault::MemoryBank bank;
    vault::Vault vault;
    FixedRate rate;
    std::vector<vault::Event> events;
};
