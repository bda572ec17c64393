// errno macros are in scope before the vault error codes are declared
#include <cerrno>
#include <system_error>

#include "crypto/address.hpp"
#include "defi/cash_managed.hpp"
#include "defi/fee.hpp"
#include "defi/pool_id.hpp"
#include "defi/uint64/prod.hpp"
#include "general/funds.hpp"
#include "nlohmann/json.hpp"
#include <cassert>
#include <iostream>
using namespace std;

template <typename F>
int32_t thrown_code(F&& f)
{
    try {
        f();
    } catch (const Error& e) {
        return e.code;
    }
    return 0;
}

void test_funds()
{
    assert(Funds::sum(Funds::max(), 1) == std::nullopt);
    assert(thrown_code([]() { Funds::sum_throw(Funds::max(), 1); }) == EBALANCEOVERFLOW);
    assert(Funds::sum_throw(1, 2, 3) == Funds(6));
    assert(thrown_code([]() { Funds::diff_throw(1, 2); }) == EBALANCE);
    assert(thrown_code([]() { Funds::diff_throw(1, 2, EMANAGED); }) == EMANAGED);
    assert(Funds::diff_saturating(1, 2).is_zero());
    assert(Funds::diff_saturating(5, 2) == Funds(3));

    Funds f { 10 };
    assert(thrown_code([&]() { f.subtract_throw(11); }) == EBALANCE);
    assert(f == Funds(10)); // untouched on failure
    f.add_throw(5);
    assert(f.value() == 15);

    auto p { ParsedFunds::parse("1.25") };
    assert(p && p->v == 125 && p->decimalPlaces == 2);
    assert(p->scaled(4) == 12500u);
    assert(p->scaled(1) == std::nullopt);
    assert(!ParsedFunds::parse("1.2.3"));
    assert(!ParsedFunds::parse("-1"));
}

void test_prod128()
{
    const uint64_t m { std::numeric_limits<uint64_t>::max() };
    Prod128 p(m, m);
    assert(p.v0() == m - 1 && p.v1() == 1);
    assert(p.divide_floor(m) == m);
    assert(!p.divide_floor(m - 1)); // quotient exceeds 64 bits
    assert(!Prod128(1, 1).divide_floor(0));
    assert(Prod128(10, 3).divide_floor(4) == 7u);
    assert(Prod128(10, 3).divide_ceil(4) == 8u);
    assert(Prod128(10, 4).divide_ceil(4) == 10u);
}

void test_address()
{
    auto a { Address::from_number(0x2001) };
    assert(a.to_string() == "0x0000000000000000000000000000000000002001");
    assert(Address::parse("0000000000000000000000000000000000002001") == a);
    assert(Address::parse("0x0000000000000000000000000000000000002001") == a);
    assert(!Address::parse("0x00"));
    assert(!Address::parse("0x000000000000000000000000000000000000200g"));
    assert(thrown_code([]() { [[maybe_unused]] Address bad { std::string_view("nope") }; }) == EBADADDRESS);
    assert(Address::zero().is_zero());
    assert(!a.is_zero());
    assert(Address::from_number(1) < Address::from_number(2));
}

void test_fee_percentage()
{
    auto f { defi::FeePercentage::parse("0.003") };
    assert(f && f->value() == 3000000000000000u);
    assert(f->of(1001) == Funds(3));
    assert(f->of_ceil(1001) == Funds(4));
    assert(f->of_ceil(1000) == Funds(3));
    assert(f->to_string() == "0.003");
    assert(defi::FeePercentage().of_ceil(Funds::max()).is_zero());
    assert(defi::FeePercentage::parse("1")->of(Funds::max()) == Funds::max());
    assert(!defi::FeePercentage::parse("1.000000000000000001"));
    assert(!defi::FeePercentage::parse("0.0000000000000000001")); // 19 decimal places
    assert(thrown_code([]() { defi::FeePercentage::from_e18(defi::FeePercentage::ONE + 1); }) == EBADFEE);
    nlohmann::json j = *f;
    assert(j == "0.003");
}

void test_pool_id()
{
    using namespace defi;
    const auto controller { Address::from_number(0xabcdef) };
    const PoolId id { controller, StrategyType::Pair, 0x01020304 };
    auto bytes { id.encode() };
    assert(bytes.to_string() == "0x0000000000000102030400010000000000000000000000000000000000abcdef");
    assert(bytes.controller() == controller);
    assert(bytes.strategy() && *bytes.strategy() == StrategyType::Pair);
    auto decoded { bytes.decode() };
    assert(decoded && *decoded == id);

    auto parsed { PoolIdBytes::parse(bytes.to_string()) };
    assert(parsed && *parsed == bytes);
    assert(!PoolIdBytes::parse("0x1234"));
    assert(PoolIdBytes::parse("0x1234").error().code == EMALFORMED);

    auto reserved { bytes };
    reserved[0] = 1;
    assert(reserved.decode().error().code == EPOOLIDBITS);
    auto unknown { bytes };
    unknown[11] = 7;
    assert(unknown.decode().error().code == ESTRATEGYTYPE);

    assert(strategy_type(0).value() == StrategyType::Tuple);
    assert(strategy_type(2).error().code == ESTRATEGYTYPE);
    assert(parse_strategy_type("pair").value() == StrategyType::Pair);
    assert(!parse_strategy_type("triple"));
    assert(string(strategy_name(StrategyType::Tuple)) == "tuple");

    // ordering follows controller, then type, then index
    assert((PoolId { controller, StrategyType::Pair, 1 }) < (PoolId { controller, StrategyType::Pair, 2 }));
}

void test_cash_managed()
{
    using defi::CashManaged;
    auto b { CashManaged::zero() };
    b.increase_cash(100);
    b.invest(40);
    assert(b.get_cash() == Funds(60) && b.get_managed() == Funds(40) && b.total() == Funds(100));
    b.divest(40);
    assert(b == CashManaged::from_cash_managed(100, 0));

    assert(thrown_code([&]() { b.invest(101); }) == EBALANCE);
    assert(thrown_code([&]() { b.divest(1); }) == EMANAGED);
    assert(thrown_code([&]() { b.decrease_cash(101); }) == EBALANCE);
    assert(b == CashManaged::from_cash_managed(100, 0));

    b.set_managed(Funds(std::numeric_limits<uint64_t>::max() - 100));
    assert(b.total() == Funds::max());
    assert(thrown_code([&]() { b.increase_cash(1); }) == EBALANCEOVERFLOW);
    assert(thrown_code([&]() { b.set_managed(Funds(std::numeric_limits<uint64_t>::max() - 99)); }) == EBALANCEOVERFLOW);
    assert(b.get_cash() == Funds(100));
    assert(thrown_code([]() { CashManaged::from_cash_managed(Funds::max(), 1); }) == EBALANCEOVERFLOW);

    nlohmann::json j = CashManaged::from_cash_managed(3, 4);
    assert(j["cash"] == 3 && j["managed"] == 4 && j["total"] == 7);
}

void test_error_kinds()
{
    assert(Error(EBALANCE).kind() == ErrorKind::InsufficientFunds);
    assert(Error(ESENDERNOTAGENT).kind() == ErrorKind::Unauthorized);
    assert(Error(ENOPOOL).kind() == ErrorKind::NotFound);
    assert(Error(EBALANCEOVERFLOW).kind() == ErrorKind::InvariantViolation);
    assert(Error(EREENTRANCY).kind() == ErrorKind::ReentrancyBlocked);
    assert(Error(EFLASHNOTREPAID).kind() == ErrorKind::ExternalCallFailed);
    assert(Error(ELENGTHMISMATCH).kind() == ErrorKind::InvalidInput);
    assert(EBALANCEOVERFLOW == 502 && EBADMULTIHOP == 110);
    assert(Error(EBADMULTIHOP).kind() == ErrorKind::InvalidInput);
    assert(Error(ECUSTODYACCOUNT).kind() == ErrorKind::InvalidInput);
    assert(string(Error(EBALANCEOVERFLOW).err_name()) == "EBALANCEOVERFLOW");
    assert(string(Error(EPAIRTOKENS).err_name()) == "EPAIRTOKENS");
    assert(string(kind_name(Error(EBUG).kind())) == "Other");
}

int main()
{
    test_funds();
    test_prod128();
    test_address();
    test_fee_percentage();
    test_pool_id();
    test_cash_managed();
    test_error_kinds();
    cout << "primitives: all tests passed" << endl;
}
