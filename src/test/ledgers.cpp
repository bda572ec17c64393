#include "helpers.hpp"
#include "vault/pool_ledger.hpp"
#include "vault/pool_registry.hpp"
#include "vault/protocol_fees.hpp"
#include "vault/rollback_map.hpp"
#include "vault/transfer_plan.hpp"
#include "vault/user_ledger.hpp"
using namespace std;
using namespace vault;

void test_rollback_map()
{
    RollbackMap<int, int> m;
    m.set(1, 10);
    m.commit();
    m.set(1, 11);
    m.set(1, 12);
    m.set(2, 20);
    m.erase(1);
    assert(!m.contains(1) && m.get(2) == 20);
    assert(m.dirty());
    m.rollback();
    assert(m.get(1) == 10 && !m.contains(2));
    assert(!m.dirty());

    RollbackValue<int> v { 1 };
    v.set(2);
    v.set(3);
    v.rollback();
    assert(v.get() == 1);
    v.set(4);
    v.commit();
    v.rollback();
    assert(v.get() == 4);
}

void test_user_balances()
{
    UserLedger l;
    assert(l.balance(alice, tokA).is_zero());
    assert(l.increase(alice, tokA, 50) == Funds(50));
    assert(l.decrease(alice, tokA, 20) == Funds(30));
    expect_error(EBALANCE, [&]() { l.decrease(alice, tokA, 31); });
    assert(l.balance(alice, tokA) == Funds(30));
    l.increase(bob, tokA, 5);
    l.increase(alice, tokB, 7);
    assert(l.total(tokA) == Funds(35));
    auto b { l.balances(alice) };
    assert(b.size() == 2);
    assert(b[0].first == tokA && b[0].second == Funds(30));
    assert(b[1].first == tokB && b[1].second == Funds(7));

    l.decrease(alice, tokB, 7);
    assert(l.balances(alice).size() == 1); // zero balances are dropped

    l.increase(alice, tokA, Funds::max().value() - 30);
    expect_error(EBALANCEOVERFLOW, [&]() { l.increase(alice, tokA, 1); });
    l.commit();
}

void test_agents()
{
    UserLedger l;
    assert(l.is_agent_for(alice, alice));
    assert(!l.is_agent_for(alice, bob));
    assert(!l.add_agent(alice, alice));
    assert(l.add_agent(alice, bob));
    assert(!l.add_agent(alice, bob));
    assert(l.is_agent_for(alice, bob));
    assert(!l.is_agent_for(bob, alice));
    assert(l.agents(alice) == vector<Address> { bob });

    expect_error(ESELFAGENT, [&]() { l.remove_agent(alice, alice); });
    assert(!l.remove_agent(alice, carol));
    assert(l.remove_agent(alice, bob));
    assert(!l.is_agent_for(alice, bob));

    assert(l.add_universal_agent(carol));
    assert(l.is_agent_for(alice, carol) && l.is_agent_for(bob, carol));
    expect_error(EUNIVERSALAGENT, [&]() { l.remove_agent(alice, carol); });
    assert(l.universal_agents() == vector<Address> { carol });
    assert(l.remove_universal_agent(carol));
    assert(!l.is_agent_for(alice, carol));

    assert(l.add_universal_agent_manager(admin));
    assert(!l.add_universal_agent_manager(admin));
    assert(l.is_universal_agent_manager(admin));

    l.commit();
    l.add_agent(alice, bob);
    l.increase(alice, tokA, 1);
    l.remove_universal_agent_manager(admin);
    l.rollback();
    assert(!l.is_agent_for(alice, bob));
    assert(l.balance(alice, tokA).is_zero());
    assert(l.is_universal_agent_manager(admin));
}

void test_pool_ledger()
{
    PoolLedger l;
    const defi::PoolId pair { alice, defi::StrategyType::Pair, 0 };
    const defi::PoolId tuple { alice, defi::StrategyType::Tuple, 1 };
    expect_error(ENOPOOL, [&]() { l.balance(pair, tokA); });
    expect_error(ENOPOOL, [&]() { l.increase_cash(pair, tokA, 1); });
    l.create(pair);
    l.create(tuple);
    expect_error(EDUPLICATEPOOLID, [&]() { l.create(pair); });

    // pair pools keep two fixed slots
    l.increase_cash(pair, tokA, 100);
    l.increase_cash(pair, tokB, 100);
    expect_error(EPAIRTOKENS, [&]() { l.increase_cash(pair, tokC, 1); });
    l.decrease_cash(pair, tokA, 100);
    assert(l.tokens(pair) == (vector<Address> { tokA, tokB }));
    assert(l.has_token(pair, tokA));
    assert(l.balance(pair, tokA).is_zero());
    expect_error(EPAIRTOKENS, [&]() { l.increase_cash(pair, tokC, 1); });

    // tuple pools drop tokens with zero total
    l.increase_cash(tuple, tokA, 10);
    l.increase_cash(tuple, tokB, 10);
    l.increase_cash(tuple, tokC, 10);
    l.decrease_cash(tuple, tokA, 10);
    assert(l.tokens(tuple) == (vector<Address> { tokC, tokB }));
    assert(!l.has_token(tuple, tokA));

    // managed balances count towards the total
    auto b { l.invest(tuple, tokB, 4) };
    assert(b.get_cash() == Funds(6) && b.get_managed() == Funds(4));
    b = l.set_managed(tuple, tokB, 9);
    assert(b.total() == Funds(15));
    expect_error(EBALANCE, [&]() { l.invest(tuple, tokB, 7); });
    expect_error(EMANAGED, [&]() { l.divest(tuple, tokB, 10); });
    expect_error(ENOTOKEN, [&]() { l.set_managed(tuple, tokA, 1); });
    l.decrease_cash(tuple, tokB, 6);
    assert(l.has_token(tuple, tokB)); // managed only
    l.set_managed(tuple, tokB, 0);
    assert(!l.has_token(tuple, tokB));

    assert(l.total(tokB) == Funds(100));
    assert(l.cash(tokC) == Funds(10));

    l.commit();
    l.increase_cash(tuple, tokA, 5);
    l.decrease_cash(pair, tokB, 100);
    l.rollback();
    assert(!l.has_token(tuple, tokA));
    assert(l.balance(pair, tokB).get_cash() == Funds(100));
}

void test_registry()
{
    PoolRegistry r;
    FixedRate s;
    expect_error(EZEROCONTROLLER, [&]() { r.register_pool(Address::zero(), defi::StrategyType::Pair, s); });
    auto p0 { r.register_pool(alice, defi::StrategyType::Pair, s) };
    auto p1 { r.register_pool(alice, defi::StrategyType::Pair, s) };
    assert(p0.index == 0 && p1.index == 1);
    assert(p0 != p1 && r.count() == 2);
    assert(&r.strategy(p0) == &s);
    r.require_controller(p0, alice);
    expect_error(ECALLERNOTCONTROLLER, [&]() { r.require_controller(p0, bob); });
    const defi::PoolId unknown { alice, defi::StrategyType::Pair, 7 };
    expect_error(ENOPOOL, [&]() { r.strategy(unknown); });
    expect_error(ENOPOOL, [&]() { r.require_controller(unknown, alice); });

    r.commit();
    auto p2 { r.register_pool(bob, defi::StrategyType::Tuple, s) };
    r.set_manager(p0, tokA, carol);
    r.rollback();
    assert(!r.exists(p2) && r.count() == 2 && !r.manager(p0, tokA));
    // index is reused after rollback
    assert(r.register_pool(bob, defi::StrategyType::Tuple, s) == p2);
    assert(r.pools() == (vector<defi::PoolId> { p0, p1, p2 }));
}

void test_protocol_fees()
{
    expect_error(ESWAPFEE, []() { ProtocolFees({ .swap = fee("0.6") }); });
    ProtocolFees f({ .swap = fee("0.1") });
    assert(f.settings().swap == fee("0.1"));
    expect_error(EFLASHFEE, [&]() { f.set_flash_loan_fee(fee("0.02")); });
    expect_error(EWITHDRAWFEE, [&]() { f.set_withdraw_fee(fee("0.006")); });
    f.set_withdraw_fee(MAX_WITHDRAW_FEE);
    f.collect(tokA, 10);
    f.collect(tokA, 5);
    assert(f.collected(tokA) == Funds(15));
    expect_error(EFEEBALANCE, [&]() { f.withdraw(tokA, 16); });
    f.withdraw(tokA, 15);
    assert(f.all_collected().empty());
    f.rollback();
    assert(f.settings().withdraw.is_zero() && f.collected(tokA).is_zero());
}

void test_transfer_plan()
{
    MemoryBank bank(vaultAccount);
    bank.mint(tokA, alice, 100);
    bank.mint(tokB, vaultAccount, 10);

    TransferPlan ok(vaultAccount);
    ok.pull(tokA, alice, 60);
    ok.push(tokB, bob, 10);
    ok.push(tokB, bob, 0); // skipped
    assert(ok.get_pushes().size() == 1);
    ok.execute(bank);
    assert(bank.balance_of(tokA, alice) == Funds(40));
    assert(bank.custody(tokA) == Funds(60));
    assert(bank.balance_of(tokB, bob) == Funds(10));

    // second push fails, everything is undone
    TransferPlan failing(vaultAccount);
    failing.pull(tokA, alice, 40);
    failing.push(tokA, bob, 50);
    failing.push(tokB, bob, 1);
    expect_error(ETRANSFER, [&]() { failing.execute(bank); });
    assert(bank.balance_of(tokA, alice) == Funds(40));
    assert(bank.balance_of(tokA, bob).is_zero());
    assert(bank.custody(tokA) == Funds(60));

    // the custody account never trades with itself
    expect_error(ECUSTODYACCOUNT, [&]() { failing.pull(tokA, vaultAccount, 1); });
    expect_error(ECUSTODYACCOUNT, [&]() { failing.push(tokA, vaultAccount, 0); });
    expect_error(ETRANSFER, [&]() { bank.pull(tokA, vaultAccount, 1); });
    expect_error(ETRANSFER, [&]() { bank.push(tokA, vaultAccount, 1); });
    assert(bank.custody(tokA) == Funds(60));
}

int main()
{
    test_rollback_map();
    test_user_balances();
    test_agents();
    test_pool_ledger();
    test_registry();
    test_protocol_fees();
    test_transfer_plan();
    cout << "ledgers: all tests passed" << endl;
}
