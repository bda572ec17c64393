#include "sim/scenario.hpp"
#include "general/errors.hpp"
#include <cassert>
#include <fstream>
#include <iostream>
using namespace std;
using nlohmann::json;

namespace {
const Address vaultAccount { Address::from_number(0x7661756c74) };

json base_scenario()
{
    return json::parse(R"({
        "tokens": ["A", "B"],
        "accounts": {
            "alice": { "A": 1000, "B": 1000 },
            "bob": { "A": 100 },
            "gov": {}
        },
        "admins": ["gov"],
        "steps": [
            { "op": "register_pool", "name": "p", "controller": "alice", "strategy": "pair" },
            { "op": "add_liquidity", "caller": "alice", "pool": "p", "from": "alice",
              "tokens": ["A", "B"], "amounts": [500, 500] },
            { "op": "batch_swap", "caller": "bob", "tokens": ["A", "B"],
              "steps": [ { "pool": "p", "in": 0, "out": 1, "amount": 100 } ], "sender": "bob" },
            { "op": "withdraw", "caller": "bob", "token": "B", "amount": 1000 },
            { "op": "set_fee", "caller": "bob", "kind": "swap", "fee": "0.1" },
            { "op": "set_fee", "caller": "gov", "kind": "withdraw", "fee": "0.001" }
        ]
    })");
}

void check_custody(const json& report)
{
    for (auto& [token, c] : report["state"]["custody"].items())
        assert(c["held"] == c["accounted"]);
}
}

void test_report()
{
    json report = sim::run_scenario(base_scenario(), vaultAccount, {});
    auto& steps { report["steps"] };
    assert(steps.size() == 6);
    assert(steps[0]["status"] == "ok" && steps[0]["result"]["pool"] == "p");
    assert(steps[2]["result"]["A"]["in"] == 100);
    assert(steps[2]["result"]["B"]["out"] == 82);
    assert(steps[3]["status"] == "rejected");
    assert(steps[3]["error"] == "EBALANCE");
    assert(steps[3]["kind"] == "InsufficientFunds");
    assert(steps[4]["error"] == "ENOTALLOWED");
    assert(steps[5]["status"] == "ok");

    auto s { sim::summarize(report) };
    assert(s.executed == 6 && s.rejected == 2);
    assert(report["summary"]["rejected"] == 2);

    auto& events { report["events"] };
    assert(events[0]["event"] == "PoolRegistered");
    assert(events[0]["pool"] == "p");
    assert(events[0]["controller"] == "alice");

    auto& pool { report["state"]["pools"][0] };
    assert(pool["pool"] == "p" && pool["strategy"] == "pair");
    assert(pool["tokens"][0]["cash"] == 600);
    assert(pool["tokens"][1]["cash"] == 418);
    // the swap was the third committed call, the fee change the fourth
    assert(pool["last_change"] == 3);
    assert(pool["tokens"][0]["last_change"] == 3);
    assert(report["state"]["wallets"]["bob"]["B"] == 82);
    check_custody(report);
}

void test_malformed()
{
    json s = base_scenario();
    s["steps"].push_back(json { { "op", "explode" } });
    bool thrown { false };
    try {
        sim::run_scenario(s, vaultAccount, {});
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    s = base_scenario();
    s["steps"][1]["pool"] = "unknown";
    thrown = false;
    try {
        sim::run_scenario(s, vaultAccount, {});
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
}

// runs a scenario file given on the command line, every step must be
// accounted for and custody must match the ledgers
void test_file(const char* path)
{
    ifstream file(path);
    assert(file);
    json report = sim::run_scenario(json::parse(file), vaultAccount, {});
    assert(sim::summarize(report).executed > 0);
    check_custody(report);
}

int main(int argc, char** argv)
{
    test_report();
    test_malformed();
    if (argc > 1)
        test_file(argv[1]);
    cout << "scenario: all tests passed" << endl;
}
