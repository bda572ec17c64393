#include "scenario.hpp"
#include "spdlog/spdlog.h"
#include "vault/memory_bank.hpp"
#include "vault/strategies/constant_product.hpp"
#include "vault/vault.hpp"
#include <memory>
#include <set>

using nlohmann::json;
using namespace std::string_literals;

namespace sim {
namespace {
    constexpr uint64_t tokenBase { 0x1000 };
    constexpr uint64_t accountBase { 0x2000 };

    class AdminAuthorizer : public vault::Authorizer {
    public:
        void add(const Address& a) { admins.insert(a); }
        bool can_perform(vault::Action, const Address& caller) const override
        {
            return admins.contains(caller);
        }

    private:
        std::set<Address> admins;
    };

    // pays back principal plus fee plus `extra` from the receiver's own
    // bank balance, or nothing
    class ScriptedReceiver : public vault::FlashLoanReceiver {
    public:
        ScriptedReceiver(vault::MemoryBank& bank, Address account, bool repay, Funds extra)
            : bank(bank)
            , account(std::move(account))
            , repay(repay)
            , extra(extra)
        {
        }
        void receive_flash_loan(const std::vector<Address>& tokens,
            const std::vector<Funds>& amounts,
            const std::vector<Funds>& fees,
            const std::vector<uint8_t>&) override
        {
            if (!repay)
                return;
            for (size_t i = 0; i < tokens.size(); ++i)
                bank.transfer(tokens[i], account, bank.vault_account(),
                    Funds::sum_throw(amounts[i], fees[i], extra));
        }

    private:
        vault::MemoryBank& bank;
        Address account;
        bool repay;
        Funds extra;
    };

    std::runtime_error malformed(const std::string& what)
    {
        return std::runtime_error("Malformed scenario: " + what);
    }

    class Runner {
    public:
        Runner(const Address& vaultAccount, const vault::FeeSettings& fees)
            : bank(vaultAccount)
            , engine(bank, authorizer, fees)
        {
            name(vaultAccount, "vault");
            engine.subscribe([this](const vault::Event& e) {
                events.push_back(render(vault::to_json(e)));
            });
        }

        json run(const json& scenario);

    private:
        void name(const Address& a, const std::string& n)
        {
            names.insert_or_assign(n, a);
            reverse.insert_or_assign(a, n);
        }
        void setup(const json& scenario);
        json step(const json& s);
        json state() const;

        // scenario values
        Address address(const json& j) const;
        std::vector<Address> addresses(const json& j) const;
        static Funds amount(const json& j);
        static std::vector<Funds> amounts(const json& j);
        defi::PoolId pool(const json& j) const;
        static defi::FeePercentage fee(const json& j);

        std::string label(const Address& a) const
        {
            if (auto iter { reverse.find(a) }; iter != reverse.end())
                return iter->second;
            return a.to_string();
        }
        std::string label(const defi::PoolId& id) const
        {
            if (auto iter { poolNames.find(id) }; iter != poolNames.end())
                return iter->second;
            return id.to_string();
        }
        // replaces known addresses and pool ids by their names
        json render(json j) const;
        json swap_result(const vault::BatchSwapResult&, const std::vector<Address>& tokens) const;
        json batch_swap(const json& s, bool query);

        std::vector<std::unique_ptr<vault::ConstantProductStrategy>> strategies;
        std::vector<Address> tokens;
        std::set<Address> accounts;
        std::map<std::string, Address> names;
        std::map<Address, std::string> reverse;
        std::map<std::string, defi::PoolId> pools;
        std::map<defi::PoolId, std::string> poolNames;
        AdminAuthorizer authorizer;
        vault::MemoryBank bank;
        vault::Vault engine;
        json events = json::array();
    };

    Address Runner::address(const json& j) const
    {
        if (!j.is_string())
            throw malformed("expected account or token name, got " + j.dump());
        auto s { j.get<std::string>() };
        if (auto iter { names.find(s) }; iter != names.end())
            return iter->second;
        if (auto a { Address::parse(s) })
            return *a;
        throw malformed("unknown name \"" + s + "\"");
    }

    std::vector<Address> Runner::addresses(const json& j) const
    {
        std::vector<Address> out;
        for (auto& e : j)
            out.push_back(address(e));
        return out;
    }

    Funds Runner::amount(const json& j)
    {
        if (!j.is_number_unsigned())
            throw malformed("expected unsigned amount, got " + j.dump());
        return Funds(j.get<uint64_t>());
    }

    std::vector<Funds> Runner::amounts(const json& j)
    {
        std::vector<Funds> out;
        for (auto& e : j)
            out.push_back(amount(e));
        return out;
    }

    defi::PoolId Runner::pool(const json& j) const
    {
        auto s { j.get<std::string>() };
        if (auto iter { pools.find(s) }; iter != pools.end())
            return iter->second;
        auto b { defi::PoolIdBytes::parse(s) };
        if (!b)
            throw malformed("unknown pool \"" + s + "\"");
        auto id { b->decode() };
        if (!id)
            throw malformed("invalid pool id \"" + s + "\": " + id.error().format());
        return *id;
    }

    defi::FeePercentage Runner::fee(const json& j)
    {
        auto s { j.get<std::string>() };
        if (auto f { defi::FeePercentage::parse(s) })
            return *f;
        throw malformed("invalid fee \"" + s + "\"");
    }

    json Runner::render(json j) const
    {
        if (j.is_string()) {
            auto s { j.get<std::string>() };
            if (auto a { Address::parse(s) }) {
                if (auto iter { reverse.find(*a) }; iter != reverse.end())
                    return iter->second;
            } else if (auto b { defi::PoolIdBytes::parse(s) }) {
                if (auto id { b->decode() })
                    return label(*id);
            }
            return j;
        }
        if (j.is_object() || j.is_array()) {
            for (auto& e : j)
                e = render(e);
        }
        return j;
    }

    void Runner::setup(const json& scenario)
    {
        uint64_t i { 0 };
        for (auto& t : scenario.value("tokens", json::array())) {
            auto a { Address::from_number(tokenBase + i++) };
            name(a, t.get<std::string>());
            tokens.push_back(a);
        }
        i = 0;
        const json accountsJson = scenario.value("accounts", json::object());
        for (auto& [n, minted] : accountsJson.items()) {
            auto a { Address::from_number(accountBase + i++) };
            name(a, n);
            accounts.insert(a);
            for (auto& [t, v] : minted.items())
                bank.mint(address(json(t)), a, amount(v));
        }
        for (auto& admin : scenario.value("admins", json::array()))
            authorizer.add(address(admin));
    }

    json Runner::swap_result(const vault::BatchSwapResult& r, const std::vector<Address>& batchTokens) const
    {
        json out(json::object());
        for (size_t i = 0; i < batchTokens.size(); ++i) {
            out[label(batchTokens[i])] = {
                { "in", r.sentIn[i].value() },
                { "out", r.receivedOut[i].value() }
            };
        }
        return out;
    }

    json Runner::batch_swap(const json& s, bool query)
    {
        auto kindName { s.value("kind", "given-in"s) };
        vault::SwapKind kind;
        if (kindName == "given-in")
            kind = vault::SwapKind::GivenIn;
        else if (kindName == "given-out")
            kind = vault::SwapKind::GivenOut;
        else
            throw malformed("unknown swap kind \"" + kindName + "\"");

        auto batchTokens { addresses(s.at("tokens")) };
        std::vector<vault::SwapStep> steps;
        for (auto& e : s.at("steps")) {
            steps.push_back({ .pool { pool(e.at("pool")) },
                .tokenInIndex = e.at("in").get<size_t>(),
                .tokenOutIndex = e.at("out").get<size_t>(),
                .amount { amount(e.value("amount", json(0u))) } });
        }
        const vault::FundManagement funds {
            .sender { address(s.at("sender")) },
            .fromUserBalance = s.value("from_user_balance", false),
            .recipient { address(s.value("recipient", s.at("sender"))) },
            .toUserBalance = s.value("to_user_balance", false)
        };
        if (query)
            return swap_result(engine.query_batch_swap(kind, steps, batchTokens, funds), batchTokens);
        std::vector<vault::SwapLimit> limits;
        for (auto& l : s.value("limits", json::array())) {
            vault::SwapLimit limit;
            if (l.contains("max_in"))
                limit.maxIn = amount(l["max_in"]);
            if (l.contains("min_out"))
                limit.minOut = amount(l["min_out"]);
            limits.push_back(limit);
        }
        return swap_result(engine.batch_swap(address(s.at("caller")), kind, steps, batchTokens, funds, limits), batchTokens);
    }

    json Runner::step(const json& s)
    {
        auto op { s.at("op").get<std::string>() };
        auto caller = [&]() { return address(s.at("caller")); };
        if (op == "register_pool") {
            auto type { defi::parse_strategy_type(s.value("strategy", "pair"s)).value_throw() };
            auto fee { s.value("fee_e4", uint16_t(30)) };
            strategies.push_back(std::make_unique<vault::ConstantProductStrategy>(fee, amount(s.value("min_balance", json(1u)))));
            auto id { engine.register_pool(address(s.at("controller")), type, *strategies.back()) };
            auto n { s.value("name", id.to_string()) };
            pools.insert_or_assign(n, id);
            poolNames.insert_or_assign(id, n);
            return { { "pool", n }, { "id", id.to_string() } };
        }
        if (op == "add_liquidity") {
            engine.add_liquidity(caller(), pool(s.at("pool")), address(s.at("from")),
                addresses(s.at("tokens")), amounts(s.at("amounts")), s.value("use_user_balance", false));
            return nullptr;
        }
        if (op == "remove_liquidity") {
            engine.remove_liquidity(caller(), pool(s.at("pool")), address(s.at("to")),
                addresses(s.at("tokens")), amounts(s.at("amounts")), s.value("to_user_balance", false));
            return nullptr;
        }
        if (op == "deposit") {
            engine.deposit(caller(), address(s.at("token")), amount(s.at("amount")), address(s.value("user", s.at("caller"))));
            return nullptr;
        }
        if (op == "withdraw") {
            engine.withdraw(caller(), address(s.value("user", s.at("caller"))), address(s.at("token")),
                amount(s.at("amount")), address(s.value("recipient", s.at("caller"))));
            return nullptr;
        }
        if (op == "transfer_user_balance") {
            engine.transfer_user_balance(caller(), address(s.at("from")), address(s.at("token")),
                amount(s.at("amount")), address(s.at("to")));
            return nullptr;
        }
        if (op == "add_agent") {
            engine.add_agent(caller(), address(s.at("agent")));
            return nullptr;
        }
        if (op == "remove_agent") {
            engine.remove_agent(caller(), address(s.at("agent")));
            return nullptr;
        }
        if (op == "add_universal_agent") {
            engine.add_universal_agent(caller(), address(s.at("agent")));
            return nullptr;
        }
        if (op == "remove_universal_agent") {
            engine.remove_universal_agent(caller(), address(s.at("agent")));
            return nullptr;
        }
        if (op == "add_universal_agent_manager") {
            engine.add_universal_agent_manager(caller(), address(s.at("manager")));
            return nullptr;
        }
        if (op == "remove_universal_agent_manager") {
            engine.remove_universal_agent_manager(caller(), address(s.at("manager")));
            return nullptr;
        }
        if (op == "authorize_manager") {
            engine.authorize_pool_investment_manager(caller(), pool(s.at("pool")), address(s.at("token")), address(s.at("manager")));
            return nullptr;
        }
        if (op == "revoke_manager") {
            engine.revoke_pool_investment_manager(caller(), pool(s.at("pool")), address(s.at("token")));
            return nullptr;
        }
        if (op == "invest") {
            engine.invest_pool_balance(caller(), pool(s.at("pool")), address(s.at("token")), amount(s.at("amount")));
            return nullptr;
        }
        if (op == "divest") {
            engine.divest_pool_balance(caller(), pool(s.at("pool")), address(s.at("token")), amount(s.at("amount")));
            return nullptr;
        }
        if (op == "update_invested") {
            engine.update_invested(caller(), pool(s.at("pool")), address(s.at("token")), amount(s.at("amount")));
            return nullptr;
        }
        if (op == "batch_swap")
            return batch_swap(s, false);
        if (op == "query_batch_swap")
            return batch_swap(s, true);
        if (op == "flash_loan") {
            auto receiver { address(s.at("receiver")) };
            ScriptedReceiver r(bank, receiver, s.value("repay", true), amount(s.value("extra", json(0u))));
            engine.flash_loan(receiver, r, addresses(s.at("tokens")), amounts(s.at("amounts")));
            return nullptr;
        }
        if (op == "set_fee") {
            auto kind { s.at("kind").get<std::string>() };
            auto f { fee(s.at("fee")) };
            if (kind == "swap")
                engine.set_swap_fee(caller(), f);
            else if (kind == "flash-loan")
                engine.set_flash_loan_fee(caller(), f);
            else if (kind == "withdraw")
                engine.set_withdraw_fee(caller(), f);
            else
                throw malformed("unknown fee kind \"" + kind + "\"");
            return nullptr;
        }
        if (op == "withdraw_collected_fees") {
            engine.withdraw_collected_fees(caller(), addresses(s.at("tokens")), amounts(s.at("amounts")), address(s.at("recipient")));
            return nullptr;
        }
        throw malformed("unknown operation \"" + op + "\"");
    }

    json Runner::state() const
    {
        json poolsJson(json::array());
        for (auto& id : engine.pools()) {
            json tokensJson(json::array());
            for (auto& t : engine.get_pool_tokens(id)) {
                auto info { engine.get_pool_token_info(id, t.token) };
                tokensJson.push_back({ { "token", label(t.token) },
                    { "cash", info.cash.value() },
                    { "managed", info.managed.value() },
                    { "last_change", info.lastChange },
                    { "manager", info.manager ? json(label(*info.manager)) : json(nullptr) } });
            }
            poolsJson.push_back({ { "pool", label(id) },
                { "controller", label(id.controller) },
                { "strategy", defi::strategy_name(id.strategy) },
                { "last_change", engine.get_pool_last_change(id) },
                { "tokens", tokensJson } });
        }
        json users(json::object());
        json wallets(json::object());
        for (auto& a : accounts) {
            json u(json::object());
            json w(json::object());
            for (auto& t : tokens) {
                if (auto b { engine.get_user_balance(a, t) }; !b.is_zero())
                    u[label(t)] = b.value();
                if (auto b { bank.balance_of(t, a) }; !b.is_zero())
                    w[label(t)] = b.value();
            }
            users[label(a)] = u;
            wallets[label(a)] = w;
        }
        json fees(json::object());
        json custody(json::object());
        auto collected { engine.collected_fees(tokens) };
        for (size_t i = 0; i < tokens.size(); ++i) {
            fees[label(tokens[i])] = collected[i].value();
            custody[label(tokens[i])] = {
                { "held", bank.custody(tokens[i]).value() },
                { "accounted", engine.accounted_custody(tokens[i]).value() }
            };
        }
        return {
            { "pools", poolsJson },
            { "user_balances", users },
            { "wallets", wallets },
            { "collected_fees", fees },
            { "custody", custody }
        };
    }

    json Runner::run(const json& scenario)
    {
        setup(scenario);
        json steps(json::array());
        size_t index { 0 };
        for (auto& s : scenario.value("steps", json::array())) {
            json entry { { "index", index }, { "op", s.value("op", ""s) } };
            try {
                json result = step(s);
                entry["status"] = "ok";
                if (!result.is_null())
                    entry["result"] = render(result);
            } catch (const Error& e) {
                spdlog::warn("Step {} ({}) rejected: {}", index, entry["op"].get<std::string>(), e.format());
                entry["status"] = "rejected";
                entry["error"] = e.err_name();
                entry["kind"] = kind_name(e.kind());
            } catch (const json::exception& e) {
                throw malformed("step "s + std::to_string(index) + ": " + e.what());
            }
            steps.push_back(entry);
            index += 1;
        }
        json report {
            { "steps", steps },
            { "events", events },
            { "state", state() }
        };
        auto s { summarize(report) };
        report["summary"] = { { "executed", s.executed }, { "rejected", s.rejected } };
        return report;
    }
}

nlohmann::json run_scenario(const nlohmann::json& scenario, const Address& vaultAccount,
    const vault::FeeSettings& fees)
{
    Runner r(vaultAccount, fees);
    return r.run(scenario);
}

Summary summarize(const nlohmann::json& report)
{
    Summary s;
    for (auto& e : report.at("steps")) {
        s.executed += 1;
        if (e.at("status") == "rejected")
            s.rejected += 1;
    }
    return s;
}
}
