#pragma once
#include "crypto/address.hpp"
#include "nlohmann/json.hpp"
#include "vault/protocol_fees.hpp"

namespace sim {

struct Summary {
    size_t executed { 0 };
    size_t rejected { 0 };
};

// Runs a JSON scenario against a fresh vault backed by an in-memory token
// bank and constant product pools. Vault rejections are recorded in the
// report, malformed scenarios throw std::runtime_error.
//
// Scenario layout:
//   tokens:   ["DAI", ...]
//   accounts: { "alice": { "DAI": 1000 }, ... }   minted bank balances
//   admins:   ["admin"]                           allowed all authorized actions
//   steps:    [ { "op": "...", ... }, ... ]
//
// Report layout: { steps: [...], events: [...], state: {...}, summary: {...} }
nlohmann::json run_scenario(const nlohmann::json& scenario, const Address& vaultAccount,
    const vault::FeeSettings& fees);

Summary summarize(const nlohmann::json& report);
}
