#pragma once
#include "rollback_map.hpp"
#include "crypto/address.hpp"
#include "defi/fee.hpp"

namespace vault {

struct FeeSettings {
    defi::FeePercentage swap;
    defi::FeePercentage flashLoan;
    defi::FeePercentage withdraw;
};

// Maximum protocol fees
inline const defi::FeePercentage MAX_SWAP_FEE { defi::FeePercentage::from_e18(500000000000000000ull) }; // 50%
inline const defi::FeePercentage MAX_FLASH_LOAN_FEE { defi::FeePercentage::from_e18(10000000000000000ull) }; // 1%
inline const defi::FeePercentage MAX_WITHDRAW_FEE { defi::FeePercentage::from_e18(5000000000000000ull) }; // 0.5%

// throws ESWAPFEE, EFLASHFEE or EWITHDRAWFEE
void check_fee_settings(const FeeSettings&);

// Protocol fee percentages and the fees collected per token.
class ProtocolFees {
public:
    ProtocolFees(FeeSettings);
    const FeeSettings& settings() const { return fees.get(); }
    void set_swap_fee(defi::FeePercentage);
    void set_flash_loan_fee(defi::FeePercentage);
    void set_withdraw_fee(defi::FeePercentage);

    Funds collected(const Address& token) const;
    void collect(const Address& token, Funds);
    // throws EFEEBALANCE
    void withdraw(const Address& token, Funds);
    const std::map<Address, Funds>& all_collected() const { return collectedFees.entries(); }

    void commit();
    void rollback();

private:
    RollbackValue<FeeSettings> fees;
    RollbackMap<Address, Funds> collectedFees;
};
}
