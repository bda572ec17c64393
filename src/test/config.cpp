#include "config/config.hpp"
#include <cassert>
#include <iostream>
using namespace std;

bool rejected(std::string_view content)
{
    try {
        ConfigParams::from_toml(content);
    } catch (const std::runtime_error& e) {
        cout << "rejected as expected: " << e.what() << endl;
        return true;
    }
    return false;
}

void test_defaults()
{
    auto c { ConfigParams::from_toml("") };
    assert(c.vault.address == Address::from_number(0x7661756c74));
    assert(c.fees.swap.is_zero() && c.fees.flashLoan.is_zero() && c.fees.withdraw.is_zero());
    assert(c.log.level == "info");
    assert(!c.log.file && !c.log.settlement);
    assert(c.log_settings().level == spdlog::level::info);
}

void test_full()
{
    auto c { ConfigParams::from_toml(R"(
[vault]
address = "0x00000000000000000000000000000000000000aa"

[fees]
swap = "0.1"
flash-loan = "0.0005"
withdraw = "0.005"

[log]
level = "debug"
file = "vault.log"
settlement = true
)") };
    assert(c.vault.address == Address::from_number(0xaa));
    assert(c.fees.swap == *defi::FeePercentage::parse("0.1"));
    assert(c.fees.flashLoan == *defi::FeePercentage::parse("0.0005"));
    assert(c.fees.withdraw == vault::MAX_WITHDRAW_FEE);
    auto s { c.log_settings() };
    assert(s.level == spdlog::level::debug);
    assert(s.file == "vault.log" && s.settlement);

    // dumped configuration reads back the same
    auto d { ConfigParams::from_toml(c.dump()) };
    assert(d.vault.address == c.vault.address);
    assert(d.fees.swap == c.fees.swap && d.fees.flashLoan == c.fees.flashLoan && d.fees.withdraw == c.fees.withdraw);
    assert(d.log.level == "debug" && d.log.file == "vault.log" && d.log.settlement);
}

void test_invalid()
{
    assert(rejected("[fees]\nswap = \"0.6\"\n"));
    assert(rejected("[fees]\nflash-loan = \"0.02\"\n"));
    assert(rejected("[fees]\nwithdraw = \"1.5\"\n"));
    assert(rejected("[fees]\nswap = 0.1\n"));
    assert(rejected("[vault]\naddress = \"0x1234\"\n"));
    assert(rejected("[vault]\naddress = \"0x0000000000000000000000000000000000000000\"\n"));
    assert(rejected("[log]\nlevel = \"loud\"\n"));
    assert(rejected("vault = 1\n"));
    assert(rejected("[vault\n"));
    // unknown keys are only warned about
    assert(!rejected("[vault]\ncolor = \"red\"\n"));
}

int main()
{
    test_defaults();
    test_full();
    test_invalid();
    cout << "config: all tests passed" << endl;
}
