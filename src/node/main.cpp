#include "config/config.hpp"
#include "general/errors.hpp"
#include "general/logging.hpp"
#include "nlohmann/json.hpp"
#include "sim/scenario.hpp"
#include "spdlog/spdlog.h"
#include <fstream>
#include <iostream>

namespace {
nlohmann::json read_scenario(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
        throw std::runtime_error("Cannot open scenario file \"" + path + "\"");
    return nlohmann::json::parse(file);
}
}

int run_app(int argc, char** argv)
{
    auto parsed { ConfigParams::from_args(argc, argv) };
    if (!parsed)
        return parsed.error(); // 0 or negative means exit
    auto& c { *parsed };
    logging::setup(c.log_settings());
    if (!c.scenario) {
        spdlog::error("No scenario file given, use --scenario.");
        return -1;
    }

    spdlog::info("Vault account: {}", c.vault.address.to_string());
    spdlog::info("Protocol fees: swap {}, flash loan {}, withdraw {}",
        c.fees.swap.to_string(), c.fees.flashLoan.to_string(), c.fees.withdraw.to_string());

    try {
        nlohmann::json scenario = read_scenario(*c.scenario);
        nlohmann::json report = sim::run_scenario(scenario, c.vault.address, c.fees);
        std::cout << report.dump(2) << std::endl;
        auto s { sim::summarize(report) };
        spdlog::info("Executed {} steps, {} rejected", s.executed, s.rejected);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Cannot read scenario \"{}\": {}", *c.scenario, e.what());
        return -1;
    } catch (const std::runtime_error& e) {
        spdlog::error(e.what());
        return -1;
    } catch (const Error& e) {
        spdlog::error("Scenario aborted: {}", e.format());
        return -1;
    }
    return 0;
}

int main(int argc, char** argv)
{
    auto i { run_app(argc, argv) };
    spdlog::shutdown();
    return i;
}
