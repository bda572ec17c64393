#pragma once

#include "crypto/address.hpp"
#include "general/logging.hpp"
#include "vault/protocol_fees.hpp"
#include "tl/expected.hpp"
#include <optional>
#include <string>
#include <string_view>

struct gengetopt_args_info;

struct ConfigParams {
    struct Vault {
        Address address { Address::from_number(0x7661756c74) }; // custody account of the vault
    } vault;
    vault::FeeSettings fees;
    struct Log {
        std::string level { "info" };
        std::optional<std::string> file;
        bool settlement { false };
    } log;
    std::optional<std::string> scenario;

    // return value 0 or negative means exit with that code
    static tl::expected<ConfigParams, int> from_args(int argc, char** argv);
    // throws std::runtime_error on invalid configuration
    static ConfigParams from_toml(std::string_view content, std::string_view source = "<string>");
    static ConfigParams from_file(const std::string& filename);

    logging::Settings log_settings() const;
    std::string dump() const;

private:
    int init(const gengetopt_args_info&);
    std::optional<int> process_config_file(const gengetopt_args_info&, bool silent);
    void validate() const;
};
