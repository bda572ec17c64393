#include "config.hpp"
#include "cmdline/cmdline.hpp"
#include "general/errors.hpp"
#include "spdlog/spdlog.h"
#include "toml++/toml.hpp"
#include <filesystem>
#include <iostream>
#include <map>
#include <sstream>

using namespace std;

namespace {

struct CmdlineParsed {
    static std::optional<CmdlineParsed> parse(int argc, char** argv)
    {
        gengetopt_args_info ai;
        if (cmdline_parser(argc, argv, &ai) != 0)
            return {};
        return CmdlineParsed { ai };
    }
    CmdlineParsed(const CmdlineParsed&) = delete;
    CmdlineParsed(CmdlineParsed&& other)
        : ai(other.ai)
    {
        other.deleteOnDestruction = false;
    };
    ~CmdlineParsed()
    {
        if (deleteOnDestruction) {
            cmdline_parser_free(&ai);
        }
    }
    auto& value() const { return ai; }

private:
    CmdlineParsed(gengetopt_args_info& ai0)
        : ai(ai0)
    {
    }

    bool deleteOnDestruction { true };
    gengetopt_args_info ai;
};

std::runtime_error failed_convert(const toml::node& n)
{
    return std::runtime_error("Cannot parse configuration value starting at line "s + std::to_string(n.source().begin.line) + ", column "s + std::to_string(n.source().begin.column) + ".");
}

template <typename T>
std::optional<T> config_convert(const toml::node& n)
{
    if (auto val = n.value<T>()) {
        return val.value();
    }
    throw failed_convert(n);
}

template <>
std::optional<Address> config_convert(const toml::node& n)
{
    if (auto sv { n.value<std::string_view>() }) {
        if (auto a { Address::parse(*sv) })
            return *a;
    }
    throw failed_convert(n);
}

template <>
std::optional<defi::FeePercentage> config_convert(const toml::node& n)
{
    if (auto sv { n.value<std::string_view>() }) {
        if (auto f { defi::FeePercentage::parse(*sv) })
            return *f;
    }
    throw failed_convert(n);
}

struct TableReaderData {
    const toml::table& tbl;
    std::string_view filepath;
    mutable std::map<toml::key, bool> keyUsed;
};

struct TableReader : public TableReaderData {
    bool report { true };
    TableReader(const toml::table& tbl, std::string_view filepath)
        : TableReaderData(tbl, filepath, {})
    {
        for (auto& [k, v] : tbl) {
            keyUsed.emplace(k, false);
        }
    }
    TableReader(const TableReader&) = delete;
    TableReader(TableReader&& a)
        : TableReaderData(std::move(a))
    {
        a.report = false;
    };
    ~TableReader()
    {
        if (report) {
            for (auto& [k, used] : keyUsed) {
                if (!used) {
                    spdlog::warn("Ignoring configuration setting \""s + std::string(k.str()) + "\" at line "s + std::to_string(k.source().begin.line) + " in file "s + string(filepath));
                }
            }
        }
    }

    std::optional<TableReader> subtable(std::string_view s)
    {
        if (auto it { tbl.find(s) }; it != tbl.end()) {
            keyUsed[it->first] = true;
            if (it->second.is_table() == false)
                throw std::runtime_error("Configuration file's "s + std::string(s) + " must be a table."s);
            return TableReader { *it->second.as_table(), filepath };
        }
        return std::nullopt;
    }

    struct Entry {
        const toml::node* v;

        template <typename T>
        std::optional<T> get() const
        {
            return config_convert<T>(*v);
        }
    };
    std::optional<Entry> operator[](std::string_view key) const
    {
        if (auto it { tbl.find(key) }; it != tbl.end()) {
            keyUsed[it->first] = true;
            return { Entry { &it->second } };
        }
        return std::nullopt;
    }
};

template <typename T>
void fill(
    T& dst,
    std::optional<TableReader>& tblreader,
    std::string_view tblkey)
{
    if (tblreader) {
        if (auto oe { (*tblreader)[tblkey] }) {
            if (auto v { oe->get<T>() }) {
                dst = *v;
                return;
            }
        }
    }
}

template <typename T>
void fill(
    std::optional<T>& dst,
    std::optional<TableReader>& tblreader,
    std::string_view tblkey)
{
    if (tblreader) {
        if (auto oe { (*tblreader)[tblkey] }) {
            if (auto v { oe->get<T>() }) {
                dst = *v;
                return;
            }
        }
    }
}

void load(ConfigParams& c, const toml::table& tbl, std::string_view filepath)
{
    TableReader root(tbl, filepath);

    auto s_vault { root.subtable("vault") };
    fill(c.vault.address, s_vault, "address");

    auto s_fees { root.subtable("fees") };
    fill(c.fees.swap, s_fees, "swap");
    fill(c.fees.flashLoan, s_fees, "flash-loan");
    fill(c.fees.withdraw, s_fees, "withdraw");

    auto s_log { root.subtable("log") };
    fill(c.log.level, s_log, "level");
    fill(c.log.file, s_log, "file");
    fill(c.log.settlement, s_log, "settlement");
}
} // namespace

tl::expected<ConfigParams, int> ConfigParams::from_args(int argc, char** argv)
{
    auto p { CmdlineParsed::parse(argc, argv) };
    if (!p)
        return tl::make_unexpected(-1);

    ConfigParams c;
    if (auto i { c.init(p->value()) }; i < 1) {
        return tl::make_unexpected(i);
    }
    return c;
}

ConfigParams ConfigParams::from_toml(std::string_view content, std::string_view source)
{
    ConfigParams c;
    toml::table tbl = toml::parse(content, source);
    load(c, tbl, source);
    c.validate();
    return c;
}

ConfigParams ConfigParams::from_file(const std::string& filename)
{
    ConfigParams c;
    toml::table tbl = toml::parse_file(filename);
    load(c, tbl, filename);
    c.validate();
    return c;
}

void ConfigParams::validate() const
{
    if (spdlog::level::from_str(log.level) == spdlog::level::off && log.level != "off")
        throw std::runtime_error("Invalid log level \"" + log.level + "\".");
    if (vault.address.is_zero())
        throw std::runtime_error("Vault address must not be zero.");
    try {
        vault::check_fee_settings(fees);
    } catch (const Error& e) {
        throw std::runtime_error("Invalid fee configuration: "s + e.strerror());
    }
}

logging::Settings ConfigParams::log_settings() const
{
    return {
        .level = spdlog::level::from_str(log.level),
        .file { log.file },
        .settlement = log.settlement
    };
}

std::optional<int> ConfigParams::process_config_file(const gengetopt_args_info& ai, bool silent)
{
    std::string filename { "config.toml" };
    if (!ai.config_given && !std::filesystem::exists(filename)) {
        if (!silent)
            spdlog::debug("No config.toml file found, using default configuration");
        if (ai.test_given) {
            spdlog::error("No configuration file found.");
            return -1;
        }
    } else {
        if (ai.config_given)
            filename = ai.config_arg;
        if (!silent)
            spdlog::info("Reading configuration file \"{}\"", filename);

        *this = from_file(filename);
        if (ai.test_given) {
            std::cout << "Configuration file \"" + filename + "\" is valid.\n";
            return 0;
        }
    }
    return {};
}

int ConfigParams::init(const gengetopt_args_info& ai)
{
    try {
        bool dmp(ai.dump_config_given);
        if (auto i { process_config_file(ai, dmp) })
            return *i;
        if (ai.debug_given)
            log.level = "debug";
        if (ai.scenario_given)
            scenario = ai.scenario_arg;

        if (dmp) {
            std::cout << dump();
            return 0;
        }
    } catch (const toml::parse_error& err) {
        std::cerr << "Error while parsing file '" << *err.source().path << "':\n"
                  << err.description() << "\n  (" << err.source().begin
                  << ")\n";
        return -1;
    } catch (const std::runtime_error& e) {
        spdlog::error(e.what());
        return -1;
    }
    return 1;
}

std::string ConfigParams::dump() const
{
    toml::table tbl;
    tbl.insert_or_assign("vault", toml::table {
                                      { "address", vault.address.to_string() },
                                  });
    tbl.insert_or_assign("fees", toml::table {
                                     { "swap", fees.swap.to_string() },
                                     { "flash-loan", fees.flashLoan.to_string() },
                                     { "withdraw", fees.withdraw.to_string() },
                                 });
    toml::table logtbl {
        { "level", log.level },
        { "settlement", log.settlement }
    };
    if (log.file)
        logtbl.insert_or_assign("file", *log.file);
    tbl.insert_or_assign("log", logtbl);
    stringstream ss;
    ss << tbl << endl;
    return ss.str();
}
