#include "vault_commands.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "vault_json.hpp"
#include <spdlog/spdlog.h>
#include <map>
#include <utility>

VaultCommands::VaultCommands(std::shared_ptr<Config> config,
                             std::shared_ptr<PostgresStore> pg,
                             std::shared_ptr<RedisBus> redis,
                             std::shared_ptr<VaultEngine> engine,
                             std::shared_ptr<MockPriceOracle> mock_oracle)
    : config_(config)
    , pg_(pg)
    , redis_(redis)
    , engine_(engine)
    , mock_oracle_(mock_oracle)
{}

void VaultCommands::dispatch(const nlohmann::json& cmd) {
    std::string name = cmd.value("cmd", "");
    std::string corr_id = cmd.value("corr_id", "");
    
    nlohmann::json reply = {
        {"corr_id", corr_id},
        {"cmd", name},
        {"ts", util::current_iso8601()}
    };
    
    try {
        std::string caller = cmd.at("from").at("address").get<std::string>();
        if (!util::is_valid_solana_address(caller)) {
            throw VaultError(ErrorCode::Unauthorized, "invalid caller address");
        }
        const nlohmann::json args = cmd.value("args", nlohmann::json::object());
        
        nlohmann::json data;
        if (name == "create_vault") {
            data = create_vault(caller, args);
        } else if (name == "deposit") {
            data = deposit(caller, args);
        } else if (name == "withdraw") {
            data = withdraw(caller, args);
        } else if (name == "rebalance") {
            data = rebalance(caller, args);
        } else if (name == "snapshot") {
            data = snapshot(caller, args);
        } else if (name == "set_oracle_prices") {
            data = set_oracle_prices(caller, args);
        } else if (name == "set_strategy") {
            data = set_strategy(caller, args);
        } else if (name == "remove_strategy") {
            data = remove_strategy(caller, args);
        } else {
            reply["ok"] = false;
            reply["error"] = "UnknownCommand";
            reply["message"] = "Unknown command: " + name;
            redis_->publish_reply(config_->stream_rep, reply);
            return;
        }
        
        reply["ok"] = true;
        reply["data"] = data;
        spdlog::info("Processed {} from {}", name, caller);
        
    } catch (const VaultError& e) {
        spdlog::warn("Command {} ({}) rejected: {}", name, corr_id, e.what());
        reply["ok"] = false;
        reply["error"] = error_code_name(e.code());
        reply["message"] = e.what();
    } catch (const std::exception& e) {
        spdlog::error("Failed to handle {} ({}): {}", name, corr_id, e.what());
        reply["ok"] = false;
        reply["error"] = "Internal";
        reply["message"] = e.what();
    }
    
    try {
        redis_->publish_reply(config_->stream_rep, reply);
    } catch (const std::exception& e) {
        spdlog::error("Reply for {} lost: {}", corr_id, e.what());
    }
}

VaultRecord VaultCommands::require_vault(const nlohmann::json& args) {
    std::string name = args.at("vault").get<std::string>();
    auto record = pg_->load_vault(name);
    if (!record.has_value()) {
        throw VaultError(ErrorCode::InvalidName, "unknown vault " + name);
    }
    return std::move(*record);
}

void VaultCommands::audit(const std::string& event, const std::string& caller,
                          const std::string& vault, const nlohmann::json& detail) {
    nlohmann::json entry = {
        {"event", event},
        {"actor", caller},
        {"vault", vault},
        {"detail", detail},
        {"service", config_->service_name},
        {"ts", util::current_iso8601()}
    };
    redis_->publish_audit(config_->stream_audit, entry);
}

nlohmann::json VaultCommands::create_vault(const std::string& caller, const nlohmann::json& args) {
    auto composition = args.get<VaultComposition>();
    composition.owner = caller;
    // Delegations are bound through set_strategy only
    composition.strategy.reset();
    composition.validate();
    
    pg_->create_vault(composition);
    
    nlohmann::json data = composition;
    audit("vault.created", caller, composition.name, data);
    return data;
}

nlohmann::json VaultCommands::deposit(const std::string& caller, const nlohmann::json& args) {
    auto record = require_vault(args);
    uint64_t amount = args.at("amount").get<uint64_t>();
    
    auto receipt = engine_->deposit(record.composition, record.shares, caller, amount,
                                    util::current_unix_seconds());
    pg_->apply_deposit(record.composition, record.shares, receipt);
    
    nlohmann::json data = receipt;
    audit("vault.deposit", caller, record.composition.name, data);
    return data;
}

nlohmann::json VaultCommands::withdraw(const std::string& caller, const nlohmann::json& args) {
    auto record = require_vault(args);
    uint64_t shares = args.at("shares").get<uint64_t>();
    
    auto receipt = engine_->withdraw(record.composition, record.shares, caller, shares,
                                     util::current_unix_seconds());
    pg_->apply_withdrawal(record.composition, record.shares, receipt);
    
    nlohmann::json data = receipt;
    audit("vault.withdraw", caller, record.composition.name, data);
    return data;
}

nlohmann::json VaultCommands::rebalance(const std::string& caller, const nlohmann::json& args) {
    auto record = require_vault(args);
    bool execute = args.value("execute", true);
    
    auto outcome = engine_->rebalance(record.composition, caller, util::current_unix_seconds(),
                                      execute);
    if (outcome.executed) {
        pg_->apply_rebalance(record.composition, outcome);
    }
    
    nlohmann::json data = outcome;
    audit("vault.rebalance", caller, record.composition.name, data);
    return data;
}

nlohmann::json VaultCommands::snapshot(const std::string& caller, const nlohmann::json& args) {
    auto record = require_vault(args);
    
    auto snap = engine_->snapshot(record.composition, record.shares, util::current_unix_seconds());
    pg_->save_snapshot(record.composition.name, snap);
    if (record.composition.strategy.has_value()) {
        pg_->save_strategy(record.composition);
    }
    
    spdlog::debug("Snapshot of {} requested by {}", record.composition.name, caller);
    nlohmann::json data = snap;
    return data;
}

nlohmann::json VaultCommands::set_oracle_prices(const std::string& caller,
                                                const nlohmann::json& args) {
    if (!mock_oracle_) {
        throw VaultError(ErrorCode::Unauthorized, "mock oracle is not enabled");
    }
    
    auto prices = args.at("prices").get<std::map<std::string, int64_t>>();
    mock_oracle_->update_prices(caller, prices, util::current_unix_seconds());
    
    nlohmann::json data = {
        {"feeds", prices.size()},
        {"last_update", mock_oracle_->last_update()}
    };
    audit("oracle.prices_set", caller, "", args.at("prices"));
    return data;
}

nlohmann::json VaultCommands::set_strategy(const std::string& caller, const nlohmann::json& args) {
    auto record = require_vault(args);
    
    engine_->set_strategy(record.composition, caller);
    pg_->save_strategy(record.composition);
    
    nlohmann::json data = *record.composition.strategy;
    audit("vault.strategy_set", caller, record.composition.name, data);
    return data;
}

nlohmann::json VaultCommands::remove_strategy(const std::string& caller,
                                              const nlohmann::json& args) {
    auto record = require_vault(args);
    
    engine_->remove_strategy(record.composition, caller);
    pg_->save_strategy(record.composition);
    
    nlohmann::json data = {{"vault", record.composition.name}, {"strategy", nullptr}};
    audit("vault.strategy_removed", caller, record.composition.name, data);
    return data;
}
