#pragma once

#include "config.hpp"
#include "mock_oracle.hpp"
#include "postgres_store.hpp"
#include "redis_bus.hpp"
#include "vault_engine.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

// Handles command stream messages of the form
//   {"cmd": "...", "corr_id": "...", "from": {"address": "..."}, "args": {...}}
class VaultCommands {
public:
    VaultCommands(std::shared_ptr<Config> config,
                  std::shared_ptr<PostgresStore> pg,
                  std::shared_ptr<RedisBus> redis,
                  std::shared_ptr<VaultEngine> engine,
                  std::shared_ptr<MockPriceOracle> mock_oracle);
    
    // Executes the command and publishes its reply. Never throws.
    void dispatch(const nlohmann::json& cmd);
    
private:
    std::shared_ptr<Config> config_;
    std::shared_ptr<PostgresStore> pg_;
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<VaultEngine> engine_;
    std::shared_ptr<MockPriceOracle> mock_oracle_;
    
    nlohmann::json create_vault(const std::string& caller, const nlohmann::json& args);
    nlohmann::json deposit(const std::string& caller, const nlohmann::json& args);
    nlohmann::json withdraw(const std::string& caller, const nlohmann::json& args);
    nlohmann::json rebalance(const std::string& caller, const nlohmann::json& args);
    nlohmann::json snapshot(const std::string& caller, const nlohmann::json& args);
    nlohmann::json set_oracle_prices(const std::string& caller, const nlohmann::json& args);
    nlohmann::json set_strategy(const std::string& caller, const nlohmann::json& args);
    nlohmann::json remove_strategy(const std::string& caller, const nlohmann::json& args);
    
    VaultRecord require_vault(const nlohmann::json& args);
    void audit(const std::string& event, const std::string& caller, const std::string& vault,
               const nlohmann::json& detail);
};
