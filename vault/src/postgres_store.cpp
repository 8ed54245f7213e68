#include "postgres_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "vault_json.hpp"
#include <spdlog/spdlog.h>

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS vaults (
                name TEXT PRIMARY KEY,
                owner TEXT NOT NULL,
                share_unit TEXT NOT NULL,
                oracle_source TEXT NOT NULL CHECK (oracle_source IN ('hermes','mock')),
                base_asset_id TEXT NOT NULL,
                base_symbol TEXT NOT NULL,
                base_decimals INT NOT NULL,
                base_oracle_feed TEXT NOT NULL,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS vault_assets (
                vault_name TEXT NOT NULL REFERENCES vaults(name) ON DELETE CASCADE,
                position INT NOT NULL,
                asset_id TEXT NOT NULL,
                symbol TEXT NOT NULL,
                weight INT NOT NULL CHECK (weight BETWEEN 1 AND 100),
                decimals INT NOT NULL,
                balance_handle TEXT NOT NULL,
                oracle_feed TEXT NOT NULL,
                role TEXT NOT NULL CHECK (role IN ('standard','base','delegated')),
                PRIMARY KEY (vault_name, position),
                UNIQUE (vault_name, asset_id)
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS balances (
                vault_name TEXT NOT NULL REFERENCES vaults(name) ON DELETE CASCADE,
                asset_id TEXT NOT NULL,
                amount NUMERIC(20,0) NOT NULL DEFAULT 0 CHECK (amount >= 0),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                PRIMARY KEY (vault_name, asset_id)
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS holder_shares (
                vault_name TEXT NOT NULL REFERENCES vaults(name) ON DELETE CASCADE,
                holder TEXT NOT NULL,
                shares NUMERIC(20,0) NOT NULL CHECK (shares > 0),
                PRIMARY KEY (vault_name, holder)
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS strategy_delegations (
                vault_name TEXT PRIMARY KEY REFERENCES vaults(name) ON DELETE CASCADE,
                strategy_id TEXT NOT NULL,
                principal NUMERIC(20,0) NOT NULL DEFAULT 0,
                current_value NUMERIC(20,0) NOT NULL DEFAULT 0,
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS snapshots (
                id BIGSERIAL PRIMARY KEY,
                vault_name TEXT NOT NULL REFERENCES vaults(name) ON DELETE CASCADE,
                tvl_usd_micro BIGINT NOT NULL,
                total_shares NUMERIC(20,0) NOT NULL,
                share_price_usd_micro BIGINT NOT NULL,
                detail JSONB,
                ts TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS rebalance_runs (
                id BIGSERIAL PRIMARY KEY,
                vault_name TEXT NOT NULL REFERENCES vaults(name) ON DELETE CASCADE,
                total_usd_micro BIGINT NOT NULL,
                swap_count INT NOT NULL,
                plan JSONB NOT NULL,
                ts TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");
        
        txn.commit();
        spdlog::info("Database schema initialized");
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

void PostgresStore::create_vault(const VaultComposition& composition) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        auto existing = txn.exec_params("SELECT 1 FROM vaults WHERE name = $1", composition.name);
        if (!existing.empty()) {
            throw VaultError(ErrorCode::InvalidName, "vault " + composition.name + " already exists");
        }
        
        txn.exec_params(
            "INSERT INTO vaults (name, owner, share_unit, oracle_source, base_asset_id, "
            "base_symbol, base_decimals, base_oracle_feed) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8)",
            composition.name,
            composition.owner,
            composition.share_unit,
            oracle_source_string(composition.oracle_source),
            composition.base.asset_id,
            composition.base.symbol,
            static_cast<int>(composition.base.decimals),
            composition.base.oracle_feed
        );
        
        for (size_t i = 0; i < composition.assets.size(); i++) {
            const auto& asset = composition.assets[i];
            txn.exec_params(
                "INSERT INTO vault_assets (vault_name, position, asset_id, symbol, weight, "
                "decimals, balance_handle, oracle_feed, role) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9)",
                composition.name,
                static_cast<int>(i),
                asset.asset_id,
                asset.symbol,
                static_cast<int>(asset.weight),
                static_cast<int>(asset.decimals),
                asset.balance_handle,
                asset.oracle_feed,
                role_string(asset.role)
            );
            txn.exec_params(
                "INSERT INTO balances (vault_name, asset_id, amount) VALUES ($1, $2, 0)",
                composition.name, asset.asset_id
            );
        }
        
        write_strategy(txn, composition);
        
        txn.commit();
        spdlog::info("Stored vault {} with {} assets", composition.name, composition.assets.size());
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to create vault: {}", e.what());
        throw;
    }
}

std::optional<VaultRecord> PostgresStore::load_vault(const std::string& name) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        auto vault = txn.exec_params(
            "SELECT owner, share_unit, oracle_source, base_asset_id, base_symbol, "
            "base_decimals, base_oracle_feed FROM vaults WHERE name = $1",
            name
        );
        if (vault.empty()) {
            return std::nullopt;
        }
        
        VaultRecord record;
        auto& composition = record.composition;
        composition.name = name;
        composition.owner = vault[0][0].as<std::string>();
        composition.share_unit = vault[0][1].as<std::string>();
        composition.oracle_source = parse_oracle_source(vault[0][2].as<std::string>());
        composition.base.asset_id = vault[0][3].as<std::string>();
        composition.base.symbol = vault[0][4].as<std::string>();
        composition.base.decimals = static_cast<uint8_t>(vault[0][5].as<int>());
        composition.base.oracle_feed = vault[0][6].as<std::string>();
        
        auto assets = txn.exec_params(
            "SELECT asset_id, symbol, weight, decimals, balance_handle, oracle_feed, role "
            "FROM vault_assets WHERE vault_name = $1 ORDER BY position",
            name
        );
        for (const auto& row : assets) {
            AssetAllocation asset;
            asset.asset_id = row[0].as<std::string>();
            asset.symbol = row[1].as<std::string>();
            asset.weight = static_cast<uint8_t>(row[2].as<int>());
            asset.decimals = static_cast<uint8_t>(row[3].as<int>());
            asset.balance_handle = row[4].as<std::string>();
            asset.oracle_feed = row[5].as<std::string>();
            asset.role = parse_role(row[6].as<std::string>());
            composition.assets.push_back(asset);
        }
        
        auto strategy = txn.exec_params(
            "SELECT strategy_id, principal, current_value FROM strategy_delegations "
            "WHERE vault_name = $1",
            name
        );
        if (!strategy.empty()) {
            StrategyDelegation delegation;
            delegation.strategy_id = strategy[0][0].as<std::string>();
            delegation.vault_name = name;
            delegation.principal = strategy[0][1].as<uint64_t>();
            delegation.current_value = strategy[0][2].as<uint64_t>();
            composition.strategy = delegation;
        }
        
        auto holders = txn.exec_params(
            "SELECT holder, shares FROM holder_shares WHERE vault_name = $1",
            name
        );
        std::map<std::string, uint64_t> balances;
        for (const auto& row : holders) {
            balances[row[0].as<std::string>()] = row[1].as<uint64_t>();
        }
        record.shares = ShareLedger(balances);
        
        txn.commit();
        return record;
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to load vault {}: {}", name, e.what());
        throw;
    }
}

uint64_t PostgresStore::get_balance(const std::string& vault_name, const std::string& asset_id) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        auto result = txn.exec_params(
            "SELECT amount FROM balances WHERE vault_name = $1 AND asset_id = $2",
            vault_name, asset_id
        );
        txn.commit();
        
        return result.empty() ? 0 : result[0][0].as<uint64_t>();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to read balance {}/{}: {}", vault_name, asset_id, e.what());
        throw;
    }
}

std::map<std::string, uint64_t> PostgresStore::get_balances(const std::string& vault_name) {
    std::map<std::string, uint64_t> balances;
    
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        auto result = txn.exec_params(
            "SELECT asset_id, amount FROM balances WHERE vault_name = $1",
            vault_name
        );
        for (const auto& row : result) {
            balances[row[0].as<std::string>()] = row[1].as<uint64_t>();
        }
        
        txn.commit();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to read balances for {}: {}", vault_name, e.what());
        throw;
    }
    
    return balances;
}

void PostgresStore::write_strategy(pqxx::work& txn, const VaultComposition& composition) {
    if (!composition.strategy.has_value()) {
        txn.exec_params("DELETE FROM strategy_delegations WHERE vault_name = $1",
                        composition.name);
        return;
    }
    
    const auto& delegation = *composition.strategy;
    txn.exec_params(
        "INSERT INTO strategy_delegations (vault_name, strategy_id, principal, current_value) "
        "VALUES ($1, $2, $3, $4) "
        "ON CONFLICT (vault_name) DO UPDATE SET "
        "strategy_id = $2, principal = $3, current_value = $4, updated_at = NOW()",
        composition.name,
        delegation.strategy_id,
        delegation.principal,
        delegation.current_value
    );
}

void PostgresStore::write_shares(pqxx::work& txn, const std::string& vault_name,
                                 const ShareLedger& shares) {
    txn.exec_params("DELETE FROM holder_shares WHERE vault_name = $1", vault_name);
    for (const auto& [holder, amount] : shares.balances()) {
        txn.exec_params(
            "INSERT INTO holder_shares (vault_name, holder, shares) VALUES ($1, $2, $3)",
            vault_name, holder, amount
        );
    }
}

void PostgresStore::credit(pqxx::work& txn, const std::string& vault_name,
                           const std::string& asset_id, uint64_t amount) {
    if (amount == 0) return;
    txn.exec_params(
        "INSERT INTO balances (vault_name, asset_id, amount) VALUES ($1, $2, $3) "
        "ON CONFLICT (vault_name, asset_id) DO UPDATE SET "
        "amount = balances.amount + EXCLUDED.amount, updated_at = NOW()",
        vault_name, asset_id, amount
    );
}

void PostgresStore::debit(pqxx::work& txn, const std::string& vault_name,
                          const std::string& asset_id, uint64_t amount) {
    if (amount == 0) return;
    auto result = txn.exec_params(
        "UPDATE balances SET amount = amount - $3, updated_at = NOW() "
        "WHERE vault_name = $1 AND asset_id = $2 AND amount >= $3",
        vault_name, asset_id, amount
    );
    if (result.affected_rows() != 1) {
        throw VaultError(ErrorCode::InsufficientBalance,
                         asset_id + " balance below " + std::to_string(amount));
    }
}

void PostgresStore::apply_deposit(const VaultComposition& composition, const ShareLedger& shares,
                                  const DepositReceipt& receipt) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        for (const auto& slice : receipt.allocation.allocations) {
            if (slice.delegated) continue;
            credit(txn, composition.name, composition.assets[slice.asset_index].asset_id,
                   slice.asset_amount);
        }
        write_shares(txn, composition.name, shares);
        write_strategy(txn, composition);
        
        txn.commit();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to apply deposit to {}: {}", composition.name, e.what());
        throw;
    }
}

void PostgresStore::apply_withdrawal(const VaultComposition& composition,
                                     const ShareLedger& shares,
                                     const WithdrawalReceipt& receipt) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        for (const auto& release : receipt.quote.releases) {
            debit(txn, composition.name, composition.assets[release.asset_index].asset_id,
                  release.amount);
        }
        write_shares(txn, composition.name, shares);
        write_strategy(txn, composition);
        
        txn.commit();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to apply withdrawal to {}: {}", composition.name, e.what());
        throw;
    }
}

void PostgresStore::apply_rebalance(const VaultComposition& composition,
                                    const RebalanceOutcome& outcome) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        for (size_t i = 0; i < outcome.realized_outputs.size(); i++) {
            const auto& swap = outcome.plan[i];
            debit(txn, composition.name, composition.assets[swap.from_asset].asset_id,
                  swap.amount_in);
            credit(txn, composition.name, composition.assets[swap.to_asset].asset_id,
                   outcome.realized_outputs[i]);
        }
        
        nlohmann::json plan = outcome.plan;
        txn.exec_params(
            "INSERT INTO rebalance_runs (vault_name, total_usd_micro, swap_count, plan) "
            "VALUES ($1, $2, $3, $4::jsonb)",
            composition.name,
            outcome.report.total_usd,
            static_cast<int>(outcome.realized_outputs.size()),
            plan.dump()
        );
        
        txn.commit();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to apply rebalance to {}: {}", composition.name, e.what());
        throw;
    }
}

void PostgresStore::save_strategy(const VaultComposition& composition) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        write_strategy(txn, composition);
        txn.commit();
    } catch (const std::exception& e) {
        spdlog::error("Failed to save strategy for {}: {}", composition.name, e.what());
        throw;
    }
}

void PostgresStore::save_snapshot(const std::string& vault_name,
                                  const ValuationSnapshot& snapshot) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        nlohmann::json detail = snapshot;
        txn.exec_params(
            "INSERT INTO snapshots (vault_name, tvl_usd_micro, total_shares, "
            "share_price_usd_micro, detail) VALUES ($1, $2, $3, $4, $5::jsonb)",
            vault_name,
            snapshot.tvl_usd_micro,
            snapshot.total_shares,
            snapshot.share_price_usd_micro,
            detail.dump()
        );
        
        txn.commit();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to save snapshot: {}", e.what());
    }
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Postgres ping failed: {}", e.what());
        return false;
    }
}
