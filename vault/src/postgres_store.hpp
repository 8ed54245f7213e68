#pragma once

#include "collaborators.hpp"
#include "composition.hpp"
#include "share_ledger.hpp"
#include "vault_engine.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <pqxx/pqxx>

struct VaultRecord {
    VaultComposition composition;
    ShareLedger shares;
};

// Persistent vault state. Every apply_* call commits in a single transaction
// or not at all.
class PostgresStore : public BalanceStore {
public:
    explicit PostgresStore(const std::string& dsn);
    
    void init_schema();
    
    void create_vault(const VaultComposition& composition);
    std::optional<VaultRecord> load_vault(const std::string& name);
    
    uint64_t get_balance(const std::string& vault_name, const std::string& asset_id) override;
    std::map<std::string, uint64_t> get_balances(const std::string& vault_name);
    
    void apply_deposit(const VaultComposition& composition, const ShareLedger& shares,
                       const DepositReceipt& receipt);
    void apply_withdrawal(const VaultComposition& composition, const ShareLedger& shares,
                          const WithdrawalReceipt& receipt);
    void apply_rebalance(const VaultComposition& composition, const RebalanceOutcome& outcome);
    
    void save_strategy(const VaultComposition& composition);
    void save_snapshot(const std::string& vault_name, const ValuationSnapshot& snapshot);
    
    bool ping();
    
private:
    std::string dsn_;
    
    pqxx::connection make_connection();
    
    static void write_strategy(pqxx::work& txn, const VaultComposition& composition);
    static void write_shares(pqxx::work& txn, const std::string& vault_name,
                             const ShareLedger& shares);
    static void credit(pqxx::work& txn, const std::string& vault_name,
                       const std::string& asset_id, uint64_t amount);
    static void debit(pqxx::work& txn, const std::string& vault_name,
                      const std::string& asset_id, uint64_t amount);
};
