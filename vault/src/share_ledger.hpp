#pragma once

#include <cstdint>
#include <map>
#include <string>

class ShareLedger {
public:
    ShareLedger() = default;
    explicit ShareLedger(const std::map<std::string, uint64_t>& balances);
    
    uint64_t total_supply() const { return total_supply_; }
    uint64_t balance_of(const std::string& holder) const;
    const std::map<std::string, uint64_t>& balances() const { return balances_; }
    
    void mint(const std::string& holder, uint64_t shares);
    void burn(const std::string& holder, uint64_t shares);
    
private:
    uint64_t total_supply_ = 0;
    std::map<std::string, uint64_t> balances_;
};
