#pragma once

#include "collaborators.hpp"
#include "composition.hpp"
#include <cstdint>
#include <memory>
#include <string>

struct UnwindResult {
    uint64_t fraction = 0;
    uint64_t requested_amount = 0;
    uint64_t received_amount = 0;
    uint64_t principal_released = 0;
    int64_t yield_amount = 0;   // may be negative
};

// Tracks principal delegated to an external yield strategy and the value it
// currently reports. State on the composition is only written after the
// strategy call succeeded.
class StrategyLedger {
public:
    explicit StrategyLedger(std::shared_ptr<YieldStrategy> strategy);
    
    // Binds a fresh delegation record to the vault
    void attach(VaultComposition& composition) const;
    
    void delegate(VaultComposition& composition, uint64_t amount);
    UnwindResult undelegate(VaultComposition& composition, uint64_t fraction);
    
    uint64_t refresh(VaultComposition& composition);
    
private:
    std::shared_ptr<YieldStrategy> strategy_;
    
    StrategyDelegation& bound_delegation(VaultComposition& composition) const;
    uint64_t observe_value();
};
