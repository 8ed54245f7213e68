#pragma once

#include "postgres_store.hpp"
#include "price_oracle.hpp"
#include "redis_bus.hpp"
#include <memory>
#include <nlohmann/json.hpp>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<RedisBus> redis,
                std::shared_ptr<PostgresStore> pg,
                std::shared_ptr<PriceOracle> oracle);
    
    nlohmann::json get_status() const;
    bool is_healthy() const;
    
private:
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<PostgresStore> pg_;
    std::shared_ptr<PriceOracle> oracle_;
};
