#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<PostgresStore> pg,
                         std::shared_ptr<PriceOracle> oracle)
    : redis_(redis), pg_(pg), oracle_(oracle) {}

nlohmann::json HealthCheck::get_status() const {
    bool redis_ok = redis_->ping();
    bool pg_ok = pg_->ping();
    bool oracle_ok = oracle_->is_healthy();
    
    // A degraded oracle blocks pricing but not the service itself
    return {
        {"ok", redis_ok && pg_ok},
        {"redis", redis_ok},
        {"postgres", pg_ok},
        {"oracle", oracle_ok ? "up" : "degraded"},
        {"ts", util::current_iso8601()}
    };
}

bool HealthCheck::is_healthy() const {
    return redis_->ping() && pg_->ping();
}
