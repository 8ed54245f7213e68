#include "config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

int64_t Config::get_env_int64(const char* name, int64_t default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoll(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;
    
    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_req = get_env("STREAM_REQ", "vault.cmd.requests");
    cfg.stream_rep = get_env("STREAM_REP", "vault.cmd.replies");
    cfg.stream_audit = get_env("STREAM_AUDIT", "vault.audit");
    
    cfg.pg_dsn = get_env("PG_DSN");
    
    cfg.oracle_source = get_env("ORACLE_SOURCE", "hermes");
    cfg.hermes_base = get_env("HERMES_BASE", "https://hermes.pyth.network");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 2500);
    cfg.max_quote_age_secs = get_env_int64("MAX_QUOTE_AGE_SECS", 120);
    cfg.max_price_usd_micro = get_env_int64("MAX_PRICE_USD_MICRO", 10000000000000LL);
    cfg.mock_oracle_authority = get_env("MOCK_ORACLE_AUTHORITY");
    
    cfg.drift_threshold_pct = get_env_int("DRIFT_THRESHOLD_PCT", 5);
    cfg.max_swaps = get_env_int("MAX_SWAPS", 6);
    cfg.slippage_bps = get_env_int("SLIPPAGE_BPS", 100);
    cfg.min_swap_usd_micro = get_env_int64("MIN_SWAP_USD_MICRO", 1000000);
    
    cfg.strategy_base = get_env("STRATEGY_BASE");
    cfg.strategy_id = get_env("STRATEGY_ID", "vault-yield");
    
    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);
    
    cfg.service_name = get_env("SERVICE_NAME", "vault");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    
    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (oracle_source != "hermes" && oracle_source != "mock") {
        throw std::runtime_error("ORACLE_SOURCE must be hermes or mock");
    }
    if (oracle_source == "mock" && mock_oracle_authority.empty()) {
        throw std::runtime_error("MOCK_ORACLE_AUTHORITY is required for the mock oracle");
    }
    if (drift_threshold_pct < 0 || drift_threshold_pct > 100) {
        throw std::runtime_error("DRIFT_THRESHOLD_PCT must be within 0..100");
    }
    if (max_swaps <= 0) {
        throw std::runtime_error("MAX_SWAPS must be positive");
    }
    if (slippage_bps < 0 || slippage_bps > 10000) {
        throw std::runtime_error("SLIPPAGE_BPS must be within 0..10000");
    }
    if (max_quote_age_secs <= 0 || max_price_usd_micro <= 0 || min_swap_usd_micro < 0) {
        throw std::runtime_error("Quote and swap limits must be positive");
    }
    
    spdlog::info("Configuration validated successfully");
    spdlog::info("  Oracle: {} (max age {}s)", oracle_source, max_quote_age_secs);
    spdlog::info("  Rebalance: threshold={}%, max_swaps={}, slippage={}bps",
                 drift_threshold_pct, max_swaps, slippage_bps);
    spdlog::info("  Strategy gateway: {}", strategy_base.empty() ? "disabled" : strategy_base);
}
