#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_req;
    std::string stream_rep;
    std::string stream_audit;
    
    // Postgres
    std::string pg_dsn;
    
    // Oracle
    std::string oracle_source;          // hermes | mock
    std::string hermes_base;
    int request_timeout_ms;
    int64_t max_quote_age_secs;
    int64_t max_price_usd_micro;
    std::string mock_oracle_authority;
    
    // Rebalancing
    int drift_threshold_pct;
    int max_swaps;
    int slippage_bps;
    int64_t min_swap_usd_micro;
    
    // Yield strategy gateway, empty disables delegation
    std::string strategy_base;
    std::string strategy_id;
    
    // HTTP
    std::string listen_addr;
    int listen_port;
    
    // Service
    std::string service_name;
    std::string log_level;
    
    static Config from_env();
    void validate() const;
    
private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static int64_t get_env_int64(const char* name, int64_t default_val);
};
