#include "config.hpp"
#include "errors.hpp"
#include "health.hpp"
#include "hermes_client.hpp"
#include "http_strategy.hpp"
#include "memory_store.hpp"
#include "mock_oracle.hpp"
#include "postgres_store.hpp"
#include "price_oracle.hpp"
#include "redis_bus.hpp"
#include "util.hpp"
#include "vault_commands.hpp"
#include "vault_engine.hpp"
#include "vault_json.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <curl/curl.h>
#include <signal.h>
#include <atomic>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& service_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);
    
    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void command_consumer_loop(std::shared_ptr<Config> config,
                           std::shared_ptr<RedisBus> redis,
                           std::shared_ptr<VaultCommands> commands,
                           std::atomic<bool>& running) {
    
    spdlog::info("Starting command consumer");
    redis->ensure_group(config->stream_req);
    
    while (running) {
        try {
            auto messages = redis->read_commands(config->stream_req, 10, 1000);
            
            for (const auto& [msg_id, cmd_json] : messages) {
                commands->dispatch(cmd_json);
                redis->ack_message(config->stream_req, msg_id);
            }
            
        } catch (const std::exception& e) {
            spdlog::error("Command consumer error: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
    
    spdlog::info("Command consumer stopped");
}

int main() {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->service_name, config->log_level);
        
        spdlog::info("==============================================");
        spdlog::info("Pooled Vault Service v1.0");
        spdlog::info("==============================================");
        
        config->validate();
        
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);
        
        curl_global_init(CURL_GLOBAL_DEFAULT);
        
        auto redis = std::make_shared<RedisBus>(config->redis_url, config->service_name,
                                                config->service_name + "-1");
        auto pg = std::make_shared<PostgresStore>(config->pg_dsn);
        
        QuotePolicy policy;
        policy.max_age_secs = config->max_quote_age_secs;
        policy.max_price_usd_micro = config->max_price_usd_micro;
        
        auto oracle = std::make_shared<PriceOracle>();
        oracle->register_source(OracleSource::Hermes,
                                std::make_shared<HermesClient>(config->hermes_base,
                                                               config->request_timeout_ms),
                                policy);
        
        std::shared_ptr<MockPriceOracle> mock_oracle;
        if (config->oracle_source == "mock") {
            mock_oracle = std::make_shared<MockPriceOracle>(config->mock_oracle_authority);
            oracle->register_source(OracleSource::Mock, mock_oracle, policy);
        }
        
        RebalancePolicy rebalance_policy;
        rebalance_policy.threshold_percent = config->drift_threshold_pct;
        rebalance_policy.max_swaps = static_cast<size_t>(config->max_swaps);
        rebalance_policy.slippage_bps = static_cast<uint32_t>(config->slippage_bps);
        rebalance_policy.min_swap_usd_micro = config->min_swap_usd_micro;
        
        EngineCollaborators collaborators;
        collaborators.oracle = oracle;
        collaborators.balances = pg;
        // Balances move in Postgres once the whole plan went through
        collaborators.swaps = std::make_shared<SimulatedSwapExecutor>(
            oracle, util::current_unix_seconds);
        if (!config->strategy_base.empty()) {
            collaborators.strategy = std::make_shared<HttpYieldStrategy>(
                config->strategy_base, config->strategy_id, config->request_timeout_ms);
        }
        
        auto engine = std::make_shared<VaultEngine>(collaborators, rebalance_policy);
        auto commands = std::make_shared<VaultCommands>(config, pg, redis, engine, mock_oracle);
        auto health = std::make_shared<HealthCheck>(redis, pg, oracle);
        
        pg->init_schema();
        
        std::atomic<bool> consumer_running{true};
        std::thread consumer_thread(command_consumer_loop, config, redis, commands,
                                    std::ref(consumer_running));
        
        httplib::Server server;
        
        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            auto status = health->get_status();
            res.set_content(status.dump(), "application/json");
            res.status = health->is_healthy() ? 200 : 503;
        });
        
        server.Get(R"(/vaults/([A-Za-z0-9_\-]+))",
                   [pg](const httplib::Request& req, httplib::Response& res) {
            try {
                auto record = pg->load_vault(req.matches[1].str());
                if (!record.has_value()) {
                    res.status = 404;
                    res.set_content(R"({"error":"not found"})", "application/json");
                    return;
                }
                
                nlohmann::json body = {
                    {"composition", record->composition},
                    {"balances", pg->get_balances(record->composition.name)},
                    {"total_shares", record->shares.total_supply()},
                    {"holders", record->shares.balances()}
                };
                res.set_content(body.dump(), "application/json");
            } catch (const std::exception& e) {
                spdlog::error("GET /vaults failed: {}", e.what());
                res.status = 500;
                res.set_content(nlohmann::json{{"error", e.what()}}.dump(), "application/json");
            }
        });
        
        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });
        
        spdlog::info("Vault service started");
        
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        
        spdlog::info("Stopping services...");
        consumer_running = false;
        server.stop();
        
        if (consumer_thread.joinable()) consumer_thread.join();
        if (http_thread.joinable()) http_thread.join();
        
        curl_global_cleanup();
        spdlog::info("Shutdown complete");
        return 0;
        
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
