#include "price_oracle.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

void PriceOracle::register_source(OracleSource source,
                                  std::shared_ptr<OracleProvider> provider,
                                  const QuotePolicy& policy) {
    sources_[source] = Source{provider, policy};
    spdlog::info("Registered {} oracle (max age {}s)", oracle_source_string(source),
                 policy.max_age_secs);
}

bool PriceOracle::has_source(OracleSource source) const {
    return sources_.count(source) > 0;
}

const PriceOracle::Source& PriceOracle::source_for(OracleSource source) const {
    auto it = sources_.find(source);
    if (it == sources_.end()) {
        throw VaultError(ErrorCode::InvalidPrice,
                         "no " + oracle_source_string(source) + " oracle configured");
    }
    return it->second;
}

NormalizedPrice PriceOracle::accept_quote(const OracleQuote& quote, const QuotePolicy& policy,
                                          int64_t now) {
    int64_t age = now - quote.observed_at;
    if (age > policy.max_age_secs) {
        spdlog::warn("Quote is {}s old (max {}s)", age, policy.max_age_secs);
        throw VaultError(ErrorCode::StaleQuote,
                         "quote age " + std::to_string(age) + "s exceeds " +
                         std::to_string(policy.max_age_secs) + "s");
    }
    
    if (quote.raw_price <= 0) {
        throw VaultError(ErrorCode::InvalidPrice,
                         "non-positive quote " + std::to_string(quote.raw_price));
    }
    
    auto price = PriceNormalizer::normalize(quote.raw_price, quote.raw_exponent);
    
    if (price.usd_micro >= policy.max_price_usd_micro) {
        spdlog::warn("Quote {} usd_micro above sanity ceiling {}", price.usd_micro,
                     policy.max_price_usd_micro);
        throw VaultError(ErrorCode::InvalidPrice,
                         "price " + std::to_string(price.usd_micro) + " above ceiling");
    }
    
    return price;
}

NormalizedPrice PriceOracle::price_feed(OracleSource source, const std::string& feed_id,
                                        int64_t now) {
    const auto& src = source_for(source);
    auto quote = src.provider->get_quote(feed_id);
    auto price = accept_quote(quote, src.policy, now);
    spdlog::debug("Priced {} via {}: {} usd_micro", feed_id, oracle_source_string(source),
                  price.usd_micro);
    return price;
}

VaultPrices PriceOracle::price_vault(const VaultComposition& composition, int64_t now) {
    VaultPrices prices;
    prices.base = price_feed(composition.oracle_source, composition.base.oracle_feed, now);
    
    prices.assets.reserve(composition.assets.size());
    for (const auto& asset : composition.assets) {
        if (asset.oracle_feed == composition.base.oracle_feed) {
            prices.assets.push_back(prices.base);
        } else {
            prices.assets.push_back(price_feed(composition.oracle_source, asset.oracle_feed, now));
        }
    }
    
    return prices;
}

bool PriceOracle::is_healthy() const {
    for (const auto& [source, src] : sources_) {
        if (!src.provider->is_healthy()) return false;
    }
    return !sources_.empty();
}
