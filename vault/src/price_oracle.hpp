#pragma once

#include "collaborators.hpp"
#include "composition.hpp"
#include "price_normalizer.hpp"
#include <map>
#include <memory>
#include <vector>

struct QuotePolicy {
    int64_t max_age_secs = 120;
    int64_t max_price_usd_micro = 10000000000000LL;
};

struct VaultPrices {
    NormalizedPrice base;
    std::vector<NormalizedPrice> assets;
};

class PriceOracle {
public:
    void register_source(OracleSource source,
                         std::shared_ptr<OracleProvider> provider,
                         const QuotePolicy& policy);
    
    bool has_source(OracleSource source) const;
    
    NormalizedPrice price_feed(OracleSource source, const std::string& feed_id, int64_t now);
    
    // Base currency and every asset, from the vault's configured source
    VaultPrices price_vault(const VaultComposition& composition, int64_t now);
    
    bool is_healthy() const;
    
    // Freshness and plausibility checks, then normalization
    static NormalizedPrice accept_quote(const OracleQuote& quote, const QuotePolicy& policy,
                                        int64_t now);
    
private:
    struct Source {
        std::shared_ptr<OracleProvider> provider;
        QuotePolicy policy;
    };
    
    std::map<OracleSource, Source> sources_;
    
    const Source& source_for(OracleSource source) const;
};
