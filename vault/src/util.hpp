#pragma once

#include <cstdint>
#include <string>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();
    int64_t current_unix_seconds();
    
    // Masks the password of a URI or keyword/value connection string
    std::string redact_dsn(const std::string& dsn);
    
    // Base58, 32 to 44 characters
    bool is_valid_solana_address(const std::string& address);
}
