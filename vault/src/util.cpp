#include "util.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

int64_t current_unix_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string redact_dsn(const std::string& dsn) {
    // Keyword form: host=... password=secret ...
    auto kw = dsn.find("password=");
    if (kw != std::string::npos) {
        auto value_start = kw + 9;
        auto value_end = dsn.find(' ', value_start);
        return dsn.substr(0, value_start) + "***" +
               (value_end == std::string::npos ? "" : dsn.substr(value_end));
    }
    
    auto scheme_end = dsn.find("://");
    auto at = dsn.rfind('@');
    if (scheme_end == std::string::npos || at == std::string::npos || at < scheme_end) {
        return dsn;
    }
    
    auto colon = dsn.find(':', scheme_end + 3);
    if (colon == std::string::npos || colon > at) {
        return dsn;
    }
    
    return dsn.substr(0, colon + 1) + "***" + dsn.substr(at);
}

bool is_valid_solana_address(const std::string& address) {
    if (address.size() < 32 || address.size() > 44) {
        return false;
    }
    
    static const std::string alphabet =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
    return address.find_first_not_of(alphabet) == std::string::npos;
}

} // namespace util
