#pragma once

#include <stdexcept>
#include <string>

enum class ErrorCode {
    MathOverflow,
    InvalidPrice,
    StaleQuote,
    InsufficientShares,
    InsufficientBalance,
    InvalidWeights,
    InvalidAssetCount,
    InvalidName,
    InvalidAsset,
    InvalidAmount,
    Unauthorized,
    AssetNotFound,
    ImpairedVault,
    SwapFailed,
    StrategyError,
    ComputationMismatch
};

const char* error_code_name(ErrorCode code);

class VaultError : public std::runtime_error {
public:
    VaultError(ErrorCode code, const std::string& message);
    explicit VaultError(ErrorCode code);
    
    ErrorCode code() const { return code_; }
    
private:
    ErrorCode code_;
};
