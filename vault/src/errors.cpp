#include "errors.hpp"

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::MathOverflow: return "MathOverflow";
        case ErrorCode::InvalidPrice: return "InvalidPrice";
        case ErrorCode::StaleQuote: return "StaleQuote";
        case ErrorCode::InsufficientShares: return "InsufficientShares";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::InvalidWeights: return "InvalidWeights";
        case ErrorCode::InvalidAssetCount: return "InvalidAssetCount";
        case ErrorCode::InvalidName: return "InvalidName";
        case ErrorCode::InvalidAsset: return "InvalidAsset";
        case ErrorCode::InvalidAmount: return "InvalidAmount";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::AssetNotFound: return "AssetNotFound";
        case ErrorCode::ImpairedVault: return "ImpairedVault";
        case ErrorCode::SwapFailed: return "SwapFailed";
        case ErrorCode::StrategyError: return "StrategyError";
        case ErrorCode::ComputationMismatch: return "ComputationMismatch";
        default: return "Unknown";
    }
}

VaultError::VaultError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(error_code_name(code)) + ": " + message)
    , code_(code)
{}

VaultError::VaultError(ErrorCode code)
    : std::runtime_error(error_code_name(code))
    , code_(code)
{}
