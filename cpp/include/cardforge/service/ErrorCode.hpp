#pragma once

#include <string_view>

namespace cardforge::service {

enum class ErrorCode {
    None,
    InvalidFormat,
    Blocked,
    NotFound,
    UnsupportedAvsCountry,
    QuotaExceeded,
    InvalidRequest,
    StoreUnavailable,
    InvariantViolation,
    Internal
};

inline std::string_view toString(ErrorCode code) {
    switch (code) {
    case ErrorCode::None: return "none";
    case ErrorCode::InvalidFormat: return "invalid_format";
    case ErrorCode::Blocked: return "blocked";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::UnsupportedAvsCountry: return "unsupported_avs_country";
    case ErrorCode::QuotaExceeded: return "quota_exceeded";
    case ErrorCode::InvalidRequest: return "invalid_request";
    case ErrorCode::StoreUnavailable: return "store_unavailable";
    case ErrorCode::InvariantViolation: return "invariant_violation";
    case ErrorCode::Internal: return "internal";
    }
    return "internal";
}

} // namespace cardforge::service
