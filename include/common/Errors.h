#pragma once

#include <stdexcept>
#include <string>

namespace gridcycle {

enum class ErrorCode {
    InvalidConfiguration,   // 잘못된 사이징/가드 입력 - 해당 작업만 건너뜀
    VenueUnavailable,       // 일시적 통신 실패 - 다음 틱에 재시도
    OrderRejected,          // 거래소 주문 거절 - 레이어는 unplaced 유지
    MaxReduceBreached,      // 긴급 청산 + 정지
    DuplicateSuppressed     // 오류 아님 (동일 가격 주문 존재)
};

const char* toString(ErrorCode code);

class GridCycleError : public std::runtime_error {
public:
    GridCycleError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class InvalidConfigurationError : public GridCycleError {
public:
    explicit InvalidConfigurationError(const std::string& message)
        : GridCycleError(ErrorCode::InvalidConfiguration, message) {}
};

class VenueUnavailableError : public GridCycleError {
public:
    explicit VenueUnavailableError(const std::string& message)
        : GridCycleError(ErrorCode::VenueUnavailable, message) {}
};

inline const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorCode::VenueUnavailable: return "VenueUnavailable";
        case ErrorCode::OrderRejected: return "OrderRejected";
        case ErrorCode::MaxReduceBreached: return "MaxReduceBreached";
        case ErrorCode::DuplicateSuppressed: return "DuplicateSuppressed";
    }
    return "Unknown";
}

} // namespace gridcycle
