#pragma once

#include "../common/error_framework.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace termbar {
namespace progress {

enum class ProgressErrorCode {
    INVALID_FORMAT = 100,
    INVALID_OPTION = 101,
    
    MAX_BELOW_VALUE = 200,
    
    DURATION_OUT_OF_RANGE = 300
};

using ProgressErrorCodeHelper = common::ErrorRegistry<ProgressErrorCode>;

// Raised for programmer misuse and broken estimates. Not meant to be recovered
// from; the CLI lets it reach main and exits non-zero.
class ProgressError : public std::logic_error {
public:
    ProgressError(ProgressErrorCode code, common::ErrorContext context);
    
    ProgressErrorCode code() const noexcept { return code_; }
    const common::ErrorContext& context() const noexcept { return context_; }

private:
    ProgressErrorCode code_;
    common::ErrorContext context_;
    
    static std::string describe(ProgressErrorCode code, const common::ErrorContext& context);
};

}
}

namespace termbar {
namespace common {

template<>
inline const std::unordered_map<progress::ProgressErrorCode, ErrorInfo>&
ErrorRegistry<progress::ProgressErrorCode>::codeTable() {
    using progress::ProgressErrorCode;
    static const std::unordered_map<ProgressErrorCode, ErrorInfo> table = {
        {ProgressErrorCode::INVALID_FORMAT,
         {"INVALID_FORMAT", "Bar format must be exactly three glyphs (begin, fill, end)"}},
        {ProgressErrorCode::INVALID_OPTION,
         {"INVALID_OPTION", "Invalid progress bar option"}},
        {ProgressErrorCode::MAX_BELOW_VALUE,
         {"MAX_BELOW_VALUE", "New maximum is below the current progress value"}},
        {ProgressErrorCode::DURATION_OUT_OF_RANGE,
         {"DURATION_OUT_OF_RANGE", "Duration exceeds the representable range"}}
    };
    return table;
}

}
}
