#include "termbar/progress/error_codes.hpp"
#include <utility>

namespace termbar {
namespace progress {

ProgressError::ProgressError(ProgressErrorCode code, common::ErrorContext context)
    : std::logic_error(describe(code, context)),
      code_(code),
      context_(std::move(context)) {
}

std::string ProgressError::describe(ProgressErrorCode code, const common::ErrorContext& context) {
    std::string message = std::string(ProgressErrorCodeHelper::toString(code)) + ": " +
                          ProgressErrorCodeHelper::getMessage(code);
    
    std::string details = common::formatContext(context);
    if (!context.component.empty()) {
        message = "[" + context.component + "] " + message;
    }
    if (!details.empty()) {
        message += " | " + details;
    }
    return message;
}

}}
