#pragma once

#include <string>
#include <map>
#include <unordered_map>

namespace termbar {
namespace common {

// Name and default message for one error code.
struct ErrorInfo {
    const char* code_str;
    const char* default_message;
};

// Where an error was raised, plus key=value details appended to the message.
struct ErrorContext {
    std::string component;
    std::map<std::string, std::string> details;
};

// Each error enum specializes codeTable() with its entries.
template<typename EnumType>
class ErrorRegistry {
public:
    static const char* toString(EnumType code) {
        return lookup(code).code_str;
    }
    
    static const char* getMessage(EnumType code) {
        return lookup(code).default_message;
    }

private:
    static const std::unordered_map<EnumType, ErrorInfo>& codeTable();
    
    static const ErrorInfo& lookup(EnumType code) {
        static const ErrorInfo unknown{"UNKNOWN_ERROR", "Unknown error"};
        const auto& table = codeTable();
        auto it = table.find(code);
        return it != table.end() ? it->second : unknown;
    }
};

inline std::string formatContext(const ErrorContext& ctx) {
    std::string result;
    for (const auto& [key, value] : ctx.details) {
        if (!result.empty()) {
            result += " | ";
        }
        result += key + "=" + value;
    }
    return result;
}

}}
