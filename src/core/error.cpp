/// @file error.cpp
/// @brief Error formatting for streak_core

#include <streak/core/error.hpp>
#include <sstream>

namespace streak_core {

namespace {

const char* kind_label(const Error::Variant& variant) {
    return std::visit([](const auto& err) -> const char* {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, ImageError>) return "ImageError";
        else if constexpr (std::is_same_v<T, HandleError>) return "HandleError";
        else if constexpr (std::is_same_v<T, ConfigError>) return "ConfigError";
        else if constexpr (std::is_same_v<T, InputError>) return "InputError";
        else return "Error";
    }, variant);
}

} // anonymous namespace

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;
    oss << "[" << kind_label(error.variant()) << "/" << error_code_name(error.code()) << "] "
        << error.message();

    const auto& context = error.context();
    if (!context.empty()) {
        oss << " (";
        bool first = true;
        for (const auto& [key, value] : context) {
            if (!first) oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << ")";
    }

    return oss.str();
}

} // namespace streak_core
