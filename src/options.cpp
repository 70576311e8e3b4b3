/**
 * @file options.cpp
 * @brief Date filter parsing and the local calendar date.
 */

#include <vif2csv/error.hpp>
#include <vif2csv/options.hpp>

#include <cctype>
#include <ctime>

namespace vif2csv {

namespace {

bool is_digits(const std::string& text, std::size_t start, std::size_t count) noexcept {
    for (std::size_t i = start; i < start + count; ++i) {
        if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) {
            return false;
        }
    }
    return true;
}

} // namespace

bool validate_date_string(const std::string& text) noexcept {
    if (text.size() == 8) {
        // YY-MM-DD
        return text[2] == '-' && text[5] == '-' && is_digits(text, 0, 2) && is_digits(text, 3, 2) &&
               is_digits(text, 6, 2);
    }
    if (text.size() == 10) {
        // YYYY-MM-DD
        return text[4] == '-' && text[7] == '-' && is_digits(text, 0, 4) && is_digits(text, 5, 2) &&
               is_digits(text, 8, 2);
    }
    return false;
}

std::string normalize_date_string(const std::string& text) {
    if (!validate_date_string(text)) {
        throw InvalidArgumentException("invalid date format. Use YYYY-MM-DD or YY-MM-DD");
    }
    if (text.size() == 8) {
        return "20" + text;
    }
    return text;
}

CalendarDate local_today() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    if (localtime_r(&now, &local) == nullptr) {
        throw VifException("cannot determine local date", Error::InvalidData);
    }
    return CalendarDate{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
}

} // namespace vif2csv
