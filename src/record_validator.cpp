/**
 * @file record_validator.cpp
 * @brief Acceptance checks for scanned candidates.
 */

#include <vif2csv/record_validator.hpp>

#include <cstdio>

namespace vif2csv {

const char* rejection_string(Rejection rejection) noexcept {
    switch (rejection) {
    case Rejection::None:
        return "accepted";
    case Rejection::ReadType:
        return "irregular read type";
    case Rejection::Size:
        return "unexpected record size";
    case Rejection::Type:
        return "unexpected record type";
    case Rejection::DateTime:
        return "invalid date/time";
    case Rejection::Filter:
        return "excluded by date filter";
    default:
        return "unknown";
    }
}

RecordValidator::RecordValidator(const DecodeOptions& options) : date_filter_(options.date_filter) {
    if (options.filter_today) {
        today_ = options.today ? *options.today : local_today();
    }
}

bool RecordValidator::is_valid_to_process(std::uint16_t record_size, int read_type) noexcept {
    if (read_type < 0 || read_type > READ_TYPE_MAX) {
        return false;
    }
    return record_size == RECORD_SIZE && ((1U << read_type) & READ_TYPE_MASK) != 0;
}

int RecordValidator::days_in_month(int month, int year_yy) noexcept {
    switch (month) {
    case 1:
    case 3:
    case 5:
    case 7:
    case 8:
    case 10:
    case 12:
        return 31;
    case 4:
    case 6:
    case 9:
    case 11:
        return 30;
    case 2:
        return ((year_yy & 3) == 0) ? 29 : 28;
    default:
        return 0;
    }
}

bool RecordValidator::datetime_valid(int second, int minute, int hour, int day, int month,
                                     int year_yy) noexcept {
    if (second > 59 || minute > 59 || hour > 23) {
        return false;
    }
    if (year_yy > 99) {
        return false;
    }
    if (month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= days_in_month(month, year_yy);
}

Rejection RecordValidator::check(const ScannedRecord& scanned, AcceptedRecord& accepted) const {
    const RawRecordCandidate& candidate = scanned.candidate;
    ByteReader rec = candidate.reader();
    std::uint16_t record_size = candidate.declared_size();

    if (!is_valid_to_process(record_size, scanned.read_type)) {
        return (record_size != RECORD_SIZE) ? Rejection::Size : Rejection::ReadType;
    }
    if ((candidate.type() & TYPE_MASK) != TYPE_STANDARD) {
        return Rejection::Type;
    }

    int second = rec.u8(offsets::SECOND);
    int minute = rec.u8(offsets::MINUTE);
    int hour = rec.u8(offsets::HOUR);
    int day = rec.u8(offsets::DAY);
    int month = rec.u8(offsets::MONTH);
    int year_yy = rec.u8(offsets::YEAR);

    if (!datetime_valid(second, minute, hour, day, month, year_yy)) {
        return Rejection::DateTime;
    }

    CalendarDate date{2000 + year_yy, month, day};

    char date_buf[16];
    std::snprintf(date_buf, sizeof(date_buf), "%04d-%02d-%02d", date.year, date.month, date.day);
    char time_buf[16];
    std::snprintf(time_buf, sizeof(time_buf), "%02d:%02d:%02d", hour, minute, second);

    // The today filter takes precedence over an explicit day
    if (today_) {
        if (date != *today_) {
            return Rejection::Filter;
        }
    } else if (date_filter_ && *date_filter_ != date_buf) {
        return Rejection::Filter;
    }

    accepted.candidate = &candidate;
    accepted.date = date;
    accepted.hour = hour;
    accepted.minute = minute;
    accepted.second = second;
    accepted.date_text = date_buf;
    accepted.time_text = time_buf;
    return Rejection::None;
}

} // namespace vif2csv
