// =============================================================================
// datefmt - Time Zones Implementation
// Version: 1.2.0
// =============================================================================

#include <datefmt/chrono/time_zone.hpp>
#include <format>

namespace datefmt::chrono::zones {

namespace {

// Reads exactly two digits at pos, advancing it
Optional<Int64> read_two_digits(StringView text, Size& pos) {
    if (pos + 2 > text.size() || !is_digit(text[pos]) || !is_digit(text[pos + 1])) {
        return nullopt;
    }
    Int64 value = (text[pos] - '0') * 10 + (text[pos + 1] - '0');
    pos += 2;
    return value;
}

Result<Int64> parse_offset(StringView text) {
    if (text.empty() || (text[0] != '+' && text[0] != '-')) {
        return make_error<Int64>(ErrorCode::UNKNOWN_ZONE, "Offset must start with '+' or '-'");
    }
    Int64 sign = text[0] == '-' ? -1 : 1;
    Size pos = 1;

    Int64 hours = 0;
    if (auto hh = read_two_digits(text, pos)) {
        hours = *hh;
    } else if (pos < text.size() && is_digit(text[pos])) {
        hours = text[pos++] - '0';
    } else {
        return make_error<Int64>(ErrorCode::UNKNOWN_ZONE, "Offset hours missing");
    }

    Int64 minutes = 0;
    Int64 seconds = 0;
    if (pos < text.size()) {
        bool colon = text[pos] == ':';
        if (colon) ++pos;
        auto mm = read_two_digits(text, pos);
        if (!mm) return make_error<Int64>(ErrorCode::UNKNOWN_ZONE, "Offset minutes malformed");
        minutes = *mm;
        if (pos < text.size()) {
            if (colon && text[pos] == ':') ++pos;
            auto ss = read_two_digits(text, pos);
            if (!ss) return make_error<Int64>(ErrorCode::UNKNOWN_ZONE, "Offset seconds malformed");
            seconds = *ss;
        }
    }
    if (pos != text.size() || hours > 23 || minutes > 59 || seconds > 59) {
        return make_error<Int64>(ErrorCode::UNKNOWN_ZONE, "Offset out of range");
    }
    return sign * (hours * MILLIS_PER_HOUR + minutes * MILLIS_PER_MINUTE + seconds * MILLIS_PER_SECOND);
}

} // anonymous namespace

ZonePtr utc() {
    static const ZonePtr zone = std::make_shared<FixedOffsetZone>("UTC", 0);
    return zone;
}

String offset_id(Int64 offset_millis) {
    String id = offset_millis < 0 ? "-" : "+";
    Int64 rest = offset_millis < 0 ? -offset_millis : offset_millis;
    id += zero_padded(static_cast<UInt64>(rest / MILLIS_PER_HOUR), 2);
    rest %= MILLIS_PER_HOUR;
    id += ":" + zero_padded(static_cast<UInt64>(rest / MILLIS_PER_MINUTE), 2);
    rest %= MILLIS_PER_MINUTE;
    if (rest != 0) {
        id += ":" + zero_padded(static_cast<UInt64>(rest / MILLIS_PER_SECOND), 2);
        rest %= MILLIS_PER_SECOND;
        if (rest != 0) id += "." + zero_padded(static_cast<UInt64>(rest), 3);
    }
    return id;
}

Result<ZonePtr> for_offset_millis(Int64 offset_millis) {
    if (offset_millis <= -MAX_OFFSET_MILLIS || offset_millis >= MAX_OFFSET_MILLIS) {
        return make_error<ZonePtr>(ErrorCode::UNKNOWN_ZONE,
            std::format("Offset {}ms is out of range", offset_millis));
    }
    if (offset_millis == 0) return utc();
    return ZonePtr(std::make_shared<FixedOffsetZone>(offset_id(offset_millis), offset_millis));
}

Result<ZonePtr> for_id(StringView id) {
    String name = trim(id);
    if (equals_ignore_case(name, "UTC") || equals_ignore_case(name, "GMT") || name == "Z") {
        return utc();
    }
    StringView offset = name;
    if (starts_with_ignore_case(offset, "UTC") || starts_with_ignore_case(offset, "GMT")) {
        offset.remove_prefix(3);
    }
    auto millis = parse_offset(offset);
    if (millis.is_error()) {
        ErrorInfo err(ErrorCode::UNKNOWN_ZONE, "Unknown time zone id '" + name + "'", "zones");
        err.with_context("reason", millis.error().message);
        return err;
    }
    return for_offset_millis(*millis);
}

} // namespace datefmt::chrono::zones
