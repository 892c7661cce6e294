#pragma once
// =============================================================================
// datefmt - Locales
// Version: 1.2.0
// Name tables for text fields (months, weekdays, half-days, eras)
// =============================================================================

#include "datefmt/common/types.hpp"
#include "datefmt/common/error.hpp"

namespace datefmt::chrono {

enum class NameStyle : UInt8 {
    SHORT,
    LONG
};

// =============================================================================
// Locale
// =============================================================================

class Locale {
public:
    virtual ~Locale() = default;

    [[nodiscard]] virtual const String& id() const = 0;

    // month 1-12
    [[nodiscard]] virtual const String& month_name(Int32 month, NameStyle style) const = 0;
    // day_of_week 1=Monday .. 7=Sunday
    [[nodiscard]] virtual const String& weekday_name(Int32 day_of_week, NameStyle style) const = 0;
    [[nodiscard]] virtual const String& halfday_text(bool pm) const = 0;
    [[nodiscard]] virtual const String& era_text(bool ad) const = 0;

    [[nodiscard]] bool equals(const Locale& other) const { return id() == other.id(); }
};

using LocalePtr = SharedPtr<const Locale>;

// Locale backed by fixed string tables
class TableLocale : public Locale {
public:
    struct Tables {
        std::array<String, 12> months_long;
        std::array<String, 12> months_short;
        std::array<String, 7> weekdays_long;   // Monday first
        std::array<String, 7> weekdays_short;
        std::array<String, 2> halfdays;        // AM, PM
        std::array<String, 2> eras;            // BC, AD
    };

private:
    String id_;
    Tables tables_;

public:
    TableLocale(String id, Tables tables)
        : id_(std::move(id)), tables_(std::move(tables)) {}

    [[nodiscard]] const String& id() const override { return id_; }
    [[nodiscard]] const String& month_name(Int32 month, NameStyle style) const override;
    [[nodiscard]] const String& weekday_name(Int32 day_of_week, NameStyle style) const override;
    [[nodiscard]] const String& halfday_text(bool pm) const override { return tables_.halfdays[pm ? 1 : 0]; }
    [[nodiscard]] const String& era_text(bool ad) const override { return tables_.eras[ad ? 1 : 0]; }
};

// =============================================================================
// Locale Lookup
// =============================================================================

namespace locales {

[[nodiscard]] LocalePtr english();
[[nodiscard]] LocalePtr french();
[[nodiscard]] LocalePtr german();

// "en", "fr", "de"; a region suffix such as "en_US" or "de-AT" is ignored
[[nodiscard]] Result<LocalePtr> for_id(StringView id);

[[nodiscard]] Vector<String> ids();

} // namespace locales

} // namespace datefmt::chrono
