// =============================================================================
// datefmt - Locales Implementation
// Version: 1.2.0
// =============================================================================

#include <datefmt/chrono/locale.hpp>

namespace datefmt::chrono {

namespace {

const String& empty_name() {
    static const String empty;
    return empty;
}

} // anonymous namespace

const String& TableLocale::month_name(Int32 month, NameStyle style) const {
    if (month < 1 || month > 12) return empty_name();
    const auto& table = style == NameStyle::LONG ? tables_.months_long : tables_.months_short;
    return table[static_cast<Size>(month - 1)];
}

const String& TableLocale::weekday_name(Int32 day_of_week, NameStyle style) const {
    if (day_of_week < 1 || day_of_week > 7) return empty_name();
    const auto& table = style == NameStyle::LONG ? tables_.weekdays_long : tables_.weekdays_short;
    return table[static_cast<Size>(day_of_week - 1)];
}

namespace locales {

LocalePtr english() {
    static const LocalePtr locale = std::make_shared<TableLocale>("en", TableLocale::Tables{
        {"January", "February", "March", "April", "May", "June", "July",
         "August", "September", "October", "November", "December"},
        {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"},
        {"Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"},
        {"Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"},
        {"AM", "PM"},
        {"BC", "AD"}});
    return locale;
}

LocalePtr french() {
    static const LocalePtr locale = std::make_shared<TableLocale>("fr", TableLocale::Tables{
        {"janvier", "f\xC3\xA9vrier", "mars", "avril", "mai", "juin", "juillet",
         "ao\xC3\xBBt", "septembre", "octobre", "novembre", "d\xC3\xA9" "cembre"},
        {"janv.", "f\xC3\xA9vr.", "mars", "avr.", "mai", "juin", "juil.",
         "ao\xC3\xBBt", "sept.", "oct.", "nov.", "d\xC3\xA9" "c."},
        {"lundi", "mardi", "mercredi", "jeudi", "vendredi", "samedi", "dimanche"},
        {"lun.", "mar.", "mer.", "jeu.", "ven.", "sam.", "dim."},
        {"AM", "PM"},
        {"av. J.-C.", "ap. J.-C."}});
    return locale;
}

LocalePtr german() {
    static const LocalePtr locale = std::make_shared<TableLocale>("de", TableLocale::Tables{
        {"Januar", "Februar", "M\xC3\xA4rz", "April", "Mai", "Juni", "Juli",
         "August", "September", "Oktober", "November", "Dezember"},
        {"Jan", "Feb", "M\xC3\xA4r", "Apr", "Mai", "Jun", "Jul", "Aug", "Sep", "Okt", "Nov", "Dez"},
        {"Montag", "Dienstag", "Mittwoch", "Donnerstag", "Freitag", "Samstag", "Sonntag"},
        {"Mo", "Di", "Mi", "Do", "Fr", "Sa", "So"},
        {"AM", "PM"},
        {"v. Chr.", "n. Chr."}});
    return locale;
}

Result<LocalePtr> for_id(StringView id) {
    String name = trim(id);
    StringView language = name;
    auto sep = language.find_first_of("_-");
    if (sep != StringView::npos) language = language.substr(0, sep);

    if (equals_ignore_case(language, "en")) return english();
    if (equals_ignore_case(language, "fr")) return french();
    if (equals_ignore_case(language, "de")) return german();
    return ErrorInfo(ErrorCode::UNKNOWN_LOCALE, "Unknown locale '" + name + "'", "locales");
}

Vector<String> ids() {
    return {"de", "en", "fr"};
}

} // namespace locales

} // namespace datefmt::chrono
