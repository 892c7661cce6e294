// =============================================================================
// datefmt - Formatting Example
// Version: 1.2.0
// Demonstrates: Patterns, Built-in Formatters, Zones, Locales, parse_any
// =============================================================================

#include <iostream>
#include <string>

#include "datefmt/format/datefmt.hpp"

using namespace datefmt;

void demo_patterns(Instant instant) {
    std::cout << "\n=== Pattern Demo ===\n";

    for (const char* pattern : {"yyyy-MM-dd HH:mm:ss.SSS", "EEE, d MMM yyyy h:mm a",
                                "xxxx-'W'ww-e", "'day' D 'of' yyyy G"}) {
        auto compiled = compile(pattern);
        if (!compiled) {
            std::cout << pattern << " -> " << compiled.error().to_string() << "\n";
            continue;
        }
        std::cout << pattern << " -> " << print(*compiled, instant).value_or("?") << "\n";
    }

    auto broken = compile("yyyy-'MM");
    std::cout << "yyyy-'MM -> " << broken.error().to_string() << "\n";
}

void demo_zones_and_locales(Instant instant) {
    std::cout << "\n=== Zone and Locale Demo ===\n";

    auto base = compile("EEEE d MMMM yyyy HH:mm ZZ");
    if (!base) return;

    for (const char* zone_id : {"UTC", "+01:00", "-05:00", "+05:30"}) {
        auto zone = chrono::zones::for_id(zone_id);
        if (!zone) continue;
        std::cout << zone_id << ": " << with_zone(*base, *zone).print(instant).value_or("?") << "\n";
    }
    for (const String& locale_id : chrono::locales::ids()) {
        auto locale = chrono::locales::for_id(locale_id);
        if (!locale) continue;
        std::cout << locale_id << ": " << with_locale(*base, *locale).print(instant).value_or("?") << "\n";
    }
}

void demo_builtins(Instant instant) {
    std::cout << "\n=== Built-in Formatter Demo ===\n";

    for (const char* name : {"date-time", "basic-date-time", "ordinal-date", "week-date", "rfc822"}) {
        auto f = formatter(name);
        if (!f) continue;
        std::cout << name << ": " << f->print(instant).value_or("?") << "\n";
    }
    std::cout << list_registry().size() << " built-in formatters\n";
}

void demo_parsing() {
    std::cout << "\n=== Parsing Demo ===\n";

    for (const char* text : {"2010-03-11", "20100311T134530.123Z", "Thu, 11 Mar 2010 13:45:30 +0000",
                             "2010-13-45"}) {
        auto instant = parse_any(text);
        if (instant) {
            std::cout << text << " -> " << instant->epoch_millis() << "\n";
        } else {
            std::cout << text << " -> " << instant.error().to_string() << "\n";
        }
    }

    auto two_digit = compile("dd/MM/yy");
    if (two_digit) {
        for (Int32 pivot : {1950, 2050}) {
            auto parsed = parse(with_pivot_year(*two_digit, pivot), "11/03/49");
            if (parsed) std::cout << "pivot " << pivot << ": 49 -> " << parsed->epoch_millis() << "\n";
        }
    }
}

int main() {
    std::cout << "datefmt Formatting Example\n";
    std::cout << "==========================\n";

    const Instant instant(1268315130123);  // 2010-03-11T13:45:30.123Z

    demo_patterns(instant);
    demo_zones_and_locales(instant);
    demo_builtins(instant);
    demo_parsing();

    std::cout << "\nExample completed.\n";
    return 0;
}
