#pragma once
// =============================================================================
// datefmt - Built-in Formatter Registry
// Version: 1.2.0
// Read-only catalog of the ISO-8601 layouts and the RFC 822 layout
// =============================================================================

#include "datefmt/common/types.hpp"
#include "datefmt/common/error.hpp"
#include "datefmt/format/formatter.hpp"
#include <map>

namespace datefmt::format {

struct Capabilities {
    bool can_parse = false;
    bool can_print = false;

    bool operator==(const Capabilities&) const = default;
};

struct RegistryEntry {
    String name;
    Formatter formatter;
    Capabilities capabilities;
};

struct RegistryListing {
    String name;
    Capabilities capabilities;

    bool operator==(const RegistryListing&) const = default;
};

class Registry {
private:
    std::map<String, RegistryEntry, std::less<>> entries_;

    Registry();

    void add(String name, CompiledPlan plan);

public:
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Built on first use; every entry is bound to UTC
    [[nodiscard]] static const Registry& instance();

    [[nodiscard]] Optional<const RegistryEntry*> find(StringView name) const;

    // Throws FormatException(UNKNOWN_FORMATTER) for an unknown name
    [[nodiscard]] const RegistryEntry& at(StringView name) const;

    // All entries in name order
    [[nodiscard]] Vector<const RegistryEntry*> entries() const;
    [[nodiscard]] Vector<RegistryListing> list() const;

    // Parse-only entries
    [[nodiscard]] Vector<const RegistryEntry*> parsers() const;
    // Entries able to print
    [[nodiscard]] Vector<const RegistryEntry*> printers() const;

    [[nodiscard]] Size size() const { return entries_.size(); }
};

} // namespace datefmt::format
