#pragma once
// =============================================================================
// datefmt - Compiled Plans
// Version: 1.2.0
// Immutable instruction sequences executed by the printer and the parser
// =============================================================================

#include "datefmt/common/types.hpp"
#include "datefmt/format/directive.hpp"
#include <initializer_list>

namespace datefmt::format {

enum class SignRule : UInt8 {
    NONE,           // digits only
    NEGATIVE_ONLY,  // '-' printed for negative values, '+' or '-' accepted
    ALWAYS          // '+' or '-' always printed and required (offsets)
};

// =============================================================================
// Instructions
// =============================================================================

struct LiteralText {
    String text;

    bool operator==(const LiteralText&) const = default;
};

struct FieldDirective {
    FieldKind kind = FieldKind::YEAR;
    RenderMode mode = RenderMode::NUMERIC;
    Int32 min_digits = 1;
    Int32 max_digits = 2;
    SignRule sign = SignRule::NONE;
    // Parse exactly min_digits digits
    bool fixed_width = false;
    // OFFSET only: "+HH:MM" rather than "+HHMM"
    bool offset_colon = false;
    // OFFSET only: printed instead of a zero offset, e.g. "Z"
    String zero_offset_text;

    bool operator==(const FieldDirective&) const = default;
};

struct OptionalGroup;
struct ChoiceGroup;

using Instruction = Variant<LiteralText, FieldDirective, OptionalGroup, ChoiceGroup>;
using InstructionList = Vector<Instruction>;

// Parsed when present, skipped otherwise
struct OptionalGroup {
    InstructionList body;

    bool operator==(const OptionalGroup& other) const;
};

// Alternatives tried in order; the one consuming the most text wins
struct ChoiceGroup {
    Vector<InstructionList> alternatives;

    bool operator==(const ChoiceGroup& other) const;
};

// =============================================================================
// CompiledPlan
// =============================================================================

class CompiledPlan {
private:
    InstructionList instructions_;
    String source_;

public:
    CompiledPlan() = default;
    explicit CompiledPlan(InstructionList instructions, String source = "")
        : instructions_(std::move(instructions)), source_(std::move(source)) {}

    [[nodiscard]] const InstructionList& instructions() const { return instructions_; }

    // Pattern text the plan was compiled from, or a layout description
    [[nodiscard]] const String& source() const { return source_; }

    [[nodiscard]] bool empty() const { return instructions_.empty(); }

    // No optional or choice groups
    [[nodiscard]] bool is_printable() const;
    // No print-only directives
    [[nodiscard]] bool is_parseable() const;

    // Structural equality; the source text is not compared
    bool operator==(const CompiledPlan& other) const { return instructions_ == other.instructions_; }

    [[nodiscard]] String describe() const;
};

// =============================================================================
// PlanBuilder - assembles plans directive by directive
// =============================================================================

class PlanBuilder {
private:
    InstructionList instructions_;

public:
    PlanBuilder() = default;

    // Appends text, merging with a preceding literal
    PlanBuilder& literal(StringView text);
    PlanBuilder& literal(char c) { return literal(StringView(&c, 1)); }

    PlanBuilder& field(FieldDirective directive);

    // Zero-padded number printed with at least min_digits, parsed with up to max_digits
    PlanBuilder& decimal(FieldKind kind, Int32 min_digits, Int32 max_digits);
    // Exactly digits digits when parsed
    PlanBuilder& fixed_decimal(FieldKind kind, Int32 digits);
    // Year-like number with a leading '-' for negative values
    PlanBuilder& signed_decimal(FieldKind kind, Int32 min_digits, Int32 max_digits);
    PlanBuilder& fixed_signed_decimal(FieldKind kind, Int32 digits);
    PlanBuilder& fraction(Int32 min_digits, Int32 max_digits);
    PlanBuilder& text(FieldKind kind, RenderMode mode);
    PlanBuilder& offset(StringView zero_text, bool colon);

    PlanBuilder& optional(const PlanBuilder& body);
    PlanBuilder& choice(std::initializer_list<PlanBuilder> alternatives);
    PlanBuilder& append(const PlanBuilder& other);

    [[nodiscard]] const InstructionList& instructions() const { return instructions_; }
    [[nodiscard]] CompiledPlan build(String source = "") const;
};

} // namespace datefmt::format
