// =============================================================================
// datefmt - Compiled Plans Implementation
// Version: 1.2.0
// =============================================================================

#include <datefmt/format/plan.hpp>
#include <sstream>

namespace datefmt::format {

namespace {

bool contains_group(const InstructionList& list) {
    for (const auto& ins : list) {
        if (std::holds_alternative<OptionalGroup>(ins) || std::holds_alternative<ChoiceGroup>(ins)) {
            return true;
        }
    }
    return false;
}

bool contains_print_only(const InstructionList& list) {
    for (const auto& ins : list) {
        if (const auto* field = std::get_if<FieldDirective>(&ins)) {
            if (directive_info(field->kind).print_only) return true;
        } else if (const auto* opt = std::get_if<OptionalGroup>(&ins)) {
            if (contains_print_only(opt->body)) return true;
        } else if (const auto* choice = std::get_if<ChoiceGroup>(&ins)) {
            for (const auto& alt : choice->alternatives) {
                if (contains_print_only(alt)) return true;
            }
        }
    }
    return false;
}

void describe_list(const InstructionList& list, std::ostringstream& out) {
    bool first = true;
    for (const auto& ins : list) {
        if (!first) out << ' ';
        first = false;
        if (const auto* lit = std::get_if<LiteralText>(&ins)) {
            out << '\'' << lit->text << '\'';
        } else if (const auto* field = std::get_if<FieldDirective>(&ins)) {
            out << to_string(field->kind) << '(' << to_string(field->mode) << ' '
                << field->min_digits << ".." << field->max_digits;
            if (field->fixed_width) out << " fixed";
            if (field->sign != SignRule::NONE) out << " signed";
            out << ')';
        } else if (const auto* opt = std::get_if<OptionalGroup>(&ins)) {
            out << '[';
            describe_list(opt->body, out);
            out << ']';
        } else if (const auto* choice = std::get_if<ChoiceGroup>(&ins)) {
            out << '{';
            for (Size i = 0; i < choice->alternatives.size(); ++i) {
                if (i > 0) out << " | ";
                describe_list(choice->alternatives[i], out);
            }
            out << '}';
        }
    }
}

} // anonymous namespace

bool OptionalGroup::operator==(const OptionalGroup& other) const {
    return body == other.body;
}

bool ChoiceGroup::operator==(const ChoiceGroup& other) const {
    return alternatives == other.alternatives;
}

// =============================================================================
// CompiledPlan
// =============================================================================

bool CompiledPlan::is_printable() const {
    return !contains_group(instructions_);
}

bool CompiledPlan::is_parseable() const {
    return !contains_print_only(instructions_);
}

String CompiledPlan::describe() const {
    std::ostringstream out;
    describe_list(instructions_, out);
    return out.str();
}

// =============================================================================
// PlanBuilder
// =============================================================================

PlanBuilder& PlanBuilder::literal(StringView text) {
    if (text.empty()) return *this;
    if (!instructions_.empty()) {
        if (auto* last = std::get_if<LiteralText>(&instructions_.back())) {
            last->text += text;
            return *this;
        }
    }
    instructions_.emplace_back(LiteralText{String(text)});
    return *this;
}

PlanBuilder& PlanBuilder::field(FieldDirective directive) {
    instructions_.emplace_back(std::move(directive));
    return *this;
}

PlanBuilder& PlanBuilder::decimal(FieldKind kind, Int32 min_digits, Int32 max_digits) {
    FieldDirective d;
    d.kind = kind;
    d.mode = min_digits > 1 ? RenderMode::ZERO_PADDED : RenderMode::NUMERIC;
    d.min_digits = min_digits;
    d.max_digits = max_digits;
    return field(std::move(d));
}

PlanBuilder& PlanBuilder::fixed_decimal(FieldKind kind, Int32 digits) {
    FieldDirective d;
    d.kind = kind;
    d.mode = digits > 1 ? RenderMode::ZERO_PADDED : RenderMode::NUMERIC;
    d.min_digits = digits;
    d.max_digits = digits;
    d.fixed_width = true;
    return field(std::move(d));
}

PlanBuilder& PlanBuilder::signed_decimal(FieldKind kind, Int32 min_digits, Int32 max_digits) {
    FieldDirective d;
    d.kind = kind;
    d.mode = min_digits > 1 ? RenderMode::ZERO_PADDED : RenderMode::NUMERIC;
    d.min_digits = min_digits;
    d.max_digits = max_digits;
    d.sign = SignRule::NEGATIVE_ONLY;
    return field(std::move(d));
}

PlanBuilder& PlanBuilder::fixed_signed_decimal(FieldKind kind, Int32 digits) {
    FieldDirective d;
    d.kind = kind;
    d.mode = RenderMode::ZERO_PADDED;
    d.min_digits = digits;
    d.max_digits = digits;
    d.sign = SignRule::NEGATIVE_ONLY;
    d.fixed_width = true;
    return field(std::move(d));
}

PlanBuilder& PlanBuilder::fraction(Int32 min_digits, Int32 max_digits) {
    FieldDirective d;
    d.kind = FieldKind::FRACTION_OF_SECOND;
    d.mode = RenderMode::FRACTION;
    d.min_digits = min_digits;
    d.max_digits = max_digits;
    return field(std::move(d));
}

PlanBuilder& PlanBuilder::text(FieldKind kind, RenderMode mode) {
    FieldDirective d;
    d.kind = kind;
    d.mode = mode;
    d.min_digits = 0;
    d.max_digits = 0;
    return field(std::move(d));
}

PlanBuilder& PlanBuilder::offset(StringView zero_text, bool colon) {
    FieldDirective d;
    d.kind = FieldKind::TIME_ZONE_OFFSET;
    d.mode = RenderMode::OFFSET;
    d.min_digits = 2;
    d.max_digits = colon ? 4 : 2;
    d.sign = SignRule::ALWAYS;
    d.offset_colon = colon;
    d.zero_offset_text = String(zero_text);
    return field(std::move(d));
}

PlanBuilder& PlanBuilder::optional(const PlanBuilder& body) {
    instructions_.emplace_back(OptionalGroup{body.instructions_});
    return *this;
}

PlanBuilder& PlanBuilder::choice(std::initializer_list<PlanBuilder> alternatives) {
    ChoiceGroup group;
    for (const auto& alt : alternatives) group.alternatives.push_back(alt.instructions_);
    instructions_.emplace_back(std::move(group));
    return *this;
}

PlanBuilder& PlanBuilder::append(const PlanBuilder& other) {
    for (const auto& ins : other.instructions_) {
        if (const auto* lit = std::get_if<LiteralText>(&ins)) {
            literal(lit->text);
        } else {
            instructions_.push_back(ins);
        }
    }
    return *this;
}

CompiledPlan PlanBuilder::build(String source) const {
    return CompiledPlan(instructions_, std::move(source));
}

} // namespace datefmt::format
