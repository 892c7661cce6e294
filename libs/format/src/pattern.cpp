// =============================================================================
// datefmt - Pattern Compiler Implementation
// Version: 1.2.0
// =============================================================================

#include <datefmt/format/pattern.hpp>
#include <datefmt/common/logging.hpp>
#include <algorithm>
#include <format>

namespace datefmt::format {

namespace {

// One lexed piece of a pattern
struct Token {
    bool is_field = false;
    String text;            // literal text
    DirectiveInfo info{};   // field
    Int32 count = 0;        // letter repeat count
};

bool is_numeric_token(const Token& token) {
    if (!token.is_field) return false;
    switch (token.info.presentation) {
        case Presentation::NUMBER:
        case Presentation::YEAR:
        case Presentation::FRACTION:
            return true;
        case Presentation::MONTH:
            return token.count <= 2;
        default:
            return false;
    }
}

ErrorInfo pattern_error(StringView pattern, Size pos, const String& message) {
    ErrorInfo err(ErrorCode::PATTERN_ERROR, message, "pattern");
    err.at_position(pos);
    if (pos < pattern.size()) err.with_context("character", String(1, pattern[pos]));
    err.with_context("pattern", String(pattern));
    return err;
}

Result<Vector<Token>> tokenize(StringView pattern) {
    Vector<Token> tokens;
    Size i = 0;
    const Size n = pattern.size();

    while (i < n) {
        char c = pattern[i];

        if (is_pattern_letter(c)) {
            Size run = i + 1;
            while (run < n && pattern[run] == c) ++run;
            auto info = directive_for(c);
            if (!info) {
                return pattern_error(pattern, i,
                    "Illegal pattern component: " + String(run - i, c));
            }
            Token token;
            token.is_field = true;
            token.info = *info;
            token.count = static_cast<Int32>(run - i);
            tokens.push_back(std::move(token));
            i = run;
        } else if (c == '\'') {
            Token token;
            if (i + 1 < n && pattern[i + 1] == '\'') {
                token.text = "'";
                i += 2;
            } else {
                Size j = i + 1;
                bool closed = false;
                while (j < n) {
                    if (pattern[j] == '\'') {
                        if (j + 1 < n && pattern[j + 1] == '\'') {
                            token.text += '\'';
                            j += 2;
                            continue;
                        }
                        closed = true;
                        ++j;
                        break;
                    }
                    token.text += pattern[j++];
                }
                if (!closed) return pattern_error(pattern, i, "Unterminated quote");
                i = j;
            }
            tokens.push_back(std::move(token));
        } else {
            Token token;
            token.text = String(1, c);
            tokens.push_back(std::move(token));
            ++i;
        }
    }
    return tokens;
}

FieldDirective directive_of(const Token& token, bool numeric_follows) {
    const auto& info = token.info;
    FieldDirective d;
    d.kind = info.kind;
    d.min_digits = token.count;
    d.max_digits = numeric_follows ? token.count : std::max(info.default_max_digits, token.count);
    d.mode = token.count > 1 ? RenderMode::ZERO_PADDED : RenderMode::NUMERIC;
    if (info.signed_value) d.sign = SignRule::NEGATIVE_ONLY;

    switch (info.presentation) {
        case Presentation::NUMBER:
            break;
        case Presentation::YEAR:
            if (token.count == 2) d.mode = RenderMode::TWO_DIGIT_YEAR;
            break;
        case Presentation::TEXT:
            d.mode = (info.kind == FieldKind::DAY_OF_WEEK && token.count >= 4)
                ? RenderMode::LONG_NAME : RenderMode::SHORT_NAME;
            d.min_digits = 0;
            d.max_digits = 0;
            break;
        case Presentation::MONTH:
            if (token.count >= 3) {
                d.mode = token.count == 3 ? RenderMode::SHORT_NAME : RenderMode::LONG_NAME;
                d.min_digits = 0;
                d.max_digits = 0;
            }
            break;
        case Presentation::FRACTION:
            d.mode = RenderMode::FRACTION;
            break;
        case Presentation::ZONE_NAME:
            d.mode = RenderMode::ZONE_NAME;
            d.min_digits = 0;
            d.max_digits = 0;
            break;
        case Presentation::ZONE_OFFSET:
            d.sign = SignRule::ALWAYS;
            if (token.count >= 3) {
                d.mode = RenderMode::ZONE_ID;
                d.min_digits = 0;
                d.max_digits = 0;
            } else {
                d.mode = RenderMode::OFFSET;
                d.offset_colon = token.count == 2;
                d.min_digits = 2;
                d.max_digits = d.offset_colon ? 4 : 2;
            }
            break;
    }
    return d;
}

} // anonymous namespace

Result<CompiledPlan> compile_pattern(StringView pattern) {
    auto logger = logging::LogManager::instance().get_logger("pattern");

    if (pattern.empty()) {
        logger->debug("Rejected empty pattern");
        return pattern_error(pattern, 0, "Pattern must not be empty");
    }

    auto tokens = tokenize(pattern);
    if (tokens.is_error()) {
        logger->debug(std::format("Rejected pattern '{}': {}", pattern, tokens.error().to_string()));
        return tokens.error();
    }

    PlanBuilder builder;
    const auto& list = tokens.value();
    for (Size i = 0; i < list.size(); ++i) {
        const Token& token = list[i];
        if (!token.is_field) {
            builder.literal(token.text);
            continue;
        }
        bool numeric_follows = is_numeric_token(token) && i + 1 < list.size() &&
                               is_numeric_token(list[i + 1]);
        builder.field(directive_of(token, numeric_follows));
    }
    return builder.build(String(pattern));
}

} // namespace datefmt::format
