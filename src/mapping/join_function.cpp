#include <star_etl/mapping/join_function.h>

#include <cctype>
#include <regex>
#include <sstream>
#include <arrow/status.h>

namespace star_etl {

namespace {

bool IsIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' ||
           c == '.' || c == ':' || c == '/' || c == '#';
}

// "equal", "grel:equal", "idlab-fn:equal" all name the equality function
bool IsEqualFunction(const std::string& name) {
    if (name == "equal") {
        return true;
    }
    size_t colon = name.rfind(':');
    return colon != std::string::npos && name.substr(colon + 1) == "equal";
}

} // namespace

arrow::Result<std::vector<JoinToken>> TokenizeJoinFunction(std::string_view input) {
    std::vector<JoinToken> tokens;
    size_t pos = 0;

    while (pos < input.size()) {
        char c = input[pos];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++pos;
            continue;
        }

        switch (c) {
            case '(': tokens.push_back({JoinTokenType::LPAREN, "(", pos}); ++pos; continue;
            case ')': tokens.push_back({JoinTokenType::RPAREN, ")", pos}); ++pos; continue;
            case ',': tokens.push_back({JoinTokenType::COMMA, ",", pos}); ++pos; continue;
            case '=': tokens.push_back({JoinTokenType::EQUALS, "=", pos}); ++pos; continue;
            default: break;
        }

        if (c == '$' && pos + 1 < input.size() && input[pos + 1] == '(') {
            size_t end = input.find(')', pos + 2);
            if (end == std::string_view::npos) {
                return arrow::Status::Invalid("Unterminated reference at offset ", pos);
            }
            std::string name(input.substr(pos + 2, end - pos - 2));
            if (name.empty()) {
                return arrow::Status::Invalid("Empty reference at offset ", pos);
            }
            tokens.push_back({JoinTokenType::REFERENCE, std::move(name), pos});
            pos = end + 1;
            continue;
        }

        if (IsIdentChar(c)) {
            size_t start = pos;
            while (pos < input.size() && IsIdentChar(input[pos])) {
                ++pos;
            }
            tokens.push_back({JoinTokenType::IDENT, std::string(input.substr(start, pos - start)), start});
            continue;
        }

        return arrow::Status::Invalid("Unexpected character '", std::string(1, c),
                                      "' at offset ", pos);
    }

    tokens.push_back({JoinTokenType::END_OF_INPUT, "", input.size()});
    return tokens;
}

JoinFunctionParser::JoinFunctionParser(std::vector<JoinToken> tokens)
    : tokens_(std::move(tokens)) {}

const JoinToken& JoinFunctionParser::CurrentToken() const {
    return tokens_[pos_ < tokens_.size() ? pos_ : tokens_.size() - 1];
}

const JoinToken& JoinFunctionParser::PeekToken(size_t offset) const {
    size_t index = pos_ + offset;
    return tokens_[index < tokens_.size() ? index : tokens_.size() - 1];
}

bool JoinFunctionParser::Check(JoinTokenType type) const {
    return CurrentToken().type == type;
}

arrow::Status JoinFunctionParser::Expect(JoinTokenType type, const std::string& message) {
    if (!Check(type)) {
        return Error(message);
    }
    ++pos_;
    return arrow::Status::OK();
}

arrow::Status JoinFunctionParser::Error(const std::string& message) const {
    std::ostringstream oss;
    oss << message << " at offset " << CurrentToken().offset;
    if (!CurrentToken().text.empty()) {
        oss << " (found '" << CurrentToken().text << "')";
    }
    return arrow::Status::Invalid(oss.str());
}

arrow::Result<JoinCall> JoinFunctionParser::Parse() {
    if (tokens_.empty()) {
        return arrow::Status::Invalid("Empty join function");
    }
    ARROW_ASSIGN_OR_RAISE(auto call, ParseCall());
    ARROW_RETURN_NOT_OK(Expect(JoinTokenType::END_OF_INPUT, "Trailing input after join function"));
    return call;
}

arrow::Result<JoinCall> JoinFunctionParser::ParseCall() {
    if (!Check(JoinTokenType::IDENT)) {
        return Error("Expected function name");
    }
    JoinCall call;
    call.name = CurrentToken().text;
    ++pos_;

    ARROW_RETURN_NOT_OK(Expect(JoinTokenType::LPAREN, "Expected '(' after " + call.name));
    if (Check(JoinTokenType::RPAREN)) {
        ++pos_;
        return call;
    }

    while (true) {
        ARROW_ASSIGN_OR_RAISE(auto arg, ParseArgument());
        call.arguments.push_back(std::move(arg));
        if (Check(JoinTokenType::COMMA)) {
            ++pos_;
            continue;
        }
        ARROW_RETURN_NOT_OK(Expect(JoinTokenType::RPAREN, "Expected ',' or ')'"));
        break;
    }
    return call;
}

arrow::Result<JoinArgument> JoinFunctionParser::ParseArgument() {
    JoinArgument arg;

    // key = value
    if (Check(JoinTokenType::IDENT) && PeekToken().type == JoinTokenType::EQUALS) {
        arg.key = CurrentToken().text;
        pos_ += 2;
    }

    if (Check(JoinTokenType::REFERENCE)) {
        arg.value = CurrentToken().text;
        arg.is_reference = true;
        ++pos_;
        return arg;
    }

    if (Check(JoinTokenType::IDENT)) {
        if (PeekToken().type == JoinTokenType::LPAREN) {
            ARROW_ASSIGN_OR_RAISE(auto nested, ParseCall());
            arg.call = std::make_shared<JoinCall>(std::move(nested));
            return arg;
        }
        arg.value = CurrentToken().text;
        ++pos_;
        return arg;
    }

    return Error("Expected argument value");
}

arrow::Result<JoinFunction> ParseJoinFunction(std::string_view input) {
    JoinFunction result;

    auto tokens = TokenizeJoinFunction(input);
    arrow::Result<JoinCall> call = tokens.ok()
        ? JoinFunctionParser(*std::move(tokens)).Parse()
        : arrow::Result<JoinCall>(tokens.status());

    if (!call.ok()) {
        // The expression is broken but the referenced map may still be
        // recoverable; the join itself is then unusable
        static const std::regex kQuotedPattern(R"(quoted\s*=\s*([A-Za-z0-9_\-.]+))");
        std::string text(input);
        std::smatch match;
        if (!std::regex_search(text, match, kQuotedPattern)) {
            return arrow::Status::Invalid("Cannot parse join function '", text,
                                          "': ", call.status().message());
        }
        result.quoted_map = match[1].str();
        result.join_error = call.status().message();
        return result;
    }

    if (call->name != "join") {
        return arrow::Status::Invalid("Expected join(...), found ", call->name, "(...)");
    }

    const JoinCall* equal = nullptr;
    size_t nested_calls = 0;
    for (const auto& arg : call->arguments) {
        if (arg.key == "quoted" && !arg.is_reference && arg.call == nullptr) {
            result.quoted_map = arg.value;
        } else if (arg.call != nullptr) {
            ++nested_calls;
            equal = arg.call.get();
        }
    }

    if (result.quoted_map.empty()) {
        return arrow::Status::Invalid("join(...) does not name a quoted mapping");
    }
    if (nested_calls == 0) {
        return result;
    }
    if (nested_calls > 1) {
        result.join_error = "only one equal(...) condition is supported";
        return result;
    }
    if (!IsEqualFunction(equal->name)) {
        result.join_error = "unsupported join function '" + equal->name + "'";
        return result;
    }

    std::optional<std::string> left;
    std::optional<std::string> right;
    for (const auto& arg : equal->arguments) {
        if (!arg.is_reference) {
            result.join_error = "equal(...) parameter '" + arg.key + "' is not a $(reference)";
            return result;
        }
        if (arg.key == "str1") {
            left = arg.value;
        } else if (arg.key == "str2") {
            right = arg.value;
        }
    }
    if (!left.has_value() || !right.has_value()) {
        result.join_error = "equal(...) requires both str1 and str2";
        return result;
    }

    result.join = JoinCondition{*left, *right};
    return result;
}

} // namespace star_etl
