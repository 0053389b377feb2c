#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <arrow/result.h>
#include <star_etl/mapping/mapping_spec.h>

namespace star_etl {

// Inline join function of a quoted subject:
//   join(quoted=datasetTM, equal(str1=$(dataset_id), str2=$(dataset_id)))
//
// Parsed with a small tokenizer and a recursive-descent parser into a call
// tree, then interpreted.

enum class JoinTokenType {
    IDENT,       // join, quoted, str1, datasetTM, ex:fn
    REFERENCE,   // $(column)
    LPAREN,      // (
    RPAREN,      // )
    COMMA,       // ,
    EQUALS,      // =
    END_OF_INPUT
};

struct JoinToken {
    JoinTokenType type;
    std::string text;
    size_t offset;
};

arrow::Result<std::vector<JoinToken>> TokenizeJoinFunction(std::string_view input);

// Call tree node: name(arg, key=value, ...)
struct JoinCall;

struct JoinArgument {
    std::string key;                    // "" for positional arguments
    std::string value;                  // IDENT text or REFERENCE column name
    bool is_reference = false;
    std::shared_ptr<JoinCall> call;     // nested call, if any
};

struct JoinCall {
    std::string name;
    std::vector<JoinArgument> arguments;
};

class JoinFunctionParser {
public:
    explicit JoinFunctionParser(std::vector<JoinToken> tokens);

    arrow::Result<JoinCall> Parse();

private:
    std::vector<JoinToken> tokens_;
    size_t pos_ = 0;

    const JoinToken& CurrentToken() const;
    const JoinToken& PeekToken(size_t offset = 1) const;
    bool Check(JoinTokenType type) const;
    arrow::Status Expect(JoinTokenType type, const std::string& message);
    arrow::Status Error(const std::string& message) const;

    arrow::Result<JoinCall> ParseCall();
    arrow::Result<JoinArgument> ParseArgument();
};

// Result of interpreting a join call
struct JoinFunction {
    std::string quoted_map;
    std::optional<JoinCondition> join;
    std::string join_error;   // set when the equal(...) part is unusable
};

// Parses and interprets an inline join function. Fails only if the
// referenced map name cannot be determined; a broken equal(...) is reported
// through JoinFunction::join_error.
arrow::Result<JoinFunction> ParseJoinFunction(std::string_view input);

} // namespace star_etl
