#include <gtest/gtest.h>

#include <cmath>
#include <format>
#include <string>
#include <utility>
#include <vector>

import glox;

using glox::TokenType;
using glox::WhitespaceKind;

namespace {

auto scan(std::string source) -> std::vector<glox::SourceToken>
{
    glox::Scanner scanner(std::move(source));
    return scanner.scan_tokens();
}

auto types_of(const std::vector<glox::SourceToken> & tokens) -> std::vector<TokenType>
{
    std::vector<TokenType> types;
    for (const auto & source_token : tokens) {
        types.push_back(source_token.token.get_type());
    }
    return types;
}

} // namespace

TEST(ScannerTest, EmptySourceYieldsOnlyEndOfFile)
{
    auto tokens = scan("");
    ASSERT_EQ(tokens.size(), 1U);
    EXPECT_TRUE(tokens[0].token.is(TokenType::EndOfFile));
    EXPECT_EQ(tokens[0].span.start, glox::SourceLocation{});
    EXPECT_EQ(tokens[0].span.length(), 0U);
}

TEST(ScannerTest, EndOfFileIsAlwaysLast)
{
    for (const auto * source : {"1 + 2", "\"open", "@@@", "// only a comment", "var x = 1;\n"}) {
        auto tokens = scan(source);
        ASSERT_FALSE(tokens.empty()) << source;
        EXPECT_TRUE(tokens.back().token.is(TokenType::EndOfFile)) << source;
        for (std::size_t i = 0; i + 1 < tokens.size(); i++) {
            EXPECT_FALSE(tokens[i].token.is(TokenType::EndOfFile)) << source;
        }
    }
}

TEST(ScannerTest, DecimalNumber)
{
    auto tokens = scan("123.45");
    ASSERT_EQ(types_of(tokens), (std::vector{TokenType::Number, TokenType::EndOfFile}));
    EXPECT_DOUBLE_EQ(tokens[0].token.get_number(), 123.45);
    EXPECT_EQ(tokens[0].token.get_lexeme(), "123.45");
}

TEST(ScannerTest, OutOfRangeNumberIsInfinite)
{
    glox::Scanner scanner("1" + std::string(400, '0'));
    auto tokens = scanner.scan_tokens();

    EXPECT_TRUE(scanner.error_log().empty());
    ASSERT_EQ(types_of(tokens), (std::vector{TokenType::Number, TokenType::EndOfFile}));
    EXPECT_TRUE(std::isinf(tokens[0].token.get_number()));
}

TEST(ScannerTest, TinyNumberUnderflowsToZero)
{
    auto tokens = scan("0." + std::string(400, '0') + "1");
    ASSERT_EQ(types_of(tokens), (std::vector{TokenType::Number, TokenType::EndOfFile}));
    EXPECT_EQ(tokens[0].token.get_number(), 0.0);
}

TEST(ScannerTest, TrailingDotIsSeparateToken)
{
    auto tokens = scan("10.");
    ASSERT_EQ(
            types_of(tokens),
            (std::vector{TokenType::Number, TokenType::Dot, TokenType::EndOfFile})
    );
    EXPECT_DOUBLE_EQ(tokens[0].token.get_number(), 10.0);
}

TEST(ScannerTest, KeywordsAndIdentifiers)
{
    auto tokens = scan("print printer nil _x9");
    ASSERT_EQ(
            types_of(tokens),
            (std::vector{
                    TokenType::Print,
                    TokenType::Whitespace,
                    TokenType::Identifier,
                    TokenType::Whitespace,
                    TokenType::Nil,
                    TokenType::Whitespace,
                    TokenType::Identifier,
                    TokenType::EndOfFile,
            })
    );
    EXPECT_EQ(tokens[2].token.get_text(), "printer");
    EXPECT_EQ(tokens[6].token.get_text(), "_x9");
}

TEST(ScannerTest, UnicodeIdentifier)
{
    auto tokens = scan("caf\xC3\xA9 \xCE\xBB");
    ASSERT_EQ(
            types_of(tokens),
            (std::vector{
                    TokenType::Identifier,
                    TokenType::Whitespace,
                    TokenType::Identifier,
                    TokenType::EndOfFile,
            })
    );
    EXPECT_EQ(tokens[0].token.get_text(), "caf\xC3\xA9");
    EXPECT_EQ(tokens[0].span.length(), 4U);
    EXPECT_EQ(tokens[2].token.get_text(), "\xCE\xBB");
}

TEST(ScannerTest, StringLiteralDropsQuotes)
{
    auto tokens = scan("\"abc\"");
    ASSERT_EQ(types_of(tokens), (std::vector{TokenType::String, TokenType::EndOfFile}));
    EXPECT_EQ(tokens[0].token.get_text(), "abc");
    EXPECT_EQ(tokens[0].token.get_lexeme(), "\"abc\"");
    EXPECT_EQ(tokens[0].span.length(), 5U);
}

TEST(ScannerTest, StringMaySpanLines)
{
    auto tokens = scan("\"a\nb\" x");
    ASSERT_EQ(tokens.size(), 4U);
    EXPECT_EQ(tokens[0].token.get_text(), "a\nb");
    EXPECT_EQ(tokens[2].span.start.line, 2U);
    EXPECT_EQ(tokens[2].span.start.column, 4U);
}

TEST(ScannerTest, UnterminatedString)
{
    glox::Scanner scanner("\"abc");
    auto tokens = scanner.scan_tokens();

    ASSERT_EQ(types_of(tokens), (std::vector{TokenType::EndOfFile}));
    ASSERT_EQ(scanner.error_log().size(), 1U);

    const auto & error = scanner.error_log().front();
    EXPECT_EQ(error.kind, glox::ErrorKind::Scanning);
    EXPECT_EQ(error.message, "Unterminated String");
    EXPECT_FALSE(error.subject.has_value());
    ASSERT_TRUE(error.location.has_value());
    EXPECT_EQ(error.location->start.index, 0U);
    EXPECT_EQ(error.location->end.index, 4U);
}

TEST(ScannerTest, UnexpectedCharacterDoesNotStopScanning)
{
    glox::Scanner scanner("1 @ 2 #");
    auto tokens = scanner.scan_tokens();

    EXPECT_EQ(
            types_of(tokens),
            (std::vector{
                    TokenType::Number,
                    TokenType::Whitespace,
                    TokenType::Whitespace,
                    TokenType::Number,
                    TokenType::Whitespace,
                    TokenType::EndOfFile,
            })
    );

    const auto & errors = scanner.error_log();
    ASSERT_EQ(errors.size(), 2U);
    EXPECT_EQ(errors.errors()[0].message, "Unexpected character");
    EXPECT_EQ(errors.errors()[0].subject, "@");
    EXPECT_EQ(errors.errors()[0].location->start.column, 3U);
    EXPECT_EQ(errors.errors()[1].subject, "#");
    EXPECT_EQ(errors.errors()[1].location->start.column, 7U);
}

TEST(ScannerTest, OneAndTwoCharacterOperators)
{
    auto tokens = scan("!= ! == = <= < >= > / * ? :");
    std::erase_if(tokens, [](const glox::SourceToken & source_token) {
        return source_token.token.is(TokenType::Whitespace);
    });
    EXPECT_EQ(
            types_of(tokens),
            (std::vector{
                    TokenType::BangEqual,
                    TokenType::Bang,
                    TokenType::EqualEqual,
                    TokenType::Equal,
                    TokenType::LessEqual,
                    TokenType::Less,
                    TokenType::GreaterEqual,
                    TokenType::Greater,
                    TokenType::Slash,
                    TokenType::Star,
                    TokenType::QuestionMark,
                    TokenType::Colon,
                    TokenType::EndOfFile,
            })
    );
}

TEST(ScannerTest, WhitespaceAndComments)
{
    auto tokens = scan("1\t// hi\r\n2");
    ASSERT_EQ(
            types_of(tokens),
            (std::vector{
                    TokenType::Number,
                    TokenType::Whitespace,
                    TokenType::Comment,
                    TokenType::Whitespace,
                    TokenType::Number,
                    TokenType::EndOfFile,
            })
    );
    EXPECT_EQ(tokens[1].token.get_whitespace(), WhitespaceKind::Tab);
    EXPECT_EQ(tokens[2].token.get_text(), " hi");
    EXPECT_EQ(tokens[2].token.get_lexeme(), "// hi");
    EXPECT_EQ(tokens[3].token.get_whitespace(), WhitespaceKind::Newline);
    EXPECT_EQ(tokens[4].span.start.line, 2U);
    EXPECT_EQ(tokens[4].span.start.column, 1U);
}

TEST(ScannerTest, CommentRunsToEndOfInput)
{
    auto tokens = scan("// trailing");
    ASSERT_EQ(types_of(tokens), (std::vector{TokenType::Comment, TokenType::EndOfFile}));
    EXPECT_EQ(tokens[0].token.get_text(), " trailing");
}

TEST(ScannerTest, TracksLinesAndColumns)
{
    auto tokens = scan("a\nb");
    ASSERT_EQ(tokens.size(), 4U);

    EXPECT_EQ(tokens[0].span.start, (glox::SourceLocation{.line = 1, .column = 1, .index = 0}));
    EXPECT_EQ(tokens[2].span.start, (glox::SourceLocation{.line = 2, .column = 1, .index = 2}));
    EXPECT_EQ(tokens[3].span.start, (glox::SourceLocation{.line = 2, .column = 2, .index = 3}));
}

TEST(ScannerTest, ColumnsCountGraphemes)
{
    // "e" followed by a combining acute accent is one column
    auto tokens = scan("e\xCC\x81 + 1");
    ASSERT_EQ(tokens.size(), 6U);
    EXPECT_EQ(tokens[0].token.get_text(), "e\xCC\x81");
    EXPECT_TRUE(tokens[2].token.is(TokenType::Plus));
    EXPECT_EQ(tokens[2].span.start.column, 3U);
    EXPECT_EQ(tokens[2].span.start.index, 2U);
}

TEST(ScannerTest, SlicesReassembleSource)
{
    const std::string source = "var x = 1; // c\r\n print x ? \"s\xC3\xA9\" : 2.5;\t";

    glox::Scanner scanner(source);
    auto tokens = scanner.scan_tokens();
    ASSERT_TRUE(scanner.error_log().empty());

    std::string reassembled;
    for (const auto & source_token : tokens) {
        auto text = scanner.source().slice(source_token.span);
        EXPECT_EQ(text, source_token.token.get_lexeme());
        reassembled += text;
    }
    EXPECT_EQ(reassembled, source);
}

TEST(ScannerTest, TokensCompareByKindAndPayload)
{
    glox::Token a(TokenType::Number, "1.0", 1.0);
    glox::Token b(TokenType::Number, "1", 1.0);
    glox::Token c(TokenType::Number, "2", 2.0);

    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a == c);
    EXPECT_TRUE(a.clone() == a);
    EXPECT_EQ(a.clone().get_lexeme(), "1.0");
}

TEST(ScannerTest, DebugFormat)
{
    auto tokens = scan("1.5 ;");
    ASSERT_EQ(tokens.size(), 4U);
    EXPECT_EQ(
            std::format("{}", tokens[0]),
            "Token(type=Number, lexeme=\"1.5\", literal=1.5) @ 1:1-1:4"
    );
    EXPECT_EQ(
            std::format("{}", tokens[1].token),
            "Token(type=Whitespace, lexeme=\" \", literal=Space)"
    );
    EXPECT_EQ(
            std::format("{}", tokens[2].token),
            "Token(type=Semicolon, lexeme=\";\", literal=<empty>)"
    );
}

TEST(ScannerTest, InvalidUtf8IsReportedAndEscaped)
{
    glox::Scanner scanner("1 \xFF\xFE 2");
    auto tokens = scanner.scan_tokens();

    EXPECT_EQ(
            types_of(tokens),
            (std::vector{
                    TokenType::Number,
                    TokenType::Whitespace,
                    TokenType::Whitespace,
                    TokenType::Number,
                    TokenType::EndOfFile,
            })
    );

    const auto & errors = scanner.error_log();
    ASSERT_EQ(errors.size(), 2U);
    EXPECT_EQ(errors.errors()[0].message, "Invalid UTF-8 sequence");
    EXPECT_EQ(errors.errors()[0].subject, "\\xFF");
    EXPECT_EQ(errors.errors()[0].location->start.column, 3U);
    EXPECT_EQ(errors.errors()[0].location->length(), 1U);
    EXPECT_EQ(errors.errors()[1].subject, "\\xFE");
    EXPECT_EQ(errors.errors()[1].location->start.column, 4U);
}

TEST(ScannerTest, InvalidUtf8InsideStringIsReported)
{
    glox::Scanner scanner("\"a\x80" "b\";");
    auto tokens = scanner.scan_tokens();

    ASSERT_EQ(
            types_of(tokens),
            (std::vector{TokenType::String, TokenType::Semicolon, TokenType::EndOfFile})
    );
    ASSERT_EQ(scanner.error_log().size(), 1U);
    EXPECT_EQ(scanner.error_log().front().subject, "\\x80");
    EXPECT_EQ(scanner.error_log().front().location->start.column, 3U);
}
