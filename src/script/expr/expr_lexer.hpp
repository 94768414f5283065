#pragma once

// ---------------------------------------------------------------------------
// expr_lexer.hpp
//
// 경량 정책 언어 토크나이저.
// 주석(// ..., /* ... */)과 공백은 건너뛴다.
// 문자열 리터럴 이스케이프: \" \\ \n \t \r
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

enum class TokenKind : std::uint8_t {
    kEnd = 0,
    kIdent,
    kInt,
    kFloat,
    kString,
    // 키워드
    kLet, kFn, kIf, kElse, kWhile, kFor, kIn, kReturn, kBreak, kContinue,
    kTrue, kFalse, kNull,
    // 구두점
    kLParen, kRParen, kLBrace, kRBrace, kLBracket, kRBracket, kMapOpen,  // "#{"
    kComma, kColon, kSemicolon, kDot,
    // 연산자
    kAssign, kEq, kNe, kLt, kLe, kGt, kGe,
    kPlus, kMinus, kStar, kSlash, kPercent, kBang, kAndAnd, kOrOr,
};

struct Token {
    TokenKind   kind{TokenKind::kEnd};
    std::string text{};    // 식별자 이름, 리터럴 원문 (문자열은 unescape 후)
    std::size_t line{1};
    std::size_t column{1};
};

struct LexError {
    std::string message{};
    std::size_t line{1};
    std::size_t column{1};
};

[[nodiscard]] std::expected<std::vector<Token>, LexError> tokenize(std::string_view source);

[[nodiscard]] std::string_view token_kind_name(TokenKind kind) noexcept;
