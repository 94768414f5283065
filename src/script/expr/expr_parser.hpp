#pragma once

// ---------------------------------------------------------------------------
// expr_parser.hpp
//
// 토큰 → Program. 재귀 하강 파서.
//
// [연산자 우선순위 (낮음 → 높음)]
//   ||
//   &&
//   == !=
//   < <= > >=
//   + -
//   * / %
//   ! - (단항)
//   호출, 멤버(.), 인덱스([])
//
// 중첩 깊이가 max_depth 를 넘으면 depth_exceeded = true 로 실패한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "script/expr/expr_ast.hpp"

struct ParseFailure {
    std::string message{};
    bool        depth_exceeded{false};
};

[[nodiscard]] std::expected<std::shared_ptr<const Program>, ParseFailure>
parse_program(std::string_view source, std::uint32_t max_depth);
