#include <iostream>
#include <string_view>
#include <utility>

#include "testutils.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gtest/gtest.h>

auto has_parse_errors(const parser& prsr) -> bool
{
    EXPECT_TRUE(prsr.errors().empty()) << "expected no errors, got: "
                                       << fmt::format("{}", fmt::join(prsr.errors(), ", "));
    return !prsr.errors().empty();
}

auto assert_program(std::string_view input) -> parsed_program
{
    auto prsr = parser {input};
    auto prgrm = prsr.parse_program();
    if (has_parse_errors(prsr)) {
        std::cerr << "while parsing: `" << input << "`\n";
    }
    return {std::move(prgrm), std::move(prsr)};
}
