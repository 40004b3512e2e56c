#pragma once

#include <algorithm>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

/// Renders an optional child node, an absent one renders as nothing.
template<typename Node>
auto to_string(const std::unique_ptr<Node>& node) -> std::string
{
    if (node) {
        return node->string();
    }
    return {};
}

template<typename Node>
auto join(const std::vector<std::unique_ptr<Node>>& nodes, std::string_view sep = {}) -> std::string
{
    auto strs = std::vector<std::string>();
    std::transform(
        nodes.cbegin(), nodes.cend(), std::back_inserter(strs), [](const auto& node) { return to_string(node); });
    return fmt::format("{}", fmt::join(strs.cbegin(), strs.cend(), sep));
}
