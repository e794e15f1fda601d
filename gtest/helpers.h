#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace remin::gtest {

/// All words over @p alphabet with at most @p max_len symbols; shorter words come first.
std::vector<std::string> words(std::string_view alphabet, size_t max_len);

} // namespace remin::gtest
