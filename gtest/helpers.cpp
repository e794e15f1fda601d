#include "helpers.h"

namespace remin::gtest {

std::vector<std::string> words(std::string_view alphabet, size_t max_len) {
    std::vector<std::string> res = {""};
    for (size_t begin = 0, len = 0; len != max_len; ++len) {
        auto end = res.size();
        for (size_t i = begin; i != end; ++i)
            for (auto c : alphabet) res.emplace_back(res[i] + c);
        begin = end;
    }
    return res;
}

} // namespace remin::gtest
