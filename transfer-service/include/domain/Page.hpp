#pragma once

#include <cstdint>
#include <vector>

namespace transfer::domain {

/**
 * @brief Страница выборки и общее число строк под фильтром
 */
template <typename T>
struct Page {
    std::vector<T> items;
    int64_t total = 0;
};

} // namespace transfer::domain
