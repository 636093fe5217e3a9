#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <algorithm>

// Естественная сортировка имён: "page2" < "page10".
// Числовые отрезки сравниваются по значению (ведущие нули игнорируются),
// остальные побайтно. Более короткая последовательность отрезков идёт раньше.
//
// <0 if a sorts before b, 0 if equivalent ("img001" vs "img1"), >0 otherwise.
int natural_compare(std::string_view a, std::string_view b);

inline bool natural_less(std::string_view a, std::string_view b) {
    return natural_compare(a, b) < 0;
}

// Stable: equivalent keys keep their original relative order.
template <typename T, typename KeyFn>
void natural_sort(std::vector<T>& items, KeyFn key) {
    std::stable_sort(items.begin(), items.end(), [&key](const T& lhs, const T& rhs) {
        return natural_compare(key(lhs), key(rhs)) < 0;
    });
}

inline void natural_sort(std::vector<std::string>& names) {
    natural_sort(names, [](const std::string& s) -> std::string_view { return s; });
}
