#pragma once

#include <cstddef>
#include <string>

// Dataset label; selects the output subdirectory
enum class Category {
    OK,
    NG
};

inline const char* CategoryName(Category category) {
    return category == Category::OK ? "OK" : "NG";
}

inline size_t CategoryIndex(Category category) {
    return category == Category::OK ? 0 : 1;
}

inline bool ParseCategory(const std::string& text, Category& category) {
    if (text == "OK" || text == "ok") {
        category = Category::OK;
        return true;
    }
    if (text == "NG" || text == "ng") {
        category = Category::NG;
        return true;
    }
    return false;
}
