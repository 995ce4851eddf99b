#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = labjudge::scoped_guard() + [&]

namespace labjudge {

/**
 * @brief 在作用域结束时执行清理函数
 * 配合 defer 宏使用：
 * @code{.cpp}
 *     defer { std::filesystem::remove_all(dir); };
 * @endcode
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

    /**
     * @brief 放弃执行清理函数
     */
    void dismiss();
};

}  // namespace labjudge
