#pragma once

#include <nlohmann/json.hpp>
#include "gtest/gtest.h"

/**
 * @brief 比较两个 JSON 值，失败时输出两边的内容和 JSON Patch 形式的差异
 */
inline ::testing::AssertionResult json_equal(const char *lhs_expression, const char *rhs_expression,
                                             const nlohmann::json &lhs, const nlohmann::json &rhs) {
    if (lhs == rhs) return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure()
           << lhs_expression << " is" << std::endl
           << lhs.dump(2) << std::endl
           << rhs_expression << " is" << std::endl
           << rhs.dump(2) << std::endl
           << "Difference:" << std::endl
           << nlohmann::json::diff(lhs, rhs).dump(2);
}

#define EXPECT_JSON_EQ(obj1, obj2) EXPECT_PRED_FORMAT2(json_equal, obj1, obj2)
