#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include "gtest/gtest.h"

/**
 * 比较两个 json 值，失败时输出两边的值以及 JSON Patch 形式的差异
 */
inline ::testing::AssertionResult json_equal(const char *lhs_expression,
                                             const char *rhs_expression,
                                             const nlohmann::json &lhs,
                                             const nlohmann::json &rhs) {
    if (lhs == rhs) return ::testing::AssertionSuccess();

    std::stringstream ss;
    ss << std::endl
       << "Expected: " << lhs_expression << std::endl
       << "Which is: " << lhs.dump(2) << std::endl
       << "To equal: " << rhs_expression << std::endl
       << "Which is: " << rhs.dump(2) << std::endl
       << "Diff:     " << nlohmann::json::diff(lhs, rhs).dump(2);
    return ::testing::AssertionFailure() << ss.str();
}

#define EXPECT_JSON_EQ(obj1, obj2) EXPECT_PRED_FORMAT2(json_equal, obj1, obj2)
