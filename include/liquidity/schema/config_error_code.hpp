#pragma once

#include <cstdint>

namespace liquidity::schema {

enum class config_error_code : uint32_t {
  missing_reference_date = 1,
  invalid_start_balance = 2,
  invalid_horizon = 3,
  invalid_threshold = 4,
};

}  // namespace liquidity::schema
