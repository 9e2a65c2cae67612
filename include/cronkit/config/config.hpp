#pragma once

#include "cronkit/config/app_config.hpp"
#include "cronkit/core/error.hpp"

#include <string_view>

namespace cronkit {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<AppConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<AppConfig>;
};

}  // namespace cronkit
