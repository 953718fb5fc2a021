#pragma once

#include <string>

namespace g1dap::util {

// reads typed settings from PREFIX_NAME environment variables
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  bool has(const std::string& name) const { return !get_env_value(name).empty(); }

private:
  std::string prefix_;
  std::string build_env_name(const std::string& name) const;
  std::string get_env_value(const std::string& name) const;
};

} // namespace g1dap::util
