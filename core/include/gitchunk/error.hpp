#pragma once

#include <stdexcept>
#include <string>

namespace gitchunk {

class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

} // namespace gitchunk
