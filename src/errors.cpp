#include "analog-bench/errors.hpp"

#include <fmt/format.h>

namespace analogbench {

SdkError::SdkError(const std::string &sdk, int code,
                   const std::string &message)
    : BenchError(fmt::format("{} API error ({}): '{}'", sdk, code, message)),
      sdk_(sdk), code_(code), sdk_message_(message) {}

} // namespace analogbench
