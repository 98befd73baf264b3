#include "common/Options.hpp"
#include "common/util/StringUtil.hpp"

#include <cstdint>

namespace Zweig {
Status Options::Parse(const std::vector<std::string> &args, Options &options) {
  for (size_t i = 0; i < args.size(); i++) {
    auto &arg = args[i];
    if (arg == "--case-insensitive") {
      options.config_.case_sensitive_ = false;
    } else if (arg == "--max-iterations" || arg == "--log-file") {
      if (i + 1 == args.size()) {
        return Status::Error(ErrorCode::InvalidArgument,
                             arg + " need a value");
      }
      auto &value = args[++i];
      if (arg == "--log-file") {
        options.log_file_ = value;
      } else if (StringUtil::IsInteger(value) && value.size() < 10) {
        options.config_.max_iterations_ =
            static_cast<uint32_t>(std::stoul(value));
      } else {
        return Status::Error(ErrorCode::InvalidArgument,
                             "invalid iteration count " + value);
      }
    } else {
      return Status::Error(ErrorCode::InvalidArgument, "unknown option " + arg);
    }
  }
  return Status::OK();
}
} // namespace Zweig
