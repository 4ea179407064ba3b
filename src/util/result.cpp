#include "util/result.hpp"

#include <cstring>

namespace ipswdl {

Result Result::Errno(int e, const std::string& what) {
    return Fail(e, what + " (" + std::strerror(e) + ")");
}

} // namespace ipswdl
