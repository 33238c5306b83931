#include "obfsconn/common/error.hpp"

namespace obfsconn::common {

std::string Error::message() const {
    auto msg = code_.message();
    if (!detail_.empty()) {
        msg += ": ";
        msg += detail_;
    }
    return msg;
}

}  // namespace obfsconn::common
