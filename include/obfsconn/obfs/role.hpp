#pragma once

namespace obfsconn::obfs {

enum class Role {
    Client,  // dialing side
    Server,  // accepting side
};

}  // namespace obfsconn::obfs
