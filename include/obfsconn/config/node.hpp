#pragma once

#include <string>
#include <string_view>
#include "obfsconn/common/error.hpp"
#include "obfsconn/config/args.hpp"

namespace obfsconn::config {

constexpr std::string_view DEFAULT_STATE_DIR = ".";

// "state-dir" option, DEFAULT_STATE_DIR when unset or empty
[[nodiscard]] std::string state_dir(const Args& options);

// A configured proxy node: "[protocol][+transport]://host:port[/][?query]"
struct Node {
    std::string addr;
    std::string protocol;
    std::string transport;
    Args values;

    // Directory the transport keeps its persistent state in
    [[nodiscard]] std::string state_dir() const;

    [[nodiscard]] static common::Result<Node> parse(std::string_view url);
};

}  // namespace obfsconn::config
