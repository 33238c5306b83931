#pragma once

#include <any>
#include <memory>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <variant>
#include "obfsconn/config/node.hpp"
#include "obfsconn/obfs/pt.hpp"
#include "obfsconn/obfs/role.hpp"

namespace obfsconn::obfs {

enum class RegistryError {
    AlreadyInitialized = 1,
    NotInitialized,
    RoleMismatch,
};

[[nodiscard]] std::string registry_error_message(RegistryError err);

const std::error_category& registry_category();
std::error_code make_error_code(RegistryError err);

struct ClientContext {
    std::shared_ptr<ClientFactory> factory;
    std::any args;
};

struct ServerContext {
    std::shared_ptr<ServerFactory> factory;
    config::Args args;
};

using Context = std::variant<ClientContext, ServerContext>;

// Per-address transport state, built once during setup and shared by
// every connection to or from that address. Entries are never replaced
// or removed.
class Registry {
public:
    explicit Registry(std::shared_ptr<Transport> transport);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Build the client or server context for address from options.
    // Fails with AlreadyInitialized if address already has one.
    [[nodiscard]] common::Result<void>
    init(const std::string& address, const config::Args& options, Role role);

    [[nodiscard]] common::Result<void> init(const config::Node& node, Role role);

    [[nodiscard]] common::Result<Context> lookup(const std::string& address) const;
    [[nodiscard]] common::Result<ClientContext> client_context(const std::string& address) const;
    [[nodiscard]] common::Result<ServerContext> server_context(const std::string& address) const;

    // "protocol+transport://addr/?<public args>", empty if node has no server context
    [[nodiscard]] std::string server_url(const config::Node& node) const;

    [[nodiscard]] const Transport& transport() const { return *transport_; }
    [[nodiscard]] size_t size() const;

private:
    [[nodiscard]] bool contains(const std::string& address) const;

    std::shared_ptr<Transport> transport_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Context> contexts_;
};

}  // namespace obfsconn::obfs

template<>
struct std::is_error_code_enum<obfsconn::obfs::RegistryError> : std::true_type {};
