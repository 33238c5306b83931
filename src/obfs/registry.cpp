#include "obfsconn/obfs/registry.hpp"
#include "obfsconn/common/logging.hpp"
#include <mutex>

namespace obfsconn::obfs {

namespace {

class RegistryCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "obfsconn.registry"; }
    std::string message(int ev) const override {
        return registry_error_message(static_cast<RegistryError>(ev));
    }
};

}  // namespace

std::string registry_error_message(RegistryError err) {
    switch (err) {
        case RegistryError::AlreadyInitialized: return "context already initialized";
        case RegistryError::NotInitialized: return "context not initialized";
        case RegistryError::RoleMismatch: return "context role mismatch";
        default: return "unknown registry error";
    }
}

const std::error_category& registry_category() {
    static const RegistryCategory category;
    return category;
}

std::error_code make_error_code(RegistryError err) {
    return {static_cast<int>(err), registry_category()};
}

Registry::Registry(std::shared_ptr<Transport> transport)
    : transport_(std::move(transport)) {}

bool Registry::contains(const std::string& address) const {
    std::shared_lock lock(mutex_);
    return contexts_.contains(address);
}

size_t Registry::size() const {
    std::shared_lock lock(mutex_);
    return contexts_.size();
}

common::Result<void>
Registry::init(const std::string& address, const config::Args& options, Role role) {
    if (contains(address)) {
        return common::fail(RegistryError::AlreadyInitialized, address);
    }

    auto state_dir = config::state_dir(options);

    Context context;
    if (role == Role::Client) {
        auto cf = transport_->client_factory(state_dir);
        if (!cf) return std::unexpected(cf.error());

        auto cargs = (*cf)->parse_args(options);
        if (!cargs) return std::unexpected(cargs.error());

        context = ClientContext{std::move(*cf), std::move(*cargs)};
    } else {
        auto sf = transport_->server_factory(state_dir, options);
        if (!sf) return std::unexpected(sf.error());

        auto sargs = (*sf)->args();
        context = ServerContext{std::move(*sf), std::move(sargs)};
    }

    std::unique_lock lock(mutex_);
    if (!contexts_.try_emplace(address, std::move(context)).second) {
        return common::fail(RegistryError::AlreadyInitialized, address);
    }
    return {};
}

common::Result<void> Registry::init(const config::Node& node, Role role) {
    auto result = init(node.addr, node.values, role);
    if (result && role == Role::Server) {
        OBFSCONN_LOG_INFO("[{}] server inited: {}", transport_->name(), server_url(node));
    }
    return result;
}

common::Result<Context> Registry::lookup(const std::string& address) const {
    std::shared_lock lock(mutex_);
    auto it = contexts_.find(address);
    if (it == contexts_.end()) {
        return common::fail(RegistryError::NotInitialized, address);
    }
    return it->second;
}

common::Result<ClientContext> Registry::client_context(const std::string& address) const {
    auto ctx = lookup(address);
    if (!ctx) return std::unexpected(ctx.error());

    auto* client = std::get_if<ClientContext>(&*ctx);
    if (!client) {
        return common::fail(RegistryError::RoleMismatch, address + " is a server context");
    }
    return std::move(*client);
}

common::Result<ServerContext> Registry::server_context(const std::string& address) const {
    auto ctx = lookup(address);
    if (!ctx) return std::unexpected(ctx.error());

    auto* server = std::get_if<ServerContext>(&*ctx);
    if (!server) {
        return common::fail(RegistryError::RoleMismatch, address + " is a client context");
    }
    return std::move(*server);
}

std::string Registry::server_url(const config::Node& node) const {
    auto ctx = server_context(node.addr);
    if (!ctx) return {};

    return node.protocol + "+" + node.transport + "://" + node.addr + "/?" + ctx->args.encode();
}

}  // namespace obfsconn::obfs
