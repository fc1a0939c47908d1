#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace garlic_shell {

// Source of a SAM control endpoint; an embedded router would sit behind this
class RouterBootstrap {
public:
    virtual ~RouterBootstrap() = default;

    // Throws TimeoutError if the router is not usable within timeout
    virtual void waitReady(std::chrono::milliseconds timeout) = 0;

    // nullopt when the router exposes no SAM bridge
    virtual std::optional<std::string> samAddress() const = 0;

    virtual void shutdown() = 0;
};

// Router run outside this process, reached at a configured SAM address
class ExternalRouter : public RouterBootstrap {
public:
    explicit ExternalRouter(std::string samAddress);

    void waitReady(std::chrono::milliseconds timeout) override;
    std::optional<std::string> samAddress() const override { return sam_address_; }
    void shutdown() override;

private:
    std::string sam_address_;
};

} // namespace garlic_shell
