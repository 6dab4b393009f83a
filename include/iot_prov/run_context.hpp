#pragma once

#include "config_manager.hpp"
#include "config_renderer.hpp"
#include "remote_session.hpp"

namespace iot_prov
{

    struct RunContext
    {
        RunContext()                             = default;
        RunContext(const RunContext&)            = delete;
        RunContext& operator=(const RunContext&) = delete;

        config::ProvisionSettings settings;

        // Opens gateway sessions; tests swap in an in-memory fake.
        remote::SessionConnector connector;

        remote::RemoteTarget     gatewayTarget() const;
        render::ConnectionParams opcConnection() const;
        render::OutputSettings   outputSettings() const;
    };

} // namespace iot_prov
