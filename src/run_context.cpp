#include "run_context.hpp"

namespace iot_prov
{

    remote::RemoteTarget RunContext::gatewayTarget() const
    {
        return {settings.iotHost, settings.iotUsername, settings.iotPassword};
    }

    render::ConnectionParams RunContext::opcConnection() const
    {
        return {settings.ip, settings.username, settings.password};
    }

    render::OutputSettings RunContext::outputSettings() const
    {
        render::OutputSettings out;
        out.url          = settings.output.influxUrl;
        out.organization = settings.output.influxOrganization;
        out.bucket       = settings.output.influxBucket;
        return out;
    }

} // namespace iot_prov
