#pragma once

#include <string>
#include <vector>

#include "address_space.hpp"

namespace render
{

    inline constexpr const char* kDefaultInterval = "1000ms";
    inline constexpr const char* kOpcUaPort       = "4840";
    inline constexpr const char* kConfigFileName  = "telegraf.conf";

    enum class InputMode
    {
        Poll,
        Subscribe
    };

    struct ConnectionParams
    {
        std::string host;
        std::string username;
        std::string password;
    };

    struct GroupDescriptor
    {
        std::string                            groupName;
        std::string                            namespaceNumber;
        std::string                            samplingInterval;
        std::vector<addrspace::NodeDescriptor> nodes;
        InputMode                              mode{InputMode::Poll};
    };

    // [[outputs.influxdb_v2]] settings written into the preamble.
    struct OutputSettings
    {
        std::string url{"http://127.0.0.1:8086"};
        std::string organization{"org"};
        std::string bucket{"line"};
    };

    std::string renderNode(const addrspace::NodeDescriptor& node);
    std::string renderNodeList(const std::vector<addrspace::NodeDescriptor>& nodes);

    // One [[inputs.opcua]] or [[inputs.opcua_listener]] block.
    std::string renderGroupBlock(const GroupDescriptor& group, const ConnectionParams& conn);

    // Full telegraf.conf: fixed agent preamble, output plugin, then the blocks.
    std::string renderDocument(const std::string& apiToken, const std::vector<std::string>& blocks,
                               const OutputSettings& output = {});

    const char* modeToString(InputMode mode);

} // namespace render
