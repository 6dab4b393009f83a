#include "config_renderer.hpp"

#include <sstream>

namespace render
{

    namespace
    {

        const std::string& intervalOrDefault(const std::string& interval)
        {
            static const std::string fallback = kDefaultInterval;
            return interval.empty() ? fallback : interval;
        }

        std::string joinBlocks(const std::vector<std::string>& blocks, const std::string& separator)
        {
            std::string out;
            for (std::size_t i = 0; i < blocks.size(); ++i)
            {
                if (i > 0)
                    out += separator;
                out += blocks[i];
            }
            return out;
        }

        void writeCommonConnection(std::ostringstream& oss, const ConnectionParams& conn)
        {
            oss << "security_policy = \"Basic256Sha256\"\n"
                << "security_mode = \"SignAndEncrypt\"\n"
                << "certificate = \"\"\n"
                << "private_key = \"\"\n"
                << "auth_method = \"UserName\"\n"
                << "username = \"" << conn.username << "\"\n"
                << "password = \"" << conn.password << "\"\n"
                << "timestamp = \"source\"\n"
                << "client_trace = false\n";
        }

        std::string renderPollBlock(const GroupDescriptor& group, const ConnectionParams& conn)
        {
            std::ostringstream oss;
            oss << "\n"
                << "[[inputs.opcua]]\n"
                << "name = \"opcua\"\n"
                << "interval = \"" << intervalOrDefault(group.samplingInterval) << "\"\n"
                << "endpoint = \"opc.tcp://" << conn.host << ':' << kOpcUaPort << "\"\n"
                << "connect_timeout = \"30s\"\n"
                << "request_timeout = \"10s\"\n";
            writeCommonConnection(oss, conn);
            oss << "    [[inputs.opcua.group]]\n"
                << "      name = \"" << group.groupName << "\"\n"
                << "      namespace = \"" << group.namespaceNumber << "\"\n"
                << "      identifier_type = \"i\"\n"
                << "      nodes = [\n"
                << "        " << renderNodeList(group.nodes) << "\n"
                << "      ]\n"
                << "    ";
            return oss.str();
        }

        std::string renderSubscribeBlock(const GroupDescriptor& group, const ConnectionParams& conn)
        {
            std::ostringstream oss;
            oss << "\n"
                << "[[inputs.opcua_listener]]\n"
                << "name = \"opcua_listener\"\n"
                << "endpoint = \"opc.tcp://" << conn.host << ':' << kOpcUaPort << "\"\n"
                << "connect_fail_behavior = \"ignore\"\n"
                << "connect_timeout = \"30s\"\n"
                << "request_timeout = \"10s\"\n"
                << "session_timeout = \"20m\"\n";
            writeCommonConnection(oss, conn);
            oss << "    [[inputs.opcua_listener.group]]\n"
                << "      name = \"" << group.groupName << "\"\n"
                << "      sampling_interval = \"" << intervalOrDefault(group.samplingInterval) << "\"\n"
                << "      namespace = \"" << group.namespaceNumber << "\"\n"
                << "      identifier_type = \"i\"\n"
                << "      nodes = [\n"
                << "        " << renderNodeList(group.nodes) << "\n"
                << "      ]\n"
                << "    ";
            return oss.str();
        }

    } // namespace

    std::string renderNode(const addrspace::NodeDescriptor& node)
    {
        return "{name=\"" + node.name + "\", identifier=\"" + node.identifier + "\"}";
    }

    std::string renderNodeList(const std::vector<addrspace::NodeDescriptor>& nodes)
    {
        std::vector<std::string> rendered;
        rendered.reserve(nodes.size());
        for (const auto& node : nodes)
            rendered.push_back(renderNode(node));
        return joinBlocks(rendered, ",\n        ");
    }

    std::string renderGroupBlock(const GroupDescriptor& group, const ConnectionParams& conn)
    {
        if (group.mode == InputMode::Subscribe)
            return renderSubscribeBlock(group, conn);
        return renderPollBlock(group, conn);
    }

    std::string renderDocument(const std::string& apiToken, const std::vector<std::string>& blocks,
                               const OutputSettings& output)
    {
        std::ostringstream oss;
        oss << "# Global tags can be specified here in key=\"value\" format.\n"
               "[global_tags]\n"
               "\n"
               "# Configuration for telegraf agent\n"
               "[agent]\n"
               "  ## Default data collection interval for all inputs\n"
               "  interval = \"1000ms\"\n"
               "  round_interval = true\n"
               "\n"
               "  metric_batch_size = 10000\n"
               "  metric_buffer_limit = 100000\n"
               "\n"
               "  collection_jitter = \"0s\"\n"
               "  flush_interval = \"10s\"\n"
               "  flush_jitter = \"0s\"\n"
               "  precision = \"0s\"\n"
               "\n"
               "  ## Log at debug level.\n"
               "  # debug = false\n"
               "  ## Log only error level messages.\n"
               "  # quiet = false\n"
               "\n"
               "  logtarget = \"file\"\n"
               "  logfile = \"/var/log/telegraf/telegraf.log\"\n"
               "  logfile_rotation_max_size = \"25MB\"\n"
               "  logfile_rotation_max_archives = 4\n"
               "\n"
               "  hostname = \"\"\n"
               "  omit_hostname = false\n"
               "\n"
               "# Configuration for sending metrics to InfluxDB 2.0\n"
               "[[outputs.influxdb_v2]]\n";
        oss << "  urls = [\"" << output.url << "\"]\n"
            << "  token = \"" << apiToken << "\"\n"
            << "  organization = \"" << output.organization << "\"\n"
            << "  bucket = \"" << output.bucket << "\"\n"
            << "\n"
            << joinBlocks(blocks, "\n\n") << "\n";
        return oss.str();
    }

    const char* modeToString(InputMode mode)
    {
        switch (mode)
        {
        case InputMode::Poll:
            return "standard";
        case InputMode::Subscribe:
            return "listener";
        }
        return "standard";
    }

} // namespace render
