#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tinyxml2
{
    class XMLDocument;
}

namespace diag
{
    class DiagnosticManager;
}

namespace addrspace
{

    // Organizer object whose DisplayName names the whole group.
    inline constexpr const char* kGroupSentinelNodeId = "ns=2;i=1";
    inline constexpr const char* kVariableNodeIdPrefix = "ns=2;i=";

    class ParseError : public std::runtime_error
    {
      public:
        ParseError(const std::string& filePath, int line, const std::string& message);

        int                line() const { return m_line; }
        const std::string& file() const { return m_file; }

      private:
        std::string m_file;
        int         m_line{};
    };

    struct NodeDescriptor
    {
        std::string name;
        std::string identifier;
    };

    struct AddressSpace
    {
        std::optional<std::string>  groupNameOverride;
        std::vector<NodeDescriptor> nodes;
    };

    /**
     * Reads a vendor OPC-UA address-space export (UANodeSet-style XML) and
     * collects the namespace-2 variables in document order. Elements are
     * matched on their local name, so prefixed and unprefixed exports both
     * work.
     */
    class AddressSpaceExtractor
    {
      public:
        explicit AddressSpaceExtractor(diag::DiagnosticManager* diagManager = nullptr);

        AddressSpace extract(const std::string& path) const;
        AddressSpace extractFromString(const std::string& xml, const std::string& sourceName = {}) const;

      private:
        AddressSpace extractDocument(tinyxml2::XMLDocument& doc, const std::string& path) const;

        diag::DiagnosticManager* m_diag{nullptr};
    };

    // Third '='-separated segment of "ns=2;i=<k>", i.e. "<k>".
    std::string identifierFromNodeId(const std::string& nodeId);

    // Group override if present, otherwise the file name without extension.
    std::string resolveGroupName(const std::string& path, const AddressSpace& space);

} // namespace addrspace
