#include "address_space.hpp"

#include "diagnostic_manager.hpp"

#include <cstring>
#include <filesystem>
#include <sstream>

#include <tinyxml2.h>

namespace addrspace
{

    ParseError::ParseError(const std::string& filePath, int line, const std::string& message)
        : std::runtime_error([&]() {
            std::ostringstream oss;
            if (!filePath.empty())
                oss << filePath << ':';
            if (line > 0)
                oss << line << ' ';
            oss << message;
            return oss.str();
        }()),
          m_file(filePath), m_line(line)
    {
    }

    namespace
    {

        using tinyxml2::XMLElement;

        const char* localName(const XMLElement* elem)
        {
            const char* name  = elem->Name();
            const char* colon = std::strrchr(name, ':');
            return colon ? colon + 1 : name;
        }

        bool hasTagName(const XMLElement* elem, const char* tag)
        {
            return std::strcmp(localName(elem), tag) == 0;
        }

        template <typename Fn>
        void forEachDescendant(XMLElement* root, Fn&& fn)
        {
            for (auto* child = root->FirstChildElement(); child; child = child->NextSiblingElement())
            {
                fn(child);
                forEachDescendant(child, fn);
            }
        }

        // First element below 'root' (document order) carrying the given tag.
        XMLElement* findDescendant(XMLElement* root, const char* tag)
        {
            for (auto* child = root->FirstChildElement(); child; child = child->NextSiblingElement())
            {
                if (hasTagName(child, tag))
                    return child;
                if (auto* nested = findDescendant(child, tag))
                    return nested;
            }
            return nullptr;
        }

        std::optional<std::string> descendantText(XMLElement* root, const char* tag)
        {
            auto* elem = findDescendant(root, tag);
            if (!elem)
                return std::nullopt;
            const char* txt = elem->GetText();
            if (!txt)
                return std::nullopt;
            return std::string(txt);
        }

        std::string stripQuotes(std::string text)
        {
            std::string out;
            out.reserve(text.size());
            for (char c : text)
            {
                if (c != '"')
                    out.push_back(c);
            }
            return out;
        }

    } // namespace

    std::string identifierFromNodeId(const std::string& nodeId)
    {
        auto first = nodeId.find('=');
        if (first == std::string::npos)
            return {};
        auto second = nodeId.find('=', first + 1);
        if (second == std::string::npos)
            return {};
        auto third = nodeId.find('=', second + 1);
        return nodeId.substr(second + 1, third == std::string::npos ? std::string::npos : third - second - 1);
    }

    std::string resolveGroupName(const std::string& path, const AddressSpace& space)
    {
        if (space.groupNameOverride && !space.groupNameOverride->empty())
            return *space.groupNameOverride;
        auto stem = std::filesystem::path(path).stem().string();
        return stem.empty() ? "unknown" : stem;
    }

    AddressSpaceExtractor::AddressSpaceExtractor(diag::DiagnosticManager* diagManager) : m_diag(diagManager) {}

    AddressSpace AddressSpaceExtractor::extract(const std::string& path) const
    {
        tinyxml2::XMLDocument doc;
        if (doc.LoadFile(path.c_str()) != tinyxml2::XML_SUCCESS)
            throw ParseError(path, doc.ErrorLineNum(), std::string("Unable to parse XML: ") + doc.ErrorStr());
        return extractDocument(doc, path);
    }

    AddressSpace AddressSpaceExtractor::extractFromString(const std::string& xml, const std::string& sourceName) const
    {
        tinyxml2::XMLDocument doc;
        if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS)
            throw ParseError(sourceName, doc.ErrorLineNum(), std::string("Unable to parse XML: ") + doc.ErrorStr());
        return extractDocument(doc, sourceName);
    }

    AddressSpace AddressSpaceExtractor::extractDocument(tinyxml2::XMLDocument& doc, const std::string& path) const
    {
        auto* root = doc.RootElement();
        if (!root)
            throw ParseError(path, doc.ErrorLineNum(), "Document has no root element");

        AddressSpace space;
        int          sentinelMatches = 0;

        auto visitObject = [&](XMLElement* elem)
        {
            if (!hasTagName(elem, "UAObject"))
                return;
            const char* nodeId = elem->Attribute("NodeId");
            if (!nodeId || std::strcmp(nodeId, kGroupSentinelNodeId) != 0)
                return;

            auto displayName = descendantText(elem, "DisplayName");
            if (!displayName)
                return;

            ++sentinelMatches;
            if (m_diag)
            {
                m_diag->log(diag::Severity::INFO, "AddressSpace",
                            std::string("DisplayName for ") + kGroupSentinelNodeId + ": " + *displayName);
                if (sentinelMatches > 1)
                    m_diag->log(diag::Severity::WARN, "AddressSpace",
                                "Multiple group objects in " + path + " (line " + std::to_string(elem->GetLineNum()) +
                                    "), the last one wins");
            }
            space.groupNameOverride = *displayName;
        };

        auto visitVariable = [&](XMLElement* elem)
        {
            if (!hasTagName(elem, "UAVariable"))
                return;
            const char* nodeId = elem->Attribute("NodeId");
            if (!nodeId)
                return;
            std::string id(nodeId);
            if (id.rfind(kVariableNodeIdPrefix, 0) != 0)
                return;

            NodeDescriptor node;
            node.identifier = identifierFromNodeId(id);
            node.name       = descendantText(elem, "BrowseName").value_or(std::string{});
            if (auto mapping = descendantText(elem, "VariableMapping"))
                node.name = stripQuotes(*mapping);
            space.nodes.push_back(std::move(node));
        };

        // Root element is part of the scan as well.
        visitObject(root);
        forEachDescendant(root, visitObject);
        visitVariable(root);
        forEachDescendant(root, visitVariable);

        if (m_diag)
            m_diag->log(diag::Severity::DEBUG, "AddressSpace",
                        "Extracted " + std::to_string(space.nodes.size()) + " node(s) from " + path);
        return space;
    }

} // namespace addrspace
