// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "Plug.h"
#include "SceneInternal.h"

// metagraph
#include <metagraph/Errors.h>

// pystring
#include <pystring/pystring.h>

// stl
#include <cctype>
#include <set>

namespace {

using namespace metagraph;

AttributeSpec::Ptr
resolveSpec(const internal::NodeData& node, const PlugPath& path)
{
    if (path.empty()) {
        return nullptr;
    }

    AttributeSpec::Ptr spec = node.findAttribute(path[0].name);
    if (!spec || (path[0].index >= 0 && !spec->isArray)) {
        return nullptr;
    }

    for (std::size_t i = 1; i < path.size(); ++i) {
        // children of an array compound are only reachable through an element
        if (spec->kind != AttributeKind::COMPOUND
                || (spec->isArray && path[i - 1].index < 0)) {
            return nullptr;
        }

        spec = spec->findChild(path[i].name);
        if (!spec || (path[i].index >= 0 && !spec->isArray)) {
            return nullptr;
        }
    }

    return spec;
}

bool
parseIndex(const std::string& text, int64_t& index)
{
    if (text.empty() || text.size() > 18) {
        return false;
    }

    index = 0;
    for (const char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        index = index * 10 + (c - '0');
    }

    return true;
}

} // anonymous namespace

namespace metagraph {

bool
parsePlugPath(const std::string& text, PlugPath& path)
{
    path.clear();

    std::vector<std::string> tokens;
    pystring::split(text, tokens, ".");

    for (const std::string& token : tokens) {
        PlugPathElement element;

        const int bracket = pystring::find(token, "[");
        if (bracket < 0) {
            element.name = token;
        } else {
            if (!pystring::endswith(token, "]")) {
                return false;
            }
            element.name = pystring::slice(token, 0, bracket);
            if (!parseIndex(pystring::slice(token, bracket + 1, -1), element.index)) {
                return false;
            }
        }

        if (element.name.empty()) {
            return false;
        }
        path.push_back(std::move(element));
    }

    return !path.empty();
}

std::string
formatPlugPath(const PlugPath& path)
{
    std::string result;
    for (const auto& element : path) {
        if (!result.empty()) {
            result += '.';
        }
        result += element.name;
        if (element.index >= 0) {
            result += '[' + std::to_string(element.index) + ']';
        }
    }

    return result;
}

Plug::Plug(const NodeHandle& node, PlugPath path)
    : mNode(node)
    , mPath(std::move(path))
{
}

Plug::Plug(const NodeHandle& node, const std::string& attrName)
    : mNode(node)
    , mPath{ PlugPathElement{ attrName, -1 } }
{
}

Plug
Plug::fromPath(const NodeHandle& node, const std::string& path)
{
    PlugPath parsed;
    if (!parsePlugPath(path, parsed)) {
        return {};
    }

    return Plug(node, std::move(parsed));
}

bool
Plug::isValid() const
{
    if (isNull() || !mNode.isValid()) {
        return false;
    }

    return resolveSpec(*mNode.data(), mPath) != nullptr;
}

std::string
Plug::name() const
{
    const std::string nodeName = mNode.isValid() ? mNode.name() : std::string("<stale>");
    return nodeName + "." + partialName();
}

std::string
Plug::partialName() const
{
    return formatPlugPath(mPath);
}

const std::string&
Plug::attributeName() const
{
    static const std::string kEmpty;
    return mPath.empty() ? kEmpty : mPath.back().name;
}

AttributeSpec::Ptr
Plug::spec() const
{
    const auto node = mNode.data();

    AttributeSpec::Ptr result = resolveSpec(*node, mPath);
    if (!result) {
        throw AttributeNotFoundError::fromName(node->name, partialName());
    }

    return result;
}

bool
Plug::isArray() const
{
    return spec()->isArray && !isElement();
}

bool
Plug::isChild() const
{
    return mPath.size() > 1;
}

Plug
Plug::parent() const
{
    if (isElement()) {
        PlugPath path = mPath;
        path.back().index = -1;
        return Plug(mNode, std::move(path));
    }

    if (mPath.size() > 1) {
        return Plug(mNode, PlugPath(mPath.begin(), mPath.end() - 1));
    }

    return {};
}

Plug
Plug::child(const std::string& childName) const
{
    PlugPath path = mPath;
    path.push_back({ childName, -1 });
    return Plug(mNode, std::move(path));
}

Plug
Plug::child(std::size_t index) const
{
    const AttributeSpec::Ptr compound = spec();
    if (index >= compound->children.size()) {
        return {};
    }

    return child(compound->children[index]->name);
}

std::size_t
Plug::numChildren() const
{
    return spec()->children.size();
}

Plug
Plug::elementByLogicalIndex(int64_t index) const
{
    PlugPath path = mPath;
    if (!path.empty()) {
        path.back().index = index;
    }
    return Plug(mNode, std::move(path));
}

std::vector<int64_t>
Plug::existingIndices() const
{
    const auto node = mNode.data();
    const std::string prefix = partialName() + "[";

    std::set<int64_t> indices;
    const auto collect = [&](const std::string& path) {
        if (path.compare(0, prefix.size(), prefix) != 0) {
            return;
        }
        const std::size_t close = path.find(']', prefix.size());
        int64_t index = -1;
        if (close != std::string::npos
                && parseIndex(path.substr(prefix.size(), close - prefix.size()), index)) {
            indices.insert(index);
        }
    };

    for (const auto& entry : node->plugs) {
        collect(entry.first);
    }

    for (const auto& connection : node->connections) {
        if (connection->source.lock() == node) {
            collect(connection->sourcePath);
        }
        if (connection->destination.lock() == node) {
            collect(connection->destinationPath);
        }
    }

    return std::vector<int64_t>(indices.begin(), indices.end());
}

std::vector<Plug>
Plug::elements() const
{
    std::vector<Plug> result;
    for (const int64_t index : existingIndices()) {
        result.push_back(elementByLogicalIndex(index));
    }

    return result;
}

bool
Plug::isLocked() const
{
    const auto node = mNode.data();

    // a lock on an array or compound covers everything below it
    for (Plug current = *this; !current.isNull(); current = current.parent()) {
        const auto it = node->plugs.find(current.partialName());
        if (it != node->plugs.end() && it->second.locked) {
            return true;
        }
    }

    return false;
}

Attribute
Plug::value() const
{
    const AttributeSpec::Ptr attrSpec = spec();
    if (isArray() || attrSpec->kind == AttributeKind::COMPOUND
            || isEdgeOnlyKind(attrSpec->kind)) {
        return {};
    }

    const auto node = mNode.data();
    const auto it = node->plugs.find(partialName());
    if (it != node->plugs.end() && it->second.value.isValid()) {
        return it->second.value;
    }

    if (attrSpec->defaultValue.isValid()) {
        return attrSpec->defaultValue;
    }

    return kindDefaultValue(attrSpec->kind);
}

bool
Plug::hasStoredValue() const
{
    const auto node = mNode.data();
    const auto it = node->plugs.find(partialName());
    return it != node->plugs.end() && it->second.value.isValid();
}

bool
Plug::isSource() const
{
    const auto node = mNode.data();
    const std::string path = partialName();
    for (const auto& connection : node->connections) {
        if (connection->sourcePath == path && connection->source.lock() == node) {
            return true;
        }
    }

    return false;
}

bool
Plug::isDestination() const
{
    return !source().isNull();
}

Plug
Plug::source() const
{
    const auto node = mNode.data();
    const std::string path = partialName();
    for (const auto& connection : node->connections) {
        if (connection->destinationPath == path && connection->destination.lock() == node) {
            return Plug::fromPath(NodeHandle(node->scene, connection->source.lock()),
                                  connection->sourcePath);
        }
    }

    return {};
}

std::vector<Plug>
Plug::destinations() const
{
    const auto node = mNode.data();
    const std::string path = partialName();

    std::vector<Plug> result;
    for (const auto& connection : node->connections) {
        if (connection->sourcePath == path && connection->source.lock() == node) {
            result.push_back(Plug::fromPath(NodeHandle(node->scene, connection->destination.lock()),
                                            connection->destinationPath));
        }
    }

    return result;
}

std::vector<std::pair<Plug, Plug>>
Plug::connectionsBelow(bool asSource, bool asDestination) const
{
    const auto node = mNode.data();
    const std::string prefix = partialName();

    std::vector<std::pair<Plug, Plug>> result;
    for (const auto& connection : node->connections) {
        const auto source = connection->source.lock();
        const auto destination = connection->destination.lock();

        if (asSource && source == node
                && internal::pathHasPrefix(connection->sourcePath, prefix)) {
            result.emplace_back(Plug::fromPath(mNode, connection->sourcePath),
                                Plug::fromPath(NodeHandle(node->scene, destination),
                                               connection->destinationPath));
        }
        if (asDestination && destination == node
                && internal::pathHasPrefix(connection->destinationPath, prefix)) {
            result.emplace_back(Plug::fromPath(mNode, connection->destinationPath),
                                Plug::fromPath(NodeHandle(node->scene, source),
                                               connection->sourcePath));
        }
    }

    return result;
}

bool
Plug::operator==(const Plug& other) const
{
    return mNode == other.mNode && partialName() == other.partialName();
}

} // namespace metagraph

