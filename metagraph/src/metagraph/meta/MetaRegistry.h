// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/scene/Scene.h>

// tbb
#include <tbb/concurrent_unordered_map.h>

// stl
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace metagraph {

class MetaNode;

/// How many meta parents a meta node may have at once.
enum class ParentCardinality
{
    SINGLE,     // adding a parent replaces the current one
    MULTIPLE    // parents accumulate, the meta graph is a DAG
};

/**
 * Maps the type tags stored in mClass to the MetaNode subtypes that handle
 * them, and builds meta nodes through them.
 *
 * A registry is an explicit object handed to every construction site; the
 * process-wide one is set up by bootstrap(). Meta nodes keep a reference to
 * the registry that built them, so it must outlive them.
 *
 * Registration is thread safe and never replaces an existing entry.
 */
class MetaRegistry
{
public:
    using Creator = std::function<std::shared_ptr<MetaNode>(const MetaRegistry&)>;

    struct Options
    {
        ParentCardinality parentCardinality = ParentCardinality::SINGLE;

        // addParent() refuses edges that would make a node its own ancestor
        bool rejectCycles = true;
    };

    /// Registry with the base MetaNode type registered.
    MetaRegistry();
    explicit MetaRegistry(const Options& options);
    ~MetaRegistry();

    MetaRegistry(const MetaRegistry&) = delete;
    MetaRegistry& operator=(const MetaRegistry&) = delete;

    const Options& options() const { return mOptions; }

    /// Returns false if the name is already registered; the first one wins.
    bool registerType(const std::string& typeName, Creator creator);

    template <class T>
    bool registerType()
    {
        return registerType(T::kTypeName, [](const MetaRegistry& registry) {
            return std::make_shared<T>(registry);
        });
    }

    bool isRegistered(const std::string& typeName) const;

    /// Registered type names, sorted.
    std::vector<std::string> typeNames() const;

    /**
     * Unbound instance of the type registered under tag, or bound to node
     * when one is given. Returns nullptr for unknown tags.
     */
    std::shared_ptr<MetaNode> fromTag(const std::string& tag,
                                      const NodeHandle& node = NodeHandle()) const;

    /**
     * Creates a host node for a new meta node of typeName and installs its
     * meta attributes, all as one undoable unit. The node is named
     * "<name>_meta", or "<typeName>_meta" when name is empty, and is locked.
     *
     * Throws MetaGraphError if typeName is not registered.
     */
    std::shared_ptr<MetaNode> create(const std::string& typeName,
                                     Scene& scene,
                                     const std::string& name = std::string{}) const;

    template <class T>
    std::shared_ptr<T> create(Scene& scene, const std::string& name = std::string{}) const
    {
        return std::dynamic_pointer_cast<T>(create(T::kTypeName, scene, name));
    }

    /**
     * Meta node for an existing host node. If the node's mClass names a
     * registered type, that type is built whatever requestedType says, so a
     * node always comes back as the type it was created as. Otherwise
     * requestedType is used, falling back to MetaNode.
     *
     * A node without meta attributes gets them installed and is locked when
     * initialize is set; otherwise the instance is left uninitialized.
     *
     * Throws StaleReferenceError if the node no longer exists.
     */
    std::shared_ptr<MetaNode> construct(const NodeHandle& node,
                                        const std::string& requestedType = std::string{},
                                        bool initialize = true) const;

    template <class T>
    std::shared_ptr<T> construct(const NodeHandle& node, bool initialize = true) const
    {
        return std::dynamic_pointer_cast<T>(construct(node, T::kTypeName, initialize));
    }

    /**
     * Loads every shared library directly inside the given directories and
     * calls its metagraphRegisterTypes() entry point. Libraries loaded by an
     * earlier scan are skipped. Returns the number of libraries loaded.
     */
    std::size_t scan(const std::vector<std::string>& directories);

    /// scan() over a ':' separated search path.
    std::size_t scanSearchPath(const std::string& searchPath);

private:
    Options mOptions;
    tbb::concurrent_unordered_map<std::string, Creator> mCreators;

    mutable std::mutex mLibraryMutex;
    std::set<std::string> mLoadedLibraries;
};

} // namespace metagraph

/**
 * Entry point of a meta type library, found by MetaRegistry::scan().
 *
 * METAGRAPH_REGISTER_TYPES(registry)
 * {
 *     return registry.registerType<MetaRig>();
 * }
 */
#define METAGRAPH_REGISTER_TYPES(registryArg)                                \
    extern "C" __attribute__((visibility("default")))                        \
    bool metagraphRegisterTypes(metagraph::MetaRegistry& registryArg)

