// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include <metagraph/meta/MetaNode.h>
#include <metagraph/meta/MetaRegistry.h>
#include <metagraph/meta/MetaTraversal.h>
#include <metagraph/meta/MetaUtil.h>

#include "Helpers.h"
#include "metagraph_pymodule.h"

// pybind11
#include <pybind11/stl.h>

namespace pymetagraph
{
    namespace py = pybind11;

    using metagraph::MetaNode;
    using metagraph::MetaRegistry;
    using metagraph::MetaTraversal;
    using metagraph::NodeHandle;
    using metagraph::Scene;
    using metagraph::TraversalDirection;

    using MetaNodePtr = MetaNode::Ptr;

    namespace internal
    {
        py::object
        MetaNode_getAttribute(const MetaNodePtr& self, const std::string& name)
        {
            return convertAttributeToPyObject(self->getAttribute(name));
        }

        void
        MetaNode_setAttribute(const MetaNodePtr& self, const std::string& name, py::object value)
        {
            self->setAttribute(name, convertPyObjectToAttribute(value));
        }

        metagraph::Plug
        MetaNode_addAttribute(const MetaNodePtr& self,
                              const std::string& name,
                              py::object value,
                              metagraph::AttributeKind kind,
                              bool isArray,
                              bool lock)
        {
            return self->addAttribute(name, convertPyObjectToAttribute(value), kind, isArray, lock);
        }

        py::object
        MetaNode_serialize(const MetaNodePtr& self)
        {
            return convertAttributeToPyObject(self->serialize());
        }

        MetaRegistry*
        MetaRegistry_Constructor(const std::string& parentCardinality, bool rejectCycles)
        {
            MetaRegistry::Options options;
            options.rejectCycles = rejectCycles;
            if (parentCardinality == "multiple") {
                options.parentCardinality = metagraph::ParentCardinality::MULTIPLE;
            } else if (parentCardinality != "single") {
                throw py::value_error("parentCardinality must be 'single' or 'multiple'");
            }

            return new MetaRegistry(options);
        }
    } // namespace internal

    void
    registerMetaRegistry(py::module& module)
    {
        py::enum_<metagraph::ParentCardinality>(module, "ParentCardinality")
                .value("SINGLE", metagraph::ParentCardinality::SINGLE)
                .value("MULTIPLE", metagraph::ParentCardinality::MULTIPLE);

        py::class_<MetaRegistry>(module, "MetaRegistry")
                .def(py::init(&internal::MetaRegistry_Constructor),
                     py::arg("parentCardinality") = std::string("single"),
                     py::arg("rejectCycles") = true)

                .def("parentCardinality",
                     [](const MetaRegistry& self) { return self.options().parentCardinality; })

                .def("isRegistered", &MetaRegistry::isRegistered, py::arg("typeName"))

                .def("typeNames", &MetaRegistry::typeNames)

                .def("create",
                     &MetaRegistry::create,
                     py::arg("typeName"),
                     py::arg("scene"),
                     py::arg("name") = std::string(),
                     py::keep_alive<0, 1>(),
                     py::keep_alive<0, 3>())

                .def("construct",
                     &MetaRegistry::construct,
                     py::arg("node"),
                     py::arg("requestedType") = std::string(),
                     py::arg("initialize") = true,
                     py::keep_alive<0, 1>())

                .def("scan", &MetaRegistry::scan, py::arg("directories"),
                     py::call_guard<py::gil_scoped_release>())

                .def("scanSearchPath", &MetaRegistry::scanSearchPath, py::arg("searchPath"),
                     py::call_guard<py::gil_scoped_release>());
    }

    void
    registerMetaNode(py::module& module)
    {
        py::class_<MetaNode, MetaNodePtr> metaNode(module, "MetaNode");

        py::enum_<MetaNode::State>(metaNode, "State")
                .value("UNBOUND", MetaNode::State::UNBOUND)
                .value("BOUND_UNINITIALIZED", MetaNode::State::BOUND_UNINITIALIZED)
                .value("BOUND_INITIALIZED", MetaNode::State::BOUND_INITIALIZED)
                .value("INVALID", MetaNode::State::INVALID);

        metaNode
                .def("typeName", &MetaNode::typeName)
                .def("state", &MetaNode::state)
                .def("exists", &MetaNode::exists)
                .def("node", &MetaNode::node)
                .def("initialize", &MetaNode::initialize, py::arg("lock") = true)

                .def("classType", &MetaNode::classType)
                .def("version", &MetaNode::version)
                .def("name", &MetaNode::name)
                .def("fullPathName", &MetaNode::fullPathName)
                .def("rename", &MetaNode::rename, py::arg("newName"))
                .def("isLocked", &MetaNode::isLocked)
                .def("lock", &MetaNode::lock, py::arg("state"))
                .def("__eq__", &MetaNode::operator==)
                .def("__ne__", &MetaNode::operator!=)

                .def("hasAttribute", &MetaNode::hasAttribute, py::arg("name"))
                .def("attribute", &MetaNode::attribute, py::arg("name"))
                .def("getAttribute", &internal::MetaNode_getAttribute, py::arg("name"))
                .def("setAttribute", &internal::MetaNode_setAttribute,
                     py::arg("name"), py::arg("value"))
                .def("addAttribute",
                     &internal::MetaNode_addAttribute,
                     py::arg("name"),
                     py::arg("value"),
                     py::arg("kind"),
                     py::arg("isArray") = false,
                     py::arg("lock") = true)
                .def("removeAttribute", &MetaNode::removeAttribute, py::arg("name"))
                .def("renameAttribute", &MetaNode::renameAttribute,
                     py::arg("name"), py::arg("newName"))
                .def("attributes", &MetaNode::attributes)
                .def("findPlugsByFilteredName", &MetaNode::findPlugsByFilteredName,
                     py::arg("pattern"))

                .def("iterConnections", &MetaNode::iterConnections,
                     py::arg("source") = true, py::arg("destination") = true)
                .def("findConnectedNodes", &MetaNode::findConnectedNodes,
                     py::arg("attrName") = std::string(), py::arg("pattern") = std::string())
                .def("findConnectedNodesByAttributeName",
                     &MetaNode::findConnectedNodesByAttributeName,
                     py::arg("pattern"), py::arg("recursive") = false)
                .def("connectTo", &MetaNode::connectTo,
                     py::arg("attrName"),
                     py::arg("target"),
                     py::arg("targetAttrName") = std::string(MetaNode::kTargetAttr))
                .def("disconnectFrom", &MetaNode::disconnectFrom, py::arg("target"))

                .def("addParent", &MetaNode::addParent, py::arg("parent"))
                .def("addChild", &MetaNode::addChild, py::arg("child"))
                .def("removeParent",
                     [](MetaNode& self, const MetaNodePtr& parent) {
                         return self.removeParent(parent.get());
                     },
                     py::arg("parent") = MetaNodePtr())
                .def("removeAllParents", &MetaNode::removeAllParents)
                .def("removeChild",
                     py::overload_cast<MetaNode&>(&MetaNode::removeChild),
                     py::arg("child"))
                .def("metaParents", &MetaNode::metaParents)
                .def("metaChildren", &MetaNode::metaChildren)
                .def("isRoot", &MetaNode::isRoot)
                .def("metaRoot", &MetaNode::metaRoot)

                .def("children", &MetaNode::children,
                     py::arg("depthLimit") = MetaNode::kDefaultDepthLimit)
                .def("parents", &MetaNode::parents,
                     py::arg("depthLimit") = MetaNode::kDefaultDepthLimit)
                .def("tree", &MetaNode::tree,
                     py::arg("depthLimit") = MetaNode::kDefaultDepthLimit,
                     py::arg("direction") = TraversalDirection::UPSTREAM)
                .def("findChildrenByClassType", &MetaNode::findChildrenByClassType,
                     py::arg("classType"),
                     py::arg("depthLimit") = MetaNode::kDefaultDepthLimit)
                .def("findChildrenByFilter", &MetaNode::findChildrenByFilter,
                     py::arg("pattern"),
                     py::arg("attrName") = std::string(),
                     py::arg("depthLimit") = MetaNode::kDefaultDepthLimit)

                .def("serialize", &internal::MetaNode_serialize)
                .def("deleteNode", &MetaNode::deleteNode);
    }

    void
    registerTraversal(py::module& module)
    {
        py::enum_<TraversalDirection>(module, "TraversalDirection")
                .value("DOWNSTREAM", TraversalDirection::DOWNSTREAM)
                .value("UPSTREAM", TraversalDirection::UPSTREAM);

        py::class_<MetaTraversal>(module, "MetaTraversal")
                .def("__iter__",
                     [](const MetaTraversal& self) {
                         return py::make_iterator(self.begin(), self.end());
                     },
                     py::keep_alive<0, 1>())
                .def("toVector", &MetaTraversal::toVector)
                .def("count", &MetaTraversal::count)
                .def("__len__", &MetaTraversal::count);
    }

    void
    registerMetaUtil(py::module& module)
    {
        py::module submod = module.def_submodule("meta_util");

        submod
                .def("isMetaNode", &metagraph::meta_util::isMetaNode,
                     py::arg("registry"), py::arg("node"))

                .def("iterSceneMetaNodes", &metagraph::meta_util::iterSceneMetaNodes,
                     py::arg("registry"), py::arg("scene"))

                .def("findSceneRoots", &metagraph::meta_util::findSceneRoots,
                     py::arg("registry"), py::arg("scene"))

                .def("findMetaNodesByClassType", &metagraph::meta_util::findMetaNodesByClassType,
                     py::arg("registry"), py::arg("scene"), py::arg("classType"))

                .def("connectedMetaNodes", &metagraph::meta_util::connectedMetaNodes,
                     py::arg("registry"),
                     py::arg("node"),
                     py::arg("direction") = TraversalDirection::DOWNSTREAM)

                .def("filterSceneByAttributeValues",
                     py::overload_cast<const MetaRegistry&,
                                       const Scene&,
                                       const metagraph::StringVector&,
                                       const std::string&>(
                             &metagraph::meta_util::filterSceneByAttributeValues),
                     py::arg("registry"), py::arg("scene"), py::arg("attrNames"),
                     py::arg("pattern"));
    }

} // namespace pymetagraph

