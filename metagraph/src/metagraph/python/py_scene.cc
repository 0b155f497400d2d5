// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include <metagraph/attribute/AttributeKind.h>
#include <metagraph/node/NodeSerialization.h>
#include <metagraph/node/NodeUtil.h>
#include <metagraph/plug/PlugUtil.h>
#include <metagraph/scene/Plug.h>
#include <metagraph/scene/Scene.h>

#include "Helpers.h"
#include "metagraph_pymodule.h"

// pybind11
#include <pybind11/stl.h>

namespace pymetagraph
{
    namespace py = pybind11;

    using metagraph::AttributeKind;
    using metagraph::NodeHandle;
    using metagraph::Plug;
    using metagraph::Scene;

    using ScenePtr = std::shared_ptr<Scene>;

    namespace internal
    {
        py::object
        Plug_getValue(const Plug& self)
        {
            return convertAttributeToPyObject(metagraph::plug_util::getValue(self));
        }

        void
        Plug_setValue(const Plug& self, py::object value)
        {
            metagraph::plug_util::setValue(self, convertPyObjectToAttribute(value));
        }

        NodeHandle
        Scene_createNode(Scene& self,
                         const std::string& name,
                         const std::string& typeName,
                         const NodeHandle& parent)
        {
            return metagraph::node_util::createNode(self, name, typeName, parent);
        }

        py::object
        NodeHandle_serialize(const NodeHandle& self)
        {
            return convertAttributeToPyObject(metagraph::node_util::serializeNode(self));
        }

        NodeHandle
        Scene_deserializeNode(Scene& self, py::object record)
        {
            return metagraph::node_util::deserializeNode(
                    self, metagraph::GroupAttribute(convertPyObjectToAttribute(record)));
        }
    } // namespace internal

    void
    registerAttributeKind(py::module& module)
    {
        py::enum_<AttributeKind> kindEnum(module, "AttributeKind");
        for (const AttributeKind kind : metagraph::allAttributeKinds()) {
            kindEnum.value(metagraph::kindName(kind), kind);
        }

        module.def("kindFromTag",
                   [](int tag) -> py::object {
                       const auto kind = metagraph::kindFromTag(tag);
                       return kind ? py::cast(*kind) : py::none();
                   },
                   py::arg("tag"));

        module.def("isEdgeOnlyKind", &metagraph::isEdgeOnlyKind, py::arg("kind"));
    }

    void
    registerScene(py::module& module)
    {
        py::class_<NodeHandle>(module, "NodeHandle")
                .def(py::init<>())
                .def("isValid", &NodeHandle::isValid)
                .def("isBound", &NodeHandle::isBound)
                .def("id", &NodeHandle::id)
                .def("name", &NodeHandle::name)
                .def("typeName", &NodeHandle::typeName)
                .def("isDag", &NodeHandle::isDag)
                .def("isLocked", &NodeHandle::isLocked)
                .def("parent", &NodeHandle::parent)
                .def("children", &NodeHandle::children)
                .def("fullPathName", &NodeHandle::fullPathName)
                .def("serialize", &internal::NodeHandle_serialize)
                .def("__eq__", &NodeHandle::operator==)
                .def("__ne__", &NodeHandle::operator!=)
                .def("__hash__", [](const NodeHandle& self) { return self.id(); })
                .def("__repr__", [](const NodeHandle& self) {
                    return "<NodeHandle '" + (self.isValid() ? self.fullPathName()
                                                             : std::string("<stale>")) + "'>";
                });

        py::class_<Scene, ScenePtr>(module, "Scene")
                .def(py::init<>())
                .def("findNode", &Scene::findNode, py::arg("name"), py::keep_alive<0, 1>())
                .def("nodes", &Scene::nodes, py::keep_alive<0, 1>())
                .def("nodeCount", &Scene::nodeCount)
                .def("uniqueName", &Scene::uniqueName, py::arg("requested"))
                .def("loadExtension", &Scene::loadExtension, py::arg("name"))
                .def("isExtensionLoaded", &Scene::isExtensionLoaded, py::arg("name"))

                .def("createNode",
                     &internal::Scene_createNode,
                     py::arg("name"),
                     py::arg("typeName") = std::string(metagraph::NodeTypeRegistry::kNetwork),
                     py::arg("parent") = NodeHandle(),
                     py::keep_alive<0, 1>())

                .def("deserializeNode",
                     &internal::Scene_deserializeNode,
                     py::arg("record"),
                     py::keep_alive<0, 1>());
    }

    void
    registerPlug(py::module& module)
    {
        py::class_<Plug>(module, "Plug")
                .def(py::init<>())
                .def(py::init<const NodeHandle&, const std::string&>(),
                     py::arg("node"), py::arg("attrName"))
                .def_static("fromPath", &Plug::fromPath, py::arg("node"), py::arg("path"))
                .def("isNull", &Plug::isNull)
                .def("isValid", &Plug::isValid)
                .def("node", &Plug::node)
                .def("name", &Plug::name)
                .def("partialName", &Plug::partialName)
                .def("kind", &Plug::kind)
                .def("isArray", &Plug::isArray)
                .def("isElement", &Plug::isElement)
                .def("isLocked", &Plug::isLocked)
                .def("parent", &Plug::parent)
                .def("child", py::overload_cast<const std::string&>(&Plug::child, py::const_),
                     py::arg("childName"))
                .def("elementByLogicalIndex", &Plug::elementByLogicalIndex, py::arg("index"))
                .def("existingIndices", &Plug::existingIndices)
                .def("elements", &Plug::elements)
                .def("isSource", &Plug::isSource)
                .def("isDestination", &Plug::isDestination)
                .def("source", &Plug::source)
                .def("destinations", &Plug::destinations)
                .def("value", &internal::Plug_getValue)
                .def("setValue", &internal::Plug_setValue, py::arg("value"))
                .def("__eq__", &Plug::operator==)
                .def("__ne__", &Plug::operator!=)
                .def("__repr__", [](const Plug& self) { return "<Plug '" + self.name() + "'>"; });
    }

    void
    registerNodeUtil(py::module& module)
    {
        py::module submod = module.def_submodule("node_util");

        submod
                .def("deleteNode",
                     [](const NodeHandle& node) { metagraph::node_util::deleteNode(node); },
                     py::arg("node"))

                .def("rename",
                     [](const NodeHandle& node, const std::string& newName) {
                         metagraph::node_util::rename(node, newName);
                     },
                     py::arg("node"), py::arg("newName"))

                .def("reparent",
                     [](const NodeHandle& child, const NodeHandle& parent, bool maintainOffset) {
                         metagraph::node_util::reparent(child, parent, maintainOffset);
                     },
                     py::arg("child"), py::arg("newParent"), py::arg("maintainOffset") = true)

                .def("connect",
                     [](const Plug& source, const Plug& destination, bool force) {
                         metagraph::node_util::connect(source, destination, force);
                     },
                     py::arg("source"), py::arg("destination"), py::arg("force") = false)

                .def("setLocked",
                     [](const NodeHandle& node, bool state) {
                         metagraph::node_util::setLocked(node, state);
                     },
                     py::arg("node"), py::arg("state"))

                .def("iterAttributes", &metagraph::node_util::iterAttributes, py::arg("node"))

                .def("iterConnections",
                     &metagraph::node_util::iterConnections,
                     py::arg("node"), py::arg("source") = true, py::arg("destination") = true);

        py::module plugSubmod = module.def_submodule("plug_util");

        plugSubmod
                .def("createAttribute",
                     [](const NodeHandle& node, const std::string& name,
                        AttributeKind kind, bool isArray) {
                         return metagraph::plug_util::createAttribute(node, name, kind, isArray);
                     },
                     py::arg("node"), py::arg("name"), py::arg("kind"), py::arg("isArray") = false)

                .def("nextAvailableElement",
                     &metagraph::plug_util::nextAvailableElement,
                     py::arg("arrayPlug"))

                .def("isDefaultValue", &metagraph::plug_util::isDefaultValue, py::arg("plug"));
    }

} // namespace pymetagraph

