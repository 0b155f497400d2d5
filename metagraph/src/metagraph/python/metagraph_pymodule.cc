// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


// Local
#include "Helpers.h"
#include "metagraph_pymodule.h"

// pybind11
#include <pybind11/pybind11.h>

// MetaGraph
#include <metagraph/Errors.h>
#include <metagraph/MetaGraph.h>

PYBIND11_MODULE(pymetagraph, module)
{
    module.doc() = "MetaGraph Python bindings (pybind11).";

    pybind11::register_exception<metagraph::MetaGraphError>(module, "MetaGraphError");

    pymetagraph::registerAttributeKind(module);
    pymetagraph::registerScene(module);
    pymetagraph::registerPlug(module);
    pymetagraph::registerNodeUtil(module);

    pymetagraph::registerTraversal(module);
    pymetagraph::registerMetaRegistry(module);
    pymetagraph::registerMetaNode(module);
    pymetagraph::registerMetaUtil(module);

    module.def("bootstrap",
               &metagraph::bootstrap,
               pybind11::arg("katanaRoot") = std::string());

    module.def("defaultRegistry",
               &metagraph::defaultRegistry,
               pybind11::return_value_policy::reference);

    module.def("setNumberOfThreads",
               &metagraph::setNumberOfThreads,
               pybind11::arg("numThreads"),
               "Set to '0' for automatic");

    module.def("getNumberOfThreads", &metagraph::getNumberOfThreads);
}

