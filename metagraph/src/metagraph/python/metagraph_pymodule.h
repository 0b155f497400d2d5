// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// pybind11
#include <pybind11/pybind11.h>
PYBIND11_DECLARE_HOLDER_TYPE(T, std::shared_ptr<T>);

namespace pymetagraph
{
    void registerAttributeKind(pybind11::module &);
    void registerScene(pybind11::module &);
    void registerPlug(pybind11::module &);
    void registerNodeUtil(pybind11::module &);

    void registerMetaRegistry(pybind11::module &);
    void registerMetaNode(pybind11::module &);
    void registerTraversal(pybind11::module &);
    void registerMetaUtil(pybind11::module &);
} // namespace pymetagraph

