// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

#include <metagraph/attribute/Attribute.h>

// C++
#include <memory>
#include <vector>

// pybind11
#include <pybind11/pybind11.h>
#include <pybind11/stl_bind.h>

namespace pymetagraph
{
    namespace internal
    {
        /**
         * None becomes an invalid attribute, bool/int/float/str and lists of
         * one of them the matching data attribute, dict a GroupAttribute.
         * Throws pybind11::type_error for anything else.
         */
        metagraph::Attribute convertPyObjectToAttribute(pybind11::handle pyobj);

        /// Single values come back as scalars, groups as dicts.
        pybind11::object convertAttributeToPyObject(const metagraph::Attribute& attr);

    } // namespace internal

    template <typename ConstIterator>
    inline pybind11::list
    StdVectorToPyList(ConstIterator beginIter, ConstIterator endIter)
    {
        pybind11::list pyList { };

        for (auto iter = beginIter; iter != endIter; ++iter) {
            pyList.append(*iter);
        }

        return pyList;
    }

    template <typename T>
    inline void
    pymetagraph_bind_vector(pybind11::module& module, const std::string& name)
    {
        pybind11::bind_vector<std::vector<T>, std::shared_ptr<std::vector<T>>>(module, name);
    }

} // namespace pymetagraph

