// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "Helpers.h"

#include <metagraph/logging/MetaGraphLogging.h>

// C++
#include <limits>
#include <string>

MgLogSetup("PyMetaGraph");

namespace
{
    namespace py = pybind11;

    bool
    isPyInt(py::handle obj)
    {
        // bool is a subclass of int
        return py::isinstance<py::int_>(obj) && !py::isinstance<py::bool_>(obj);
    }

    bool
    fitsInt(long long value)
    {
        return value >= std::numeric_limits<int>::min()
                && value <= std::numeric_limits<int>::max();
    }

    template <typename ATTR, typename T>
    metagraph::Attribute
    sequenceToAttribute(const py::sequence& seq)
    {
        std::vector<T> values;
        values.reserve(seq.size());
        for (const py::handle item : seq) {
            values.push_back(item.cast<T>());
        }

        return ATTR(values.data(), static_cast<int64_t>(values.size()), 1);
    }

    template <typename ATTR>
    py::object
    dataAttributeToPyObject(const ATTR& attr)
    {
        const auto sample = attr.getNearestSample(0.f);
        if (sample.size() == 1) {
            return py::cast(sample[0]);
        }

        py::list values;
        for (const auto& value : sample) {
            values.append(value);
        }

        return std::move(values);
    }

} // anonymous namespace

namespace pymetagraph
{
    namespace internal
    {
        metagraph::Attribute
        convertPyObjectToAttribute(py::handle pyobj)
        {
            if (pyobj.is_none()) {
                return { };
            }

            if (py::isinstance<py::bool_>(pyobj)) {
                return metagraph::IntAttribute(pyobj.cast<bool>() ? 1 : 0);
            }

            if (isPyInt(pyobj)) {
                const long long value = pyobj.cast<long long>();
                if (fitsInt(value)) {
                    return metagraph::IntAttribute(static_cast<int>(value));
                }
                return metagraph::DoubleAttribute(static_cast<double>(value));
            }

            if (py::isinstance<py::float_>(pyobj)) {
                return metagraph::DoubleAttribute(pyobj.cast<double>());
            }

            if (py::isinstance<py::str>(pyobj)) {
                return metagraph::StringAttribute(pyobj.cast<std::string>());
            }

            if (py::isinstance<py::dict>(pyobj)) {
                metagraph::GroupBuilder gb;
                for (const auto item : pyobj.cast<py::dict>()) {
                    gb.set(item.first.cast<std::string>(),
                           convertPyObjectToAttribute(item.second));
                }
                return gb.build();
            }

            if (py::isinstance<py::list>(pyobj) || py::isinstance<py::tuple>(pyobj)) {
                const py::sequence seq = pyobj.cast<py::sequence>();
                if (seq.size() == 0) {
                    return { };
                }

                bool allInts = true;
                bool allNumbers = true;
                bool allStrings = true;
                for (const py::handle item : seq) {
                    const bool isInt = isPyInt(item) || py::isinstance<py::bool_>(item);
                    allInts = allInts && isInt;
                    allNumbers = allNumbers && (isInt || py::isinstance<py::float_>(item));
                    allStrings = allStrings && py::isinstance<py::str>(item);
                }

                if (allInts) {
                    return sequenceToAttribute<metagraph::IntAttribute, int>(seq);
                }
                if (allNumbers) {
                    return sequenceToAttribute<metagraph::DoubleAttribute, double>(seq);
                }
                if (allStrings) {
                    return sequenceToAttribute<metagraph::StringAttribute, std::string>(seq);
                }
            }

            const std::string typeName = py::str(pyobj.get_type());
            MgLogDebug("Cannot convert Python object of type " << typeName);
            throw py::type_error("[MetaGraph Python Bindings] cannot convert "
                                 + typeName + " to an attribute");
        }

        py::object
        convertAttributeToPyObject(const metagraph::Attribute& attr)
        {
            switch (attr.getType()) {
            case metagraph::kAttrTypeInt:
                return dataAttributeToPyObject(metagraph::IntAttribute(attr));
            case metagraph::kAttrTypeFloat:
                return dataAttributeToPyObject(metagraph::FloatAttribute(attr));
            case metagraph::kAttrTypeDouble:
                return dataAttributeToPyObject(metagraph::DoubleAttribute(attr));
            case metagraph::kAttrTypeString:
            {
                const auto sample = metagraph::StringAttribute(attr).getNearestSample(0.f);
                if (sample.size() == 1) {
                    return py::str(sample[0]);
                }

                py::list values;
                for (const char* value : sample) {
                    values.append(py::str(value));
                }
                return std::move(values);
            }
            case metagraph::kAttrTypeGroup:
            {
                py::dict children;
                for (const auto child : metagraph::GroupAttribute(attr)) {
                    children[py::str(child.name)] = convertAttributeToPyObject(child.attribute);
                }
                return std::move(children);
            }
            default:
                return py::none();
            }
        }

    } // namespace internal

} // namespace pymetagraph

