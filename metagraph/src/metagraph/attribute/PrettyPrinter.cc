// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "Attribute.h"

#include <cstdio>
#include <iostream>
#include <sstream>

namespace {

void printindent(std::ostream& o, unsigned indent) {
    for (unsigned i = 0; i < indent; i++) o << "  ";
}

void printstring(std::ostream& o, const char* s) {
    o << '"';
    while (unsigned char c = *s++) {
        switch (c) {
        case '"': o << "\\\""; break;
        case '\\': o << "\\\\"; break;
        case '\n': o << "\\n"; break;
        case '\t': o << "\\t"; break;
        default:
            if (c < 0x20 || c == 0x7F) {
                char buf[5];
                std::snprintf(buf, sizeof(buf), "\\x%02X", c);
                o << buf;
            } else {
                o << c;
            }
        }
    }
    o << '"';
}

// Values print grouped by tuple, long arrays are elided after the first tuple.
template <class AttrT>
bool printnumeric(std::ostream& o, const metagraph::Attribute& attribute) {
    AttrT attr(attribute);
    if (!attr.isValid()) {
        return false;
    }

    const int64_t tuple = attr.getTupleSize();
    const auto values(attr.getNearestSample(0.f));
    const int64_t count = static_cast<int64_t>(values.size());
    if (count != tuple) o << '[';
    for (int64_t i = 0; i < count; ++i) {
        if (i) o << ", ";
        if (i >= tuple && count > 16) { o << "..."; break; }
        if (tuple > 1 && !(i%tuple)) o << '(';
        o << values[i];
        if (tuple > 1 && !((i+1)%tuple)) o << ')';
    }
    if (count != tuple) o << ']';
    return true;
}

}

namespace metagraph
{

void print(std::ostream& o, const metagraph::Attribute& attribute, unsigned indent) {

    if (!attribute.isValid()) {
        o << "<invalid>";
        return;
    }

    metagraph::GroupAttribute group(attribute);
    if (group.isValid()) {
        o << '{';
        bool any = false;
        for (auto child : group) {
            if (any) o << ",\n";
            else {o << '\n'; any = true;}
            printindent(o, indent+1);
            o << child.name << ": ";
            print(o, child.attribute, indent+1);
        }
        if (any) {o << '\n'; printindent(o, indent);}
        o << '}';
        return;
    }

    metagraph::StringAttribute sattr(attribute);
    if (sattr.isValid()) {
        const auto strings(sattr.getNearestSample(0.f));
        if (strings.size() != 1) o << '[';
        for (size_t i = 0; i < strings.size(); ++i) {
            if (i) o << ", ";
            if (i >= 4 && strings.size() > 8) { o << "..."; break; }
            printstring(o, strings[i]);
        }
        if (strings.size() != 1) o << ']';
        return;
    }

    if (printnumeric<metagraph::IntAttribute>(o, attribute)
            || printnumeric<metagraph::FloatAttribute>(o, attribute)
            || printnumeric<metagraph::DoubleAttribute>(o, attribute)) {
        return;
    }

    if (metagraph::NullAttribute(attribute).isValid()) {
        o << "null";
        return;
    }

    o << attribute.getXML();
}

std::string
toString(const metagraph::Attribute& attribute)
{
    std::ostringstream buf;
    print(buf, attribute);

    std::string result = buf.str();
    for (char& c : result) {
        if (c == '\n') c = ' ';
    }
    return result;
}

}

std::ostream& operator<<(std::ostream& o, const metagraph::Attribute& attribute) {
    metagraph::print(o, attribute);
    return o;
}

