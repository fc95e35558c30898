// Copyright (c) 2026 pdfscrub authors
//
// This file is part of pdfscrub.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#ifndef SCRUBOBJECT_HH
#define SCRUBOBJECT_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubObjGen.hh>
#include <pdfscrub/Types.h>

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

class ScrubValue;

// ScrubObject is a handle to a direct PDF object: null, boolean, integer, real, string, name, array,
// dictionary, or an indirect reference. Copying a handle does not copy the object; all copies refer
// to the same underlying value, and changes made through one are visible through the others. Use
// shallowCopy() to get an independent top-level copy.
//
// Indirect objects are not ScrubObjects themselves. They live in a ScrubObjectGraph, which maps
// each key to a ScrubObject body (and, for streams, a ScrubStream). A reference never owns its
// target. It is resolved by looking it up in the graph, so reference cycles between objects are
// harmless.
//
// A default-constructed ScrubObject is uninitialized and behaves as null for all accessors.
class ScrubObject
{
  public:
    PDFSCRUB_DLL
    ScrubObject() = default;

    PDFSCRUB_DLL
    static ScrubObject newNull();
    PDFSCRUB_DLL
    static ScrubObject newBool(bool value);
    PDFSCRUB_DLL
    static ScrubObject newInteger(long long value);
    // The real value is kept in its encoded form so that it is written back exactly as read.
    PDFSCRUB_DLL
    static ScrubObject newReal(std::string const& value);
    PDFSCRUB_DLL
    static ScrubObject newReal(double value, int decimal_places = 0);
    // Binary string. Strings are not required to be valid text.
    PDFSCRUB_DLL
    static ScrubObject newString(std::string const& str);
    // Name, including the leading slash, with any #xx escapes already decoded.
    PDFSCRUB_DLL
    static ScrubObject newName(std::string const& name);
    PDFSCRUB_DLL
    static ScrubObject newArray(std::vector<ScrubObject> const& items = {});
    PDFSCRUB_DLL
    static ScrubObject newDictionary(std::map<std::string, ScrubObject> const& items = {});
    PDFSCRUB_DLL
    static ScrubObject newReference(ScrubObjGen og);
    // Convenience for rectangles and matrices
    PDFSCRUB_DLL
    static ScrubObject newNumberArray(std::vector<double> const& values);

    PDFSCRUB_DLL
    bool isInitialized() const;
    PDFSCRUB_DLL
    scrub_object_type_e getTypeCode() const;
    PDFSCRUB_DLL
    char const* getTypeName() const;

    PDFSCRUB_DLL
    bool isNull() const;
    PDFSCRUB_DLL
    bool isBool() const;
    PDFSCRUB_DLL
    bool isInteger() const;
    PDFSCRUB_DLL
    bool isReal() const;
    // True for integers and reals
    PDFSCRUB_DLL
    bool isNumber() const;
    PDFSCRUB_DLL
    bool isString() const;
    PDFSCRUB_DLL
    bool isName() const;
    PDFSCRUB_DLL
    bool isArray() const;
    PDFSCRUB_DLL
    bool isDictionary() const;
    PDFSCRUB_DLL
    bool isReference() const;
    PDFSCRUB_DLL
    bool isNameAndEquals(std::string const& name) const;
    // True if this is a dictionary whose /Type is the given name and, if subtype is not empty,
    // whose /Subtype is the given name.
    PDFSCRUB_DLL
    bool isDictionaryOfType(std::string const& type, std::string const& subtype = "") const;

    // Accessors for scalars. These return a default value (false, 0, "", empty) when the object is
    // of a different type instead of throwing, because pdfscrub has to read arbitrary damaged
    // input.
    PDFSCRUB_DLL
    bool getBoolValue() const;
    PDFSCRUB_DLL
    long long getIntValue() const;
    PDFSCRUB_DLL
    int getIntValueAsInt() const;
    // Integers and reals as a double
    PDFSCRUB_DLL
    double getNumericValue() const;
    PDFSCRUB_DLL
    std::string getRealValue() const;
    PDFSCRUB_DLL
    std::string getStringValue() const;
    // Interpret a text string: UTF-16BE with a byte order mark, or else a single-byte encoding
    // that is mapped to Unicode code points directly. The result is UTF-8.
    PDFSCRUB_DLL
    std::string getUTF8Value() const;
    PDFSCRUB_DLL
    std::string getName() const;
    PDFSCRUB_DLL
    ScrubObjGen getObjGen() const;

    // Arrays. getArrayItem returns null when n is out of range.
    PDFSCRUB_DLL
    int getArrayNItems() const;
    PDFSCRUB_DLL
    ScrubObject getArrayItem(int n) const;
    PDFSCRUB_DLL
    std::vector<ScrubObject> getArrayAsVector() const;
    PDFSCRUB_DLL
    void setArrayItem(int n, ScrubObject const& item);
    PDFSCRUB_DLL
    void appendItem(ScrubObject const& item);
    PDFSCRUB_DLL
    void eraseItem(int n);
    // Reads an array of four numbers. Returns false if this is not such an array.
    PDFSCRUB_DLL
    bool getArrayAsRectangle(double& llx, double& lly, double& urx, double& ury) const;

    // Dictionaries. getKey returns null when the key is absent. Keys include the leading slash.
    PDFSCRUB_DLL
    bool hasKey(std::string const& key) const;
    PDFSCRUB_DLL
    ScrubObject getKey(std::string const& key) const;
    PDFSCRUB_DLL
    std::set<std::string> getKeys() const;
    PDFSCRUB_DLL
    std::map<std::string, ScrubObject> getDictAsMap() const;
    PDFSCRUB_DLL
    void replaceKey(std::string const& key, ScrubObject const& value);
    PDFSCRUB_DLL
    void removeKey(std::string const& key);

    // Copy the top-level container. Items of an array or dictionary are shared with the original.
    PDFSCRUB_DLL
    ScrubObject shallowCopy() const;
    // Copy the whole direct object tree.
    PDFSCRUB_DLL
    ScrubObject deepCopy() const;

    // Structural equality of the direct object trees. References compare by key.
    PDFSCRUB_DLL
    bool isEqualTo(ScrubObject const& other) const;

    // Add the keys of all references that appear anywhere in this object to `refs`.
    PDFSCRUB_DLL
    void collectReferences(std::set<ScrubObjGen>& refs) const;
    // Call fn for every reference in this object. If fn returns an initialized object, the
    // reference is replaced by it. A reference replaced by null inside a dictionary removes the
    // key. Returns the number of replacements.
    PDFSCRUB_DLL
    int rewriteReferences(std::function<ScrubObject(ScrubObjGen)> fn);
    // Return true if any string or name in this object contains `needle`.
    PDFSCRUB_DLL
    bool containsText(std::string const& needle) const;

    // Serialize in canonical PDF syntax: single spaces between tokens, dictionary keys sorted,
    // names escaped with #xx, strings written as literals when they are printable and as hex
    // strings otherwise.
    PDFSCRUB_DLL
    std::string unparse() const;

    // Write a name or string token in PDF syntax.
    PDFSCRUB_DLL
    static std::string unparseName(std::string const& name);
    PDFSCRUB_DLL
    static std::string unparseString(std::string const& str);

  private:
    ScrubObject(std::shared_ptr<ScrubValue> value) :
        value(std::move(value))
    {
    }

    void unparseInternal(std::string& out) const;

    std::shared_ptr<ScrubValue> value;
};

#endif // SCRUBOBJECT_HH
