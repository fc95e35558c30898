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

#ifndef JSON_HH
#define JSON_HH

// JSON values for the audit report, structured log events, the verification-record store and job
// configuration files. This is not a general purpose JSON library. Dictionary keys are kept sorted
// and numbers are kept in their encoded form, so writing the same value always produces the same
// bytes. Containers can only grow: members are added to dictionaries and elements to arrays.
//
// Strings are UTF-8. Bytes taken from PDF files that are not valid text should be hex-encoded
// before being stored in a JSON string.

#include <pdfscrub/DLL.h>
#include <pdfscrub/Types.h>

#include <functional>
#include <list>
#include <map>
#include <memory>
#include <string>
#include <vector>

class Pipeline;

class JSON
{
  public:
    // Pretty form: two spaces of indentation per level, one member or element per line.
    PDFSCRUB_DLL
    std::string unparse() const;
    PDFSCRUB_DLL
    void write(Pipeline*) const;

    // Single line with no insignificant whitespace, for JSON-lines output.
    PDFSCRUB_DLL
    std::string unparseCompact() const;
    PDFSCRUB_DLL
    void writeCompact(Pipeline*) const;

    PDFSCRUB_DLL
    static JSON makeDictionary();
    // Returns the added member. An existing member with the same key is replaced.
    PDFSCRUB_DLL
    JSON addDictionaryMember(std::string const& key, JSON const&);
    PDFSCRUB_DLL
    static JSON makeArray();
    PDFSCRUB_DLL
    JSON addArrayElement(JSON const&);
    PDFSCRUB_DLL
    static JSON makeString(std::string const& utf8);
    PDFSCRUB_DLL
    static JSON makeInt(long long int value);
    PDFSCRUB_DLL
    static JSON makeReal(double value);
    PDFSCRUB_DLL
    static JSON makeNumber(std::string const& encoded);
    PDFSCRUB_DLL
    static JSON makeBool(bool value);
    PDFSCRUB_DLL
    static JSON makeNull();

    PDFSCRUB_DLL
    bool isArray() const;
    PDFSCRUB_DLL
    bool isDictionary() const;
    PDFSCRUB_DLL
    bool isNull() const;

    // Each accessor returns false and leaves its argument alone when the value has another type.
    PDFSCRUB_DLL
    bool getString(std::string& utf8) const;
    PDFSCRUB_DLL
    bool getNumber(std::string& encoded) const;
    PDFSCRUB_DLL
    bool getBool(bool& value) const;
    // Null if the key is absent or this is not a dictionary.
    PDFSCRUB_DLL
    JSON getDictItem(std::string const& key) const;
    PDFSCRUB_DLL
    bool forEachDictItem(std::function<void(std::string const& key, JSON value)> fn) const;
    PDFSCRUB_DLL
    bool forEachArrayItem(std::function<void(JSON value)> fn) const;

    // Check this value against a schema, which is itself a JSON value:
    //
    // * A dictionary must be matched by a dictionary. Every schema key must be present unless
    //   f_optional is given. Keys that are not in the schema are always errors.
    // * A dictionary whose only key looks like "<name>" matches a dictionary with any keys. Each
    //   value must match the schema value.
    // * A one-element array matches an array whose elements all match that element, or a single
    //   value that matches it. A longer array matches an array of the same length element by
    //   element.
    // * A string matches anything, except that "(string)", "(number)" and "(boolean)" require a
    //   value of that type.
    //
    // Errors are appended to `errors`. The result is true when there were none.
    enum check_flags_e {
        f_none = 0,
        f_optional = 1 << 0,
    };
    PDFSCRUB_DLL
    bool checkSchema(JSON schema, unsigned long flags, std::list<std::string>& errors);
    PDFSCRUB_DLL
    bool checkSchema(JSON schema, std::list<std::string>& errors);

    // Throws std::runtime_error naming the offset of the first syntax error.
    PDFSCRUB_DLL
    static JSON parse(std::string const&);

    JSON() = default;

  private:
    enum value_type_e {
        vt_dictionary,
        vt_array,
        vt_string,
        vt_number,
        vt_bool,
        vt_null,
    };

    struct Value
    {
        Value(value_type_e type) :
            type(type)
        {
        }

        value_type_e const type;
        // The UTF-8 text of a string, or the encoded form of a number.
        std::string text;
        bool flag{false};
        std::map<std::string, JSON> members;
        std::vector<JSON> elements;
    };

    JSON(std::shared_ptr<Value>);

    Value* as(value_type_e) const;
    void writeValue(Pipeline&, size_t depth, bool compact) const;
    bool checkSchemaInternal(
        JSON const& schema,
        unsigned long flags,
        std::list<std::string>& errors,
        std::string const& prefix) const;

    std::shared_ptr<Value> m;
};

#endif // JSON_HH
