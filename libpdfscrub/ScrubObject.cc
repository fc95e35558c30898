#include <pdfscrub/ScrubObject.hh>

#include <pdfscrub/ScrubUtil.hh>
#include <pdfscrub/ScrubValue_private.hh>
#include <pdfscrub/Util.hh>

#include <array>
#include <climits>
#include <cstdlib>
#include <stdexcept>

using namespace pdfscrub;

ScrubObject
ScrubObject::newNull()
{
    return {std::make_shared<ScrubValue>(Scrub_Null())};
}

ScrubObject
ScrubObject::newBool(bool value)
{
    return {std::make_shared<ScrubValue>(Scrub_Bool{value})};
}

ScrubObject
ScrubObject::newInteger(long long value)
{
    return {std::make_shared<ScrubValue>(Scrub_Integer{value})};
}

ScrubObject
ScrubObject::newReal(std::string const& value)
{
    return {std::make_shared<ScrubValue>(Scrub_Real{value})};
}

ScrubObject
ScrubObject::newReal(double value, int decimal_places)
{
    return newReal(ScrubUtil::double_to_string(value, decimal_places));
}

ScrubObject
ScrubObject::newString(std::string const& str)
{
    return {std::make_shared<ScrubValue>(Scrub_String{str})};
}

ScrubObject
ScrubObject::newName(std::string const& name)
{
    return {std::make_shared<ScrubValue>(Scrub_Name{name})};
}

ScrubObject
ScrubObject::newArray(std::vector<ScrubObject> const& items)
{
    return {std::make_shared<ScrubValue>(Scrub_Array{items})};
}

ScrubObject
ScrubObject::newDictionary(std::map<std::string, ScrubObject> const& items)
{
    return {std::make_shared<ScrubValue>(Scrub_Dictionary{items})};
}

ScrubObject
ScrubObject::newReference(ScrubObjGen og)
{
    return {std::make_shared<ScrubValue>(Scrub_Reference{og})};
}

ScrubObject
ScrubObject::newNumberArray(std::vector<double> const& values)
{
    auto result = newArray();
    for (auto v: values) {
        if (v == static_cast<double>(static_cast<long long>(v))) {
            result.appendItem(newInteger(static_cast<long long>(v)));
        } else {
            result.appendItem(newReal(v));
        }
    }
    return result;
}

bool
ScrubObject::isInitialized() const
{
    return value != nullptr;
}

scrub_object_type_e
ScrubObject::getTypeCode() const
{
    return value ? value->getTypeCode() : ::ot_null;
}

char const*
ScrubObject::getTypeName() const
{
    static constexpr std::array<char const*, 9> tn{
        "null", "boolean", "integer", "real", "string", "name", "array", "dictionary", "reference"};
    return tn[getTypeCode()];
}

bool
ScrubObject::isNull() const
{
    return getTypeCode() == ::ot_null;
}

bool
ScrubObject::isBool() const
{
    return getTypeCode() == ::ot_boolean;
}

bool
ScrubObject::isInteger() const
{
    return getTypeCode() == ::ot_integer;
}

bool
ScrubObject::isReal() const
{
    return getTypeCode() == ::ot_real;
}

bool
ScrubObject::isNumber() const
{
    return isInteger() || isReal();
}

bool
ScrubObject::isString() const
{
    return getTypeCode() == ::ot_string;
}

bool
ScrubObject::isName() const
{
    return getTypeCode() == ::ot_name;
}

bool
ScrubObject::isArray() const
{
    return getTypeCode() == ::ot_array;
}

bool
ScrubObject::isDictionary() const
{
    return getTypeCode() == ::ot_dictionary;
}

bool
ScrubObject::isReference() const
{
    return getTypeCode() == ::ot_reference;
}

bool
ScrubObject::isNameAndEquals(std::string const& name) const
{
    auto n = value ? value->as<Scrub_Name>() : nullptr;
    return n && n->name == name;
}

bool
ScrubObject::isDictionaryOfType(std::string const& type, std::string const& subtype) const
{
    return isDictionary() && getKey("/Type").isNameAndEquals(type) &&
        (subtype.empty() || getKey("/Subtype").isNameAndEquals(subtype));
}

bool
ScrubObject::getBoolValue() const
{
    auto b = value ? value->as<Scrub_Bool>() : nullptr;
    return b && b->val;
}

long long
ScrubObject::getIntValue() const
{
    auto i = value ? value->as<Scrub_Integer>() : nullptr;
    return i ? i->val : 0;
}

int
ScrubObject::getIntValueAsInt() const
{
    auto v = getIntValue();
    if (v < INT_MIN) {
        return INT_MIN;
    } else if (v > INT_MAX) {
        return INT_MAX;
    }
    return static_cast<int>(v);
}

double
ScrubObject::getNumericValue() const
{
    if (isInteger()) {
        return static_cast<double>(getIntValue());
    } else if (auto r = value ? value->as<Scrub_Real>() : nullptr) {
        return atof(r->val.c_str());
    }
    return 0.0;
}

std::string
ScrubObject::getRealValue() const
{
    auto r = value ? value->as<Scrub_Real>() : nullptr;
    return r ? r->val : std::string();
}

std::string
ScrubObject::getStringValue() const
{
    auto s = value ? value->as<Scrub_String>() : nullptr;
    return s ? s->val : std::string();
}

std::string
ScrubObject::getUTF8Value() const
{
    auto s = getStringValue();
    if (s.size() >= 2 && s.at(0) == '\xfe' && s.at(1) == '\xff') {
        std::string result;
        unsigned long high = 0;
        for (size_t i = 2; i + 1 < s.size(); i += 2) {
            unsigned long cp = (static_cast<unsigned long>(static_cast<unsigned char>(s.at(i))) << 8) +
                static_cast<unsigned char>(s.at(i + 1));
            if ((cp & 0xFC00) == 0xD800) {
                high = cp;
                continue;
            } else if ((cp & 0xFC00) == 0xDC00) {
                if (high == 0) {
                    cp = 0xfffd;
                } else {
                    cp = 0x10000U + ((high & 0x3FFU) << 10U) + (cp & 0x3FF);
                }
            } else if (high) {
                result += ScrubUtil::toUTF8(0xfffd);
            }
            high = 0;
            result += ScrubUtil::toUTF8(cp);
        }
        return result;
    }
    if (s.size() >= 3 && s.compare(0, 3, "\xef\xbb\xbf") == 0) {
        return s.substr(3);
    }
    std::string result;
    for (auto ch: s) {
        result += ScrubUtil::toUTF8(static_cast<unsigned char>(ch));
    }
    return result;
}

std::string
ScrubObject::getName() const
{
    auto n = value ? value->as<Scrub_Name>() : nullptr;
    return n ? n->name : std::string();
}

ScrubObjGen
ScrubObject::getObjGen() const
{
    auto r = value ? value->as<Scrub_Reference>() : nullptr;
    return r ? r->og : ScrubObjGen();
}

int
ScrubObject::getArrayNItems() const
{
    auto a = value ? value->as<Scrub_Array>() : nullptr;
    return a ? static_cast<int>(a->elements.size()) : 0;
}

ScrubObject
ScrubObject::getArrayItem(int n) const
{
    auto a = value ? value->as<Scrub_Array>() : nullptr;
    if (a && n >= 0 && static_cast<size_t>(n) < a->elements.size()) {
        return a->elements.at(static_cast<size_t>(n));
    }
    return newNull();
}

std::vector<ScrubObject>
ScrubObject::getArrayAsVector() const
{
    auto a = value ? value->as<Scrub_Array>() : nullptr;
    return a ? a->elements : std::vector<ScrubObject>();
}

void
ScrubObject::setArrayItem(int n, ScrubObject const& item)
{
    auto a = value ? value->as<Scrub_Array>() : nullptr;
    if (!a) {
        throw std::logic_error("ScrubObject::setArrayItem called on a non-array");
    }
    if (n < 0 || static_cast<size_t>(n) >= a->elements.size()) {
        throw std::logic_error("ScrubObject::setArrayItem: index out of range");
    }
    a->elements.at(static_cast<size_t>(n)) = item.isInitialized() ? item : newNull();
}

void
ScrubObject::appendItem(ScrubObject const& item)
{
    auto a = value ? value->as<Scrub_Array>() : nullptr;
    if (!a) {
        throw std::logic_error("ScrubObject::appendItem called on a non-array");
    }
    a->elements.push_back(item.isInitialized() ? item : newNull());
}

void
ScrubObject::eraseItem(int n)
{
    auto a = value ? value->as<Scrub_Array>() : nullptr;
    if (!a) {
        throw std::logic_error("ScrubObject::eraseItem called on a non-array");
    }
    if (n < 0 || static_cast<size_t>(n) >= a->elements.size()) {
        throw std::logic_error("ScrubObject::eraseItem: index out of range");
    }
    a->elements.erase(a->elements.begin() + n);
}

bool
ScrubObject::getArrayAsRectangle(double& llx, double& lly, double& urx, double& ury) const
{
    if (getArrayNItems() != 4) {
        return false;
    }
    for (int i = 0; i < 4; ++i) {
        if (!getArrayItem(i).isNumber()) {
            return false;
        }
    }
    llx = getArrayItem(0).getNumericValue();
    lly = getArrayItem(1).getNumericValue();
    urx = getArrayItem(2).getNumericValue();
    ury = getArrayItem(3).getNumericValue();
    return true;
}

bool
ScrubObject::hasKey(std::string const& key) const
{
    auto d = value ? value->as<Scrub_Dictionary>() : nullptr;
    return d && d->items.contains(key);
}

ScrubObject
ScrubObject::getKey(std::string const& key) const
{
    auto d = value ? value->as<Scrub_Dictionary>() : nullptr;
    if (d) {
        if (auto it = d->items.find(key); it != d->items.end()) {
            return it->second;
        }
    }
    return newNull();
}

std::set<std::string>
ScrubObject::getKeys() const
{
    std::set<std::string> result;
    if (auto d = value ? value->as<Scrub_Dictionary>() : nullptr) {
        for (auto const& iter: d->items) {
            result.insert(iter.first);
        }
    }
    return result;
}

std::map<std::string, ScrubObject>
ScrubObject::getDictAsMap() const
{
    auto d = value ? value->as<Scrub_Dictionary>() : nullptr;
    return d ? d->items : std::map<std::string, ScrubObject>();
}

void
ScrubObject::replaceKey(std::string const& key, ScrubObject const& val)
{
    auto d = value ? value->as<Scrub_Dictionary>() : nullptr;
    if (!d) {
        throw std::logic_error("ScrubObject::replaceKey called on a non-dictionary");
    }
    d->items[key] = val.isInitialized() ? val : newNull();
}

void
ScrubObject::removeKey(std::string const& key)
{
    auto d = value ? value->as<Scrub_Dictionary>() : nullptr;
    if (!d) {
        throw std::logic_error("ScrubObject::removeKey called on a non-dictionary");
    }
    d->items.erase(key);
}

ScrubObject
ScrubObject::shallowCopy() const
{
    if (!value) {
        return newNull();
    }
    return {std::make_shared<ScrubValue>(value->value)};
}

ScrubObject
ScrubObject::deepCopy() const
{
    auto result = shallowCopy();
    if (auto a = result.value->as<Scrub_Array>()) {
        for (auto& item: a->elements) {
            item = item.deepCopy();
        }
    } else if (auto d = result.value->as<Scrub_Dictionary>()) {
        for (auto& iter: d->items) {
            iter.second = iter.second.deepCopy();
        }
    }
    return result;
}

bool
ScrubObject::isEqualTo(ScrubObject const& other) const
{
    auto tc = getTypeCode();
    if (tc != other.getTypeCode()) {
        return false;
    }
    switch (tc) {
    case ::ot_null:
        return true;
    case ::ot_boolean:
        return getBoolValue() == other.getBoolValue();
    case ::ot_integer:
        return getIntValue() == other.getIntValue();
    case ::ot_real:
        return getRealValue() == other.getRealValue();
    case ::ot_string:
        return getStringValue() == other.getStringValue();
    case ::ot_name:
        return getName() == other.getName();
    case ::ot_reference:
        return getObjGen() == other.getObjGen();
    case ::ot_array:
        {
            auto n = getArrayNItems();
            if (n != other.getArrayNItems()) {
                return false;
            }
            for (int i = 0; i < n; ++i) {
                if (!getArrayItem(i).isEqualTo(other.getArrayItem(i))) {
                    return false;
                }
            }
            return true;
        }
    case ::ot_dictionary:
        {
            auto const& mine = value->as<Scrub_Dictionary>()->items;
            auto const& theirs = other.value->as<Scrub_Dictionary>()->items;
            if (mine.size() != theirs.size()) {
                return false;
            }
            for (auto const& [key, val]: mine) {
                auto it = theirs.find(key);
                if (it == theirs.end() || !val.isEqualTo(it->second)) {
                    return false;
                }
            }
            return true;
        }
    }
    return false;
}

void
ScrubObject::collectReferences(std::set<ScrubObjGen>& refs) const
{
    if (!value) {
        return;
    }
    if (auto r = value->as<Scrub_Reference>()) {
        refs.insert(r->og);
    } else if (auto a = value->as<Scrub_Array>()) {
        for (auto const& item: a->elements) {
            item.collectReferences(refs);
        }
    } else if (auto d = value->as<Scrub_Dictionary>()) {
        for (auto const& iter: d->items) {
            iter.second.collectReferences(refs);
        }
    }
}

int
ScrubObject::rewriteReferences(std::function<ScrubObject(ScrubObjGen)> fn)
{
    int count = 0;
    if (!value) {
        return count;
    }
    if (auto a = value->as<Scrub_Array>()) {
        for (auto& item: a->elements) {
            if (item.isReference()) {
                auto replacement = fn(item.getObjGen());
                if (replacement.isInitialized()) {
                    item = replacement;
                    ++count;
                }
            } else {
                count += item.rewriteReferences(fn);
            }
        }
    } else if (auto d = value->as<Scrub_Dictionary>()) {
        for (auto iter = d->items.begin(); iter != d->items.end();) {
            auto& item = iter->second;
            if (item.isReference()) {
                auto replacement = fn(item.getObjGen());
                if (replacement.isInitialized()) {
                    ++count;
                    if (replacement.isNull()) {
                        iter = d->items.erase(iter);
                        continue;
                    }
                    item = replacement;
                }
            } else {
                count += item.rewriteReferences(fn);
            }
            ++iter;
        }
    }
    return count;
}

bool
ScrubObject::containsText(std::string const& needle) const
{
    if (!value) {
        return false;
    }
    if (auto s = value->as<Scrub_String>()) {
        return s->val.find(needle) != std::string::npos;
    } else if (auto n = value->as<Scrub_Name>()) {
        return n->name.find(needle) != std::string::npos;
    } else if (auto a = value->as<Scrub_Array>()) {
        for (auto const& item: a->elements) {
            if (item.containsText(needle)) {
                return true;
            }
        }
    } else if (auto d = value->as<Scrub_Dictionary>()) {
        for (auto const& iter: d->items) {
            if (iter.second.containsText(needle)) {
                return true;
            }
        }
    }
    return false;
}

std::string
ScrubObject::unparseName(std::string const& name)
{
    std::string result;
    result.reserve(name.size() + 1);
    result += '/';
    bool first = true;
    for (auto ch: name) {
        if (first) {
            first = false;
            if (ch == '/') {
                continue;
            }
        }
        if (ch < 33 || ch > 126 || util::is_delimiter(ch) || ch == '#') {
            result += util::hex_encode_char(ch);
        } else {
            result += ch;
        }
    }
    return result;
}

std::string
ScrubObject::unparseString(std::string const& str)
{
    bool use_hex = false;
    for (auto ch: str) {
        auto uch = static_cast<unsigned char>(ch);
        if ((uch < 32 || uch > 126) && !(ch == '\n' || ch == '\r' || ch == '\t' || ch == '\b' ||
                                         ch == '\f')) {
            use_hex = true;
            break;
        }
    }
    if (use_hex) {
        return "<" + ScrubUtil::hex_encode(str) + ">";
    }
    std::string result = "(";
    for (auto ch: str) {
        switch (ch) {
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        case '(':
        case ')':
        case '\\':
            result += '\\';
            result += ch;
            break;
        default:
            result += ch;
        }
    }
    result += ")";
    return result;
}

void
ScrubObject::unparseInternal(std::string& out) const
{
    switch (getTypeCode()) {
    case ::ot_null:
        out += "null";
        break;
    case ::ot_boolean:
        out += getBoolValue() ? "true" : "false";
        break;
    case ::ot_integer:
        out += std::to_string(getIntValue());
        break;
    case ::ot_real:
        out += getRealValue();
        break;
    case ::ot_string:
        out += unparseString(getStringValue());
        break;
    case ::ot_name:
        out += unparseName(getName());
        break;
    case ::ot_reference:
        out += getObjGen().unparse(' ') + " R";
        break;
    case ::ot_array:
        {
            out += "[";
            bool first = true;
            for (auto const& item: value->as<Scrub_Array>()->elements) {
                if (!first) {
                    out += " ";
                }
                first = false;
                item.unparseInternal(out);
            }
            out += "]";
        }
        break;
    case ::ot_dictionary:
        {
            out += "<<";
            for (auto const& [key, val]: value->as<Scrub_Dictionary>()->items) {
                out += " ";
                out += unparseName(key);
                out += " ";
                val.unparseInternal(out);
            }
            out += " >>";
        }
        break;
    }
}

std::string
ScrubObject::unparse() const
{
    std::string result;
    unparseInternal(result);
    return result;
}
