#include <pdfscrub/JSON.hh>

#include <pdfscrub/Pl_String.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <stdexcept>

namespace
{
    // Deeper documents are refused rather than risk running out of stack.
    size_t constexpr max_depth = 500;

    std::string
    quote(std::string const& utf8)
    {
        static char const* hexchars = "0123456789abcdef";
        std::string result{"\""};
        for (char c: utf8) {
            auto ch = static_cast<unsigned char>(c);
            switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (ch < 0x20) {
                    result += "\\u00";
                    result += hexchars[ch >> 4];
                    result += hexchars[ch & 0xf];
                } else {
                    result += c;
                }
            }
        }
        result += '"';
        return result;
    }

    void
    newline(Pipeline& p, size_t depth)
    {
        p << "\n" << std::string(2 * depth, ' ');
    }

    // Recursive descent over a complete document held in memory.
    class Reader
    {
      public:
        Reader(std::string const& text) :
            text(text)
        {
        }

        JSON
        readDocument()
        {
            auto result = readValue(0);
            skipSpace();
            if (pos != text.size()) {
                error("unexpected data after the end of the document");
            }
            return result;
        }

      private:
        [[noreturn]] void
        error(std::string const& msg) const
        {
            throw std::runtime_error("JSON: offset " + std::to_string(pos) + ": " + msg);
        }

        void
        skipSpace()
        {
            while (pos < text.size() &&
                   (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\n' ||
                    text[pos] == '\r')) {
                ++pos;
            }
        }

        char
        peek()
        {
            if (pos >= text.size()) {
                throw std::runtime_error("JSON: premature end of input");
            }
            return text[pos];
        }

        char
        next()
        {
            auto c = peek();
            ++pos;
            return c;
        }

        bool
        isDigit()
        {
            return pos < text.size() && text[pos] >= '0' && text[pos] <= '9';
        }

        JSON
        readValue(size_t depth)
        {
            if (depth >= max_depth) {
                error("too many levels of nesting");
            }
            skipSpace();
            switch (peek()) {
            case '{':
                return readDictionary(depth);
            case '[':
                return readArray(depth);
            case '"':
                return JSON::makeString(readString());
            case 't':
                readWord("true");
                return JSON::makeBool(true);
            case 'f':
                readWord("false");
                return JSON::makeBool(false);
            case 'n':
                readWord("null");
                return JSON::makeNull();
            default:
                return readNumber();
            }
        }

        JSON
        readDictionary(size_t depth)
        {
            ++pos;
            auto result = JSON::makeDictionary();
            skipSpace();
            if (peek() == '}') {
                ++pos;
                return result;
            }
            while (true) {
                skipSpace();
                if (peek() != '"') {
                    error("expected a dictionary key");
                }
                auto key = readString();
                skipSpace();
                if (next() != ':') {
                    --pos;
                    error("expected ':'");
                }
                result.addDictionaryMember(key, readValue(depth + 1));
                skipSpace();
                auto c = next();
                if (c == '}') {
                    return result;
                } else if (c != ',') {
                    --pos;
                    error("expected ',' or '}'");
                }
            }
        }

        JSON
        readArray(size_t depth)
        {
            ++pos;
            auto result = JSON::makeArray();
            skipSpace();
            if (peek() == ']') {
                ++pos;
                return result;
            }
            while (true) {
                result.addArrayElement(readValue(depth + 1));
                skipSpace();
                auto c = next();
                if (c == ']') {
                    return result;
                } else if (c != ',') {
                    --pos;
                    error("expected ',' or ']'");
                }
            }
        }

        void
        readWord(std::string const& word)
        {
            if (text.compare(pos, word.size(), word) != 0) {
                error("unknown literal; expected " + word);
            }
            pos += word.size();
        }

        // -?(0|[1-9][0-9]*)(.[0-9]+)?([eE][+-]?[0-9]+)?
        JSON
        readNumber()
        {
            auto start = pos;
            if (peek() == '-') {
                ++pos;
            }
            if (!isDigit()) {
                error("unexpected character");
            }
            if (text[pos++] != '0') {
                while (isDigit()) {
                    ++pos;
                }
            }
            if (pos < text.size() && text[pos] == '.') {
                ++pos;
                if (!isDigit()) {
                    error("a decimal point must be followed by a digit");
                }
                while (isDigit()) {
                    ++pos;
                }
            }
            if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
                ++pos;
                if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
                    ++pos;
                }
                if (!isDigit()) {
                    error("an exponent must have digits");
                }
                while (isDigit()) {
                    ++pos;
                }
            }
            return JSON::makeNumber(text.substr(start, pos - start));
        }

        unsigned long
        readHex4()
        {
            unsigned long result = 0;
            for (int i = 0; i < 4; ++i) {
                auto c = next();
                result <<= 4;
                if (c >= '0' && c <= '9') {
                    result += static_cast<unsigned long>(c - '0');
                } else if (c >= 'a' && c <= 'f') {
                    result += static_cast<unsigned long>(c - 'a' + 10);
                } else if (c >= 'A' && c <= 'F') {
                    result += static_cast<unsigned long>(c - 'A' + 10);
                } else {
                    --pos;
                    error("\\u must be followed by four hexadecimal digits");
                }
            }
            return result;
        }

        std::string
        readString()
        {
            ++pos;
            std::string result;
            while (true) {
                auto c = next();
                if (c == '"') {
                    return result;
                } else if (static_cast<unsigned char>(c) < 0x20) {
                    --pos;
                    error("control character in string");
                } else if (c != '\\') {
                    result += c;
                    continue;
                }
                switch (c = next()) {
                case '"':
                case '\\':
                case '/':
                    result += c;
                    break;
                case 'b':
                    result += '\b';
                    break;
                case 'f':
                    result += '\f';
                    break;
                case 'n':
                    result += '\n';
                    break;
                case 'r':
                    result += '\r';
                    break;
                case 't':
                    result += '\t';
                    break;
                case 'u':
                    result += ScrubUtil::toUTF8(readCodepoint());
                    break;
                default:
                    --pos;
                    error("invalid escape in string");
                }
            }
        }

        // Called after "\u". Surrogate pairs are combined.
        unsigned long
        readCodepoint()
        {
            auto cp = readHex4();
            if (cp >= 0xdc00 && cp <= 0xdfff) {
                error("unpaired low surrogate");
            }
            if (cp < 0xd800 || cp > 0xdbff) {
                return cp;
            }
            if (text.compare(pos, 2, "\\u") != 0) {
                error("unpaired high surrogate");
            }
            pos += 2;
            auto low = readHex4();
            if (low < 0xdc00 || low > 0xdfff) {
                error("unpaired high surrogate");
            }
            return 0x10000 + ((cp - 0xd800) << 10) + (low - 0xdc00);
        }

        std::string const& text;
        size_t pos{0};
    };
} // namespace

JSON::JSON(std::shared_ptr<Value> value) :
    m(std::move(value))
{
}

JSON::Value*
JSON::as(value_type_e type) const
{
    return m && m->type == type ? m.get() : nullptr;
}

void
JSON::writeValue(Pipeline& p, size_t depth, bool compact) const
{
    if (!m) {
        p << "null";
        return;
    }
    switch (m->type) {
    case vt_dictionary:
        {
            p << "{";
            bool first = true;
            for (auto const& [key, value]: m->members) {
                if (!first) {
                    p << ",";
                }
                first = false;
                if (!compact) {
                    newline(p, depth + 1);
                }
                p << quote(key) << (compact ? ":" : ": ");
                value.writeValue(p, depth + 1, compact);
            }
            if (!compact && !first) {
                newline(p, depth);
            }
            p << "}";
        }
        break;
    case vt_array:
        p << "[";
        for (size_t i = 0; i < m->elements.size(); ++i) {
            if (i) {
                p << ",";
            }
            if (!compact) {
                newline(p, depth + 1);
            }
            m->elements[i].writeValue(p, depth + 1, compact);
        }
        if (!compact && !m->elements.empty()) {
            newline(p, depth);
        }
        p << "]";
        break;
    case vt_string:
        p << quote(m->text);
        break;
    case vt_number:
        p << m->text;
        break;
    case vt_bool:
        p << (m->flag ? "true" : "false");
        break;
    case vt_null:
        p << "null";
        break;
    }
}

void
JSON::write(Pipeline* p) const
{
    writeValue(*p, 0, false);
}

void
JSON::writeCompact(Pipeline* p) const
{
    writeValue(*p, 0, true);
}

std::string
JSON::unparse() const
{
    std::string s;
    Pl_String p("unparse", nullptr, s);
    write(&p);
    return s;
}

std::string
JSON::unparseCompact() const
{
    std::string s;
    Pl_String p("unparse", nullptr, s);
    writeCompact(&p);
    return s;
}

JSON
JSON::makeDictionary()
{
    return {std::make_shared<Value>(vt_dictionary)};
}

JSON
JSON::addDictionaryMember(std::string const& key, JSON const& val)
{
    auto dict = as(vt_dictionary);
    if (!dict) {
        throw std::runtime_error("JSON::addDictionaryMember called on non-dictionary");
    }
    return dict->members[key] = val.m ? val : makeNull();
}

JSON
JSON::makeArray()
{
    return {std::make_shared<Value>(vt_array)};
}

JSON
JSON::addArrayElement(JSON const& val)
{
    auto arr = as(vt_array);
    if (!arr) {
        throw std::runtime_error("JSON::addArrayElement called on non-array");
    }
    arr->elements.push_back(val.m ? val : makeNull());
    return arr->elements.back();
}

JSON
JSON::makeString(std::string const& utf8)
{
    auto v = std::make_shared<Value>(vt_string);
    v->text = utf8;
    return {v};
}

JSON
JSON::makeInt(long long int value)
{
    return makeNumber(std::to_string(value));
}

JSON
JSON::makeReal(double value)
{
    return makeNumber(ScrubUtil::double_to_string(value, 6));
}

JSON
JSON::makeNumber(std::string const& encoded)
{
    auto v = std::make_shared<Value>(vt_number);
    v->text = encoded;
    return {v};
}

JSON
JSON::makeBool(bool value)
{
    auto v = std::make_shared<Value>(vt_bool);
    v->flag = value;
    return {v};
}

JSON
JSON::makeNull()
{
    return {std::make_shared<Value>(vt_null)};
}

bool
JSON::isArray() const
{
    return as(vt_array);
}

bool
JSON::isDictionary() const
{
    return as(vt_dictionary);
}

bool
JSON::isNull() const
{
    return as(vt_null);
}

bool
JSON::getString(std::string& utf8) const
{
    if (auto v = as(vt_string)) {
        utf8 = v->text;
        return true;
    }
    return false;
}

bool
JSON::getNumber(std::string& encoded) const
{
    if (auto v = as(vt_number)) {
        encoded = v->text;
        return true;
    }
    return false;
}

bool
JSON::getBool(bool& value) const
{
    if (auto v = as(vt_bool)) {
        value = v->flag;
        return true;
    }
    return false;
}

JSON
JSON::getDictItem(std::string const& key) const
{
    if (auto dict = as(vt_dictionary)) {
        if (auto it = dict->members.find(key); it != dict->members.end()) {
            return it->second;
        }
    }
    return makeNull();
}

bool
JSON::forEachDictItem(std::function<void(std::string const& key, JSON value)> fn) const
{
    auto dict = as(vt_dictionary);
    if (!dict) {
        return false;
    }
    for (auto const& [key, value]: dict->members) {
        fn(key, value);
    }
    return true;
}

bool
JSON::forEachArrayItem(std::function<void(JSON value)> fn) const
{
    auto arr = as(vt_array);
    if (!arr) {
        return false;
    }
    for (auto const& element: arr->elements) {
        fn(element);
    }
    return true;
}

bool
JSON::checkSchema(JSON schema, std::list<std::string>& errors)
{
    return checkSchema(schema, f_none, errors);
}

bool
JSON::checkSchema(JSON schema, unsigned long flags, std::list<std::string>& errors)
{
    if (!m) {
        return false;
    }
    auto before = errors.size();
    checkSchemaInternal(schema, flags, errors, "");
    return errors.size() == before;
}

bool
JSON::checkSchemaInternal(
    JSON const& schema,
    unsigned long flags,
    std::list<std::string>& errors,
    std::string const& prefix) const
{
    auto where = prefix.empty() ? std::string("top-level object") : "json key \"" + prefix + "\"";

    if (auto sch_dict = schema.as(vt_dictionary)) {
        auto dict = as(vt_dictionary);
        if (!dict) {
            errors.emplace_back(where + " is supposed to be a dictionary");
            return false;
        }
        auto const& expected = sch_dict->members;
        auto pattern = expected.size() == 1 ? expected.begin()->first : std::string();
        if (pattern.size() > 2 && pattern.front() == '<' && pattern.back() == '>') {
            for (auto const& [key, value]: dict->members) {
                value.checkSchemaInternal(
                    expected.begin()->second, flags, errors, prefix + "." + key);
            }
            return true;
        }
        for (auto const& [key, sch_value]: expected) {
            if (auto it = dict->members.find(key); it != dict->members.end()) {
                it->second.checkSchemaInternal(sch_value, flags, errors, prefix + "." + key);
            } else if (!(flags & f_optional)) {
                errors.emplace_back(
                    where + ": key \"" + key + "\" is present in schema but missing in object");
            }
        }
        for (auto const& item: dict->members) {
            if (!expected.contains(item.first)) {
                errors.emplace_back(
                    where + ": key \"" + item.first +
                    "\" is not present in schema but appears in object");
            }
        }
    } else if (auto sch_arr = schema.as(vt_array)) {
        auto const& expected = sch_arr->elements;
        auto arr = as(vt_array);
        if (expected.size() == 1 && !arr) {
            // A single value stands for a one-element array.
            return checkSchemaInternal(expected.front(), flags, errors, prefix);
        }
        if (!arr || (expected.size() != 1 && arr->elements.size() != expected.size())) {
            errors.emplace_back(
                where + " is supposed to be an array of length " +
                std::to_string(expected.size()));
            return false;
        }
        for (size_t i = 0; i < arr->elements.size(); ++i) {
            arr->elements[i].checkSchemaInternal(
                expected.size() == 1 ? expected.front() : expected[i],
                flags,
                errors,
                prefix + "." + std::to_string(i));
        }
    } else if (auto sch_str = schema.as(vt_string)) {
        auto const& want = sch_str->text;
        if (want == "(string)" && !as(vt_string)) {
            errors.emplace_back(where + " is supposed to be a string");
        } else if (want == "(number)" && !as(vt_number)) {
            errors.emplace_back(where + " is supposed to be a number");
        } else if (want == "(boolean)" && !as(vt_bool)) {
            errors.emplace_back(where + " is supposed to be a boolean");
        }
    } else {
        errors.emplace_back(where + " schema value is not dictionary, array, or string");
        return false;
    }
    return true;
}

JSON
JSON::parse(std::string const& text)
{
    return Reader(text).readDocument();
}
