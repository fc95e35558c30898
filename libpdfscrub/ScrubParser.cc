#include <pdfscrub/ScrubParser.hh>

#include <pdfscrub/BufferInputSource.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <cstdint>
#include <set>

using namespace std::literals;
using namespace pdfscrub::impl;

ScrubParser::ScrubParser(
    InputSource& input,
    std::string const& description,
    ScrubTokenizer& tokenizer,
    std::vector<ScrubExc>* warnings) :
    input(input),
    description(description),
    tokenizer(tokenizer),
    warnings(warnings)
{
}

ScrubObject
ScrubParser::parse(std::string const& text, std::string const& description)
{
    BufferInputSource input(description, text);
    ScrubTokenizer tokenizer;
    tokenizer.allowEOF();
    bool empty = false;
    auto result = ScrubParser(input, description, tokenizer, nullptr).parse(empty);
    if (empty) {
        throw ScrubExc(scrub_e_damaged_pdf, description, "", 0, "empty object");
    }
    return result;
}

ScrubObject
ScrubParser::parse(bool& empty)
{
    empty = false;
    try {
        return parseFirst(empty);
    } catch (Error&) {
        return ScrubObject::newNull();
    } catch (ScrubExc&) {
        throw;
    } catch (std::logic_error&) {
        throw;
    } catch (std::exception& e) {
        warn("treating object as null because of error during parsing: "s + e.what());
        return ScrubObject::newNull();
    }
}

ScrubObject
ScrubParser::parseFirst(bool& empty)
{
    if (!tokenizer.nextToken(input, description)) {
        warn(tokenizer.getErrorMessage());
    }

    switch (tokenizer.getType()) {
    case ScrubTokenizer::tt_eof:
        warn("unexpected EOF");
        return ScrubObject::newNull();

    case ScrubTokenizer::tt_bad:
        return ScrubObject::newNull();

    case ScrubTokenizer::tt_brace_open:
    case ScrubTokenizer::tt_brace_close:
        warn("treating unexpected brace token as null");
        return ScrubObject::newNull();

    case ScrubTokenizer::tt_array_close:
        warn("treating unexpected array close token as null");
        return ScrubObject::newNull();

    case ScrubTokenizer::tt_dict_close:
        warn("unexpected dictionary close token");
        return ScrubObject::newNull();

    case ScrubTokenizer::tt_array_open:
    case ScrubTokenizer::tt_dict_open:
        stack.clear();
        stack.emplace_back(
            input,
            (tokenizer.getType() == ScrubTokenizer::tt_array_open) ? st_array : st_dictionary_key);
        frame = &stack.back();
        return parseRemainder();

    case ScrubTokenizer::tt_bool:
        return ScrubObject::newBool(tokenizer.getValue() == "true");

    case ScrubTokenizer::tt_null:
        return ScrubObject::newNull();

    case ScrubTokenizer::tt_integer:
        {
            // A top-level "n g R" is possible inside object streams and trailers.
            auto offset = input.tell();
            auto value = ScrubUtil::string_to_ll(tokenizer.getValue().c_str());
            auto t2 = tokenizer.readToken(input, description, true);
            if (t2.isInteger()) {
                auto t3 = tokenizer.readToken(input, description, true);
                if (t3.isWord("R") && value > 0) {
                    return ScrubObject::newReference(ScrubObjGen(
                        static_cast<int>(value),
                        ScrubUtil::string_to_int(t2.getValue().c_str())));
                }
            }
            input.seek(offset, SEEK_SET);
            return ScrubObject::newInteger(value);
        }

    case ScrubTokenizer::tt_real:
        return ScrubObject::newReal(tokenizer.getValue());

    case ScrubTokenizer::tt_name:
        return ScrubObject::newName(tokenizer.getValue());

    case ScrubTokenizer::tt_word:
        {
            auto const& value = tokenizer.getValue();
            if (value == "endobj") {
                // An empty object. Leave the input in front of endobj so the caller sees it.
                empty = true;
                input.seek(input.getLastOffset(), SEEK_SET);
                return ScrubObject::newNull();
            }
            warn("unknown token while reading object; treating as string");
            return ScrubObject::newString(value);
        }

    case ScrubTokenizer::tt_string:
        return ScrubObject::newString(tokenizer.getValue());

    default:
        warn("treating unknown token type as null while reading object");
        return ScrubObject::newNull();
    }
}

ScrubObject
ScrubParser::parseRemainder()
{
    bad_count = 0;

    while (true) {
        if (!tokenizer.nextToken(input, description)) {
            warn(tokenizer.getErrorMessage());
        }
        ++good_count;

        if (int_count != 0) {
            // Treat integer tokens as part of an indirect reference until proven otherwise.
            if (tokenizer.getType() == ScrubTokenizer::tt_integer) {
                if (++int_count > 2) {
                    addInt(int_count);
                }
                int_buffer[int_count % 2] = ScrubUtil::string_to_ll(tokenizer.getValue().c_str());
                continue;
            } else if (int_count >= 2 && tokenizer.getType() == ScrubTokenizer::tt_word &&
                       tokenizer.getValue() == "R") {
                auto id = int_buffer[(int_count - 1) % 2];
                auto gen = int_buffer[int_count % 2];
                if (id < 1 || id > INT32_MAX || gen < 0 || gen >= 65535) {
                    addBadNull(
                        "treating bad indirect reference (" + std::to_string(id) + " " +
                        std::to_string(gen) + " R) as null");
                } else {
                    add(ScrubObject::newReference(
                        ScrubObjGen(static_cast<int>(id), static_cast<int>(gen))));
                }
                int_count = 0;
                continue;
            } else if (int_count > 0) {
                if (int_count > 1) {
                    addInt(int_count - 1);
                }
                addInt(int_count);
                int_count = 0;
            }
        }

        switch (tokenizer.getType()) {
        case ScrubTokenizer::tt_eof:
            warn("parse error while reading object");
            warn("unexpected EOF");
            return ScrubObject::newNull();

        case ScrubTokenizer::tt_bad:
            checkTooManyBadTokens();
            addNull();
            continue;

        case ScrubTokenizer::tt_brace_open:
        case ScrubTokenizer::tt_brace_close:
            addBadNull("treating unexpected brace token as null");
            continue;

        case ScrubTokenizer::tt_array_close:
            if (frame->state == st_array) {
                auto object = ScrubObject::newArray(frame->olist);
                if (stack.size() <= 1) {
                    return object;
                }
                stack.pop_back();
                frame = &stack.back();
                add(object);
            } else {
                addBadNull("treating unexpected array close token as null");
            }
            continue;

        case ScrubTokenizer::tt_dict_close:
            if (frame->state <= st_dictionary_value) {
                if (frame->state == st_dictionary_value) {
                    warn(frame->offset, "dictionary ended prematurely; using null as value for last key");
                    frame->dict[frame->key] = ScrubObject::newNull();
                }
                if (!frame->olist.empty()) {
                    fixMissingKeys();
                }
                auto object = ScrubObject::newDictionary(frame->dict);
                if (stack.size() <= 1) {
                    return object;
                }
                stack.pop_back();
                frame = &stack.back();
                add(object);
            } else {
                addBadNull("unexpected dictionary close token");
            }
            continue;

        case ScrubTokenizer::tt_array_open:
        case ScrubTokenizer::tt_dict_open:
            if (stack.size() > max_nesting) {
                warn("ignoring excessively deeply nested data structure");
                throw Error();
            }
            stack.emplace_back(
                input,
                (tokenizer.getType() == ScrubTokenizer::tt_array_open) ? st_array
                                                                       : st_dictionary_key);
            frame = &stack.back();
            continue;

        case ScrubTokenizer::tt_bool:
            add(ScrubObject::newBool(tokenizer.getValue() == "true"));
            continue;

        case ScrubTokenizer::tt_null:
            addNull();
            continue;

        case ScrubTokenizer::tt_integer:
            int_buffer[1] = ScrubUtil::string_to_ll(tokenizer.getValue().c_str());
            int_count = 1;
            continue;

        case ScrubTokenizer::tt_real:
            add(ScrubObject::newReal(tokenizer.getValue()));
            continue;

        case ScrubTokenizer::tt_name:
            if (frame->state == st_dictionary_key) {
                frame->key = tokenizer.getValue();
                frame->state = st_dictionary_value;
            } else {
                add(ScrubObject::newName(tokenizer.getValue()));
            }
            continue;

        case ScrubTokenizer::tt_word:
            if (tokenizer.getValue() == "endobj" || tokenizer.getValue() == "endstream") {
                warn("unexpected '" + tokenizer.getValue() +
                     "' while reading object; giving up on reading object");
                input.seek(input.getLastOffset(), SEEK_SET);
                throw Error();
            }
            warn("unknown token while reading object; treating as string");
            checkTooManyBadTokens();
            add(ScrubObject::newString(tokenizer.getValue()));
            continue;

        case ScrubTokenizer::tt_string:
            add(ScrubObject::newString(tokenizer.getValue()));
            continue;

        default:
            addBadNull("treating unknown token type as null while reading object");
        }
    }
}

void
ScrubParser::add(ScrubObject obj)
{
    if (frame->state != st_dictionary_value) {
        // A missing key in a dictionary; fixed up when the dictionary closes.
        frame->olist.emplace_back(obj);
    } else {
        if (auto res = frame->dict.insert_or_assign(frame->key, obj); !res.second) {
            warn(
                frame->offset,
                "dictionary has duplicated key " + frame->key +
                    "; last occurrence overrides earlier ones");
        }
        frame->state = st_dictionary_key;
    }
}

void
ScrubParser::addNull()
{
    add(ScrubObject::newNull());
}

void
ScrubParser::addBadNull(std::string const& msg)
{
    warn(msg);
    checkTooManyBadTokens();
    addNull();
}

void
ScrubParser::addInt(int count)
{
    add(ScrubObject::newInteger(int_buffer[count % 2]));
}

void
ScrubParser::fixMissingKeys()
{
    std::set<std::string> names;
    for (auto& obj: frame->olist) {
        if (obj.isName()) {
            names.insert(obj.getName());
        }
    }
    int next_fake_key = 1;
    for (auto const& item: frame->olist) {
        while (true) {
            std::string const key = "/ScrubFake" + std::to_string(next_fake_key++);
            if (!frame->dict.contains(key) && !names.contains(key)) {
                warn(
                    frame->offset,
                    "expected dictionary key but found non-name object; inserting key " + key);
                frame->dict[key] = item;
                break;
            }
        }
    }
}

void
ScrubParser::checkTooManyBadTokens()
{
    if (good_count > 4) {
        good_count = 0;
        bad_count = 1;
        return;
    }
    if (++bad_count > 5) {
        // Give up after 5 errors in close proximity.
        warn("too many errors; giving up on reading object");
        throw Error();
    }
    good_count = 0;
}

void
ScrubParser::warn(scrub_offset_t offset, std::string const& msg)
{
    ScrubExc e(scrub_e_damaged_pdf, input.getName(), description, offset, msg);
    if (!warnings) {
        throw e;
    }
    warnings->emplace_back(e);
}

void
ScrubParser::warn(std::string const& msg)
{
    warn(input.getLastOffset(), msg);
}
