#include <pdfscrub/ScrubTokenizer.hh>

// Character classes come from Util.hh, never from ctype, which depends on the locale.

#include <pdfscrub/BufferInputSource.hh>
#include <pdfscrub/InputSource_private.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubIntC.hh>
#include <pdfscrub/Util.hh>

using namespace pdfscrub;

namespace
{
    bool
    ends_token(char ch)
    {
        return util::is_space(ch) || util::is_delimiter(ch);
    }

    ScrubTokenizer::token_type_e
    classify(std::string const& word)
    {
        if (word == "true" || word == "false") {
            return ScrubTokenizer::tt_bool;
        }
        if (word == "null") {
            return ScrubTokenizer::tt_null;
        }
        size_t i = (word[0] == '+' || word[0] == '-') ? 1 : 0;
        bool digits = false;
        bool point = false;
        for (; i < word.size(); ++i) {
            if (util::is_digit(word[i])) {
                digits = true;
            } else if (word[i] == '.' && !point) {
                point = true;
            } else {
                return ScrubTokenizer::tt_word;
            }
        }
        if (!digits) {
            return ScrubTokenizer::tt_word;
        }
        return point ? ScrubTokenizer::tt_real : ScrubTokenizer::tt_integer;
    }

    // Image data could contain the bytes "EI" by chance. What follows a real EI is ordinary
    // content, so the next few tokens must look like operands and operators. A valid next inline
    // image is at least ten tokens away, because BI needs its width, height, depth and colour space
    // before ID.
    bool
    looks_like_content(std::string const& rest)
    {
        BufferInputSource input("inline image", rest);
        ScrubTokenizer tokenizer;
        tokenizer.allowEOF();
        for (int i = 0; i < 10; ++i) {
            tokenizer.nextToken(input, "inline image");
            auto type = tokenizer.getType();
            if (type == ScrubTokenizer::tt_eof) {
                return true;
            } else if (type == ScrubTokenizer::tt_bad) {
                return false;
            } else if (type == ScrubTokenizer::tt_word) {
                bool alpha = false;
                bool other = false;
                for (char ch: tokenizer.getValue()) {
                    if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '*') {
                        alpha = true;
                    } else if (static_cast<signed char>(ch) < 32) {
                        // Control characters and bytes above 127
                        return false;
                    } else {
                        other = true;
                    }
                }
                if (alpha && other) {
                    return false;
                }
            }
        }
        return true;
    }
} // namespace

ScrubTokenizer::ScrubTokenizer() = default;

void
ScrubTokenizer::allowEOF()
{
    allow_eof = true;
}

void
ScrubTokenizer::includeIgnorable()
{
    include_ignorable = true;
}

ScrubTokenizer::Token
ScrubTokenizer::readToken(
    InputSource& input, std::string const& context, bool allow_bad, size_t max_len)
{
    nextToken(input, context, max_len);
    Token token(type, getValue(), raw_val, error_message);
    if (type == tt_bad && !allow_bad) {
        throw ScrubExc(
            scrub_e_damaged_pdf,
            input.getName(),
            context.empty() ? "offset " + std::to_string(input.getLastOffset()) : context,
            input.getLastOffset(),
            error_message);
    }
    return token;
}

bool
ScrubTokenizer::nextToken(InputSource& input, std::string const&, size_t max_length)
{
    type = tt_bad;
    val.clear();
    raw_val.clear();
    error_message.clear();
    give_back = false;
    too_long = false;
    max_len = max_length;

    if (inline_image) {
        readInlineImage(input);
        return error_message.empty();
    }

    input.fastTell();
    char ch = '\0';
    bool have = input.fastRead(ch);
    if (!include_ignorable) {
        while (have && (util::is_space(ch) || ch == '%')) {
            if (ch == '%') {
                while ((have = input.fastRead(ch)) && ch != '\r' && ch != '\n') {
                }
            } else {
                have = input.fastRead(ch);
            }
        }
    }
    if (!have) {
        input.fastUnread(false);
        if (allow_eof) {
            type = tt_eof;
        } else {
            // The last offset stays at the end of the input.
            error_message = "unexpected EOF";
        }
        return error_message.empty();
    }

    auto start = input.getLastOffset() - 1;
    raw_val += ch;
    switch (ch) {
    case '[':
        type = tt_array_open;
        break;
    case ']':
        type = tt_array_close;
        break;
    case '{':
        type = tt_brace_open;
        break;
    case '}':
        type = tt_brace_close;
        break;
    case ')':
        fail("unexpected )");
        break;
    case '(':
        readLiteralString(input);
        break;
    case '<':
    case '>':
        readAngle(input);
        break;
    case '/':
        readName(input);
        break;
    case '%':
        readComment(input);
        break;
    default:
        if (util::is_space(ch)) {
            readSpace(input);
        } else {
            readWord(input);
        }
    }
    input.fastUnread(give_back);
    input.setLastOffset(start);
    return error_message.empty();
}

// Reads the next byte of the current token. Returns false at the end of the input, or when the
// token has reached max_len, in which case it has been marked bad.
bool
ScrubTokenizer::readChar(InputSource& input, char& ch)
{
    if (max_len && raw_val.size() >= max_len) {
        too_long = true;
        fail("exceeded allowable length while reading token");
        return false;
    }
    if (!input.fastRead(ch)) {
        return false;
    }
    raw_val += ch;
    return true;
}

// The byte just read starts the next token.
void
ScrubTokenizer::unread()
{
    give_back = true;
    raw_val.pop_back();
}

void
ScrubTokenizer::fail(std::string const& message)
{
    type = tt_bad;
    error_message = message;
}

void
ScrubTokenizer::failAtEnd()
{
    if (!too_long) {
        fail("EOF while reading token");
    }
}

void
ScrubTokenizer::readSpace(InputSource& input)
{
    char ch;
    while (readChar(input, ch)) {
        if (!util::is_space(ch)) {
            unread();
            break;
        }
    }
    if (!too_long) {
        type = tt_space;
    }
}

// The end of line is not part of the comment.
void
ScrubTokenizer::readComment(InputSource& input)
{
    char ch;
    while (readChar(input, ch)) {
        if (ch == '\r' || ch == '\n') {
            unread();
            break;
        }
    }
    if (!too_long) {
        type = tt_comment;
    }
}

void
ScrubTokenizer::readLiteralString(InputSource& input)
{
    int depth = 1;
    char ch = '\0';
    // Set when ch was read while looking ahead and has not been handled yet.
    bool pending = false;
    while (true) {
        if (!pending && !readChar(input, ch)) {
            failAtEnd();
            return;
        }
        pending = false;
        if (ch == '\\') {
            if (!readChar(input, ch)) {
                failAtEnd();
                return;
            }
            switch (ch) {
            case 'n':
                val += '\n';
                break;
            case 'r':
                val += '\r';
                break;
            case 't':
                val += '\t';
                break;
            case 'b':
                val += '\b';
                break;
            case 'f':
                val += '\f';
                break;
            case '\n':
                // Line continuation
                break;
            case '\r':
                if (!readChar(input, ch)) {
                    failAtEnd();
                    return;
                }
                pending = ch != '\n';
                break;
            default:
                if (ch >= '0' && ch <= '7') {
                    int code = ch - '0';
                    for (int i = 1; i < 3; ++i) {
                        if (!readChar(input, ch)) {
                            failAtEnd();
                            return;
                        }
                        if (ch < '0' || ch > '7') {
                            pending = true;
                            break;
                        }
                        code = 8 * code + (ch - '0');
                    }
                    val += static_cast<char>(code & 0xff);
                } else {
                    // \( \) \\ and unknown escapes stand for the character itself.
                    val += ch;
                }
            }
        } else if (ch == '\r') {
            // An unescaped end of line is a single newline, however it is written.
            val += '\n';
            if (!readChar(input, ch)) {
                failAtEnd();
                return;
            }
            pending = ch != '\n';
        } else if (ch == ')' && --depth == 0) {
            type = tt_string;
            return;
        } else {
            if (ch == '(') {
                ++depth;
            }
            val += ch;
        }
    }
}

// After < or >: a dictionary delimiter or a hexadecimal string.
void
ScrubTokenizer::readAngle(InputSource& input)
{
    char first = raw_val[0];
    char ch;
    if (!readChar(input, ch)) {
        failAtEnd();
    } else if (ch == first) {
        type = first == '<' ? tt_dict_open : tt_dict_close;
    } else if (first == '>') {
        unread();
        fail("unexpected >");
    } else {
        readHexString(input, ch);
    }
}

void
ScrubTokenizer::readHexString(InputSource& input, char first)
{
    char ch = first;
    int digits = 0;
    char high = 0;
    while (true) {
        if (ch == '>') {
            if (digits % 2) {
                // An odd final digit is followed by an implied 0.
                val += static_cast<char>(high << 4);
            }
            type = tt_string;
            return;
        } else if (util::is_hex_digit(ch)) {
            auto nibble = util::hex_decode_char(ch);
            if (digits++ % 2) {
                val += static_cast<char>((high << 4) | nibble);
            } else {
                high = nibble;
            }
        } else if (!util::is_space(ch)) {
            fail(std::string("invalid character (") + ch + ") in hexstring");
            return;
        }
        if (!readChar(input, ch)) {
            failAtEnd();
            return;
        }
    }
}

// The value is the name with #xx sequences decoded, including the leading slash.
void
ScrubTokenizer::readName(InputSource& input)
{
    val = "/";
    type = tt_name;
    char ch;
    while (readChar(input, ch)) {
        if (ends_token(ch)) {
            unread();
            return;
        }
        if (ch != '#') {
            val += ch;
            continue;
        }
        std::string code;
        while (code.size() < 2) {
            if (!readChar(input, ch)) {
                break;
            }
            if (ends_token(ch)) {
                unread();
                break;
            }
            code += ch;
            if (!util::is_hex_digit(ch)) {
                break;
            }
        }
        if (too_long) {
            return;
        }
        if (code.size() == 2 && util::is_hex_digit(code[0]) && util::is_hex_digit(code[1]) &&
            code != "00") {
            val += static_cast<char>(
                (util::hex_decode_char(code[0]) << 4) | util::hex_decode_char(code[1]));
        } else {
            // Keep the text as written.
            val += '#' + code;
            error_message = "name with stray # will not work with PDF >= 1.2";
        }
        if (give_back) {
            return;
        }
    }
}

// Numbers, booleans, null, and operators such as R, obj and Tj
void
ScrubTokenizer::readWord(InputSource& input)
{
    char ch;
    while (readChar(input, ch)) {
        if (ends_token(ch)) {
            unread();
            break;
        }
    }
    if (!too_long) {
        type = classify(raw_val);
    }
}

void
ScrubTokenizer::expectInlineImage(InputSource& input)
{
    auto pos = input.tell();
    auto last_offset = input.getLastOffset();
    input.seek(0, SEEK_END);
    auto rest = input.read(ScrubIntC::to_size(input.tell() - pos), pos);

    inline_image = true;
    inline_image_bytes.reset();
    for (auto at = rest.find("EI"); at != std::string::npos; at = rest.find("EI", at + 1)) {
        bool alone = (at == 0 || ends_token(rest[at - 1])) &&
            (at + 2 == rest.size() || ends_token(rest[at + 2]));
        if (!alone) {
            continue;
        }
        // Without a convincing EI, the last one is used.
        inline_image_bytes = at;
        if (looks_like_content(rest.substr(at + 2))) {
            break;
        }
    }
    input.seek(pos, SEEK_SET);
    input.setLastOffset(last_offset);
}

void
ScrubTokenizer::readInlineImage(InputSource& input)
{
    inline_image = false;
    auto start = input.tell();
    if (inline_image_bytes) {
        raw_val = input.read(*inline_image_bytes, start);
        type = tt_inline_image;
    } else {
        input.seek(0, SEEK_END);
        raw_val = input.read(ScrubIntC::to_size(input.tell() - start), start);
        fail("EOF while reading inline image");
    }
    input.seek(start + static_cast<scrub_offset_t>(raw_val.size()), SEEK_SET);
    input.setLastOffset(start);
}
