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


#ifndef SCRUBTOKENIZER_HH
#define SCRUBTOKENIZER_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/InputSource.hh>

#include <cstdio>
#include <memory>
#include <optional>
#include <string>

// A character-driven lexer for PDF syntax. It is used both for object bodies and for content
// streams.
class ScrubTokenizer
{
  public:
    // Token type tt_eof is only returned if allowEOF() is called on the tokenizer. tt_space and
    // tt_comment are only returned if includeIgnorable() is called. tt_inline_image is only
    // returned after expectInlineImage().
    enum token_type_e {
        tt_bad,
        tt_array_close,
        tt_array_open,
        tt_brace_close,
        tt_brace_open,
        tt_dict_close,
        tt_dict_open,
        tt_integer,
        tt_name,
        tt_real,
        tt_string,
        tt_null,
        tt_bool,
        tt_word,
        tt_eof,
        tt_space,
        tt_comment,
        tt_inline_image,
    };

    class Token
    {
      public:
        Token() :
            type(tt_bad)
        {
        }
        Token(
            token_type_e type,
            std::string const& value,
            std::string raw_value = {},
            std::string error_message = {}) :
            type(type),
            value(value),
            raw_value(raw_value.empty() ? value : raw_value),
            error_message(error_message)
        {
        }
        token_type_e
        getType() const
        {
            return type;
        }
        // For names, the value is the decoded name including the leading slash. For strings, it is
        // the decoded string contents. For everything else, it is the same as the raw value.
        std::string const&
        getValue() const
        {
            return value;
        }
        std::string const&
        getRawValue() const
        {
            return raw_value;
        }
        std::string const&
        getErrorMessage() const
        {
            return error_message;
        }
        bool
        operator==(Token const& rhs) const
        {
            return ((type != tt_bad) && (type == rhs.type) && (value == rhs.value));
        }
        bool
        isInteger() const
        {
            return type == tt_integer;
        }
        bool
        isWord() const
        {
            return type == tt_word;
        }
        bool
        isWord(std::string const& word) const
        {
            return type == tt_word && value == word;
        }

      private:
        token_type_e type;
        std::string value;
        std::string raw_value;
        std::string error_message;
    };

    PDFSCRUB_DLL
    ScrubTokenizer();

    // If called, treat EOF as a separate token type instead of an error. Content streams are
    // tokenized this way.
    PDFSCRUB_DLL
    void allowEOF();

    // If called, readToken will return "ignorable" tokens for space and comments.
    PDFSCRUB_DLL
    void includeIgnorable();

    // Read a token from an input source. Context describes the context in which the token is being
    // read and is used in the exception thrown if there is an error. After a token is read, the
    // position of the input source returned by input.tell() points to just after the token, and
    // the input source's "last offset" as returned by input.getLastOffset() points to the
    // beginning of the token. If max_len is not 0, a token longer than max_len bytes is returned as
    // tt_bad. Bad tokens throw ScrubExc with scrub_e_damaged_pdf unless allow_bad is true.
    PDFSCRUB_DLL
    Token readToken(
        InputSource& input, std::string const& context, bool allow_bad = false, size_t max_len = 0);

    // Like readToken but does not construct a Token and never throws for bad tokens. Returns false
    // if the token is bad or produced an error message. The results are available through the
    // accessors below until the next call.
    PDFSCRUB_DLL
    bool nextToken(InputSource& input, std::string const& context, size_t max_len = 0);

    token_type_e
    getType() const
    {
        return type;
    }
    std::string const&
    getValue() const
    {
        return (type == tt_name || type == tt_string) ? val : raw_val;
    }
    std::string const&
    getRawValue() const
    {
        return raw_val;
    }
    std::string const&
    getErrorMessage() const
    {
        return error_message;
    }

    // Call after reading the operator ID and the single white-space character that follows it.
    // The next token is then tt_inline_image, holding the image data up to but not including the
    // EI operator that ends it, or tt_bad if no plausible EI follows.
    PDFSCRUB_DLL
    void expectInlineImage(InputSource& input);

  private:
    ScrubTokenizer(ScrubTokenizer const&) = delete;
    ScrubTokenizer& operator=(ScrubTokenizer const&) = delete;

    bool readChar(InputSource&, char&);
    void unread();
    void fail(std::string const& message);
    void failAtEnd();

    void readSpace(InputSource&);
    void readComment(InputSource&);
    void readLiteralString(InputSource&);
    void readAngle(InputSource&);
    void readHexString(InputSource&, char first);
    void readName(InputSource&);
    void readWord(InputSource&);
    void readInlineImage(InputSource&);

    bool allow_eof{false};
    bool include_ignorable{false};
    size_t max_len{0};

    // The token being read
    token_type_e type{tt_bad};
    std::string val;
    std::string raw_val;
    std::string error_message;
    bool give_back{false};
    bool too_long{false};

    // Set by expectInlineImage. The length is empty when no EI was found.
    bool inline_image{false};
    std::optional<size_t> inline_image_bytes;
};

#endif // SCRUBTOKENIZER_HH
