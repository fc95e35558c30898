#ifndef SCRUBPARSER_HH
#define SCRUBPARSER_HH

#include <pdfscrub/InputSource.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubObject.hh>
#include <pdfscrub/ScrubTokenizer.hh>

#include <map>
#include <string>
#include <vector>

namespace pdfscrub::impl
{
    /// @brief Reads one direct object from an input source.
    ///
    /// Arrays and dictionaries are parsed iteratively with an explicit stack, so nesting depth is
    /// bounded by max_nesting rather than by the C++ call stack. "n g R" becomes a reference; it is
    /// never resolved here. Problems are reported as warnings through the warnings vector and the
    /// affected value becomes null. Without a warnings vector, the first problem is thrown.
    class ScrubParser
    {
      public:
        static constexpr size_t max_nesting = 499;

        ScrubParser(
            InputSource& input,
            std::string const& description,
            ScrubTokenizer& tokenizer,
            std::vector<ScrubExc>* warnings);

        /// @brief Parse one object.
        /// @param empty set to true when "endobj" was seen before any object; the input is left
        ///        positioned in front of it.
        /// @return the object, or null if it could not be read.
        ScrubObject parse(bool& empty);

        /// Parse one object and throw if any problem is seen. Used for strings such as
        /// configuration values and test input.
        static ScrubObject parse(std::string const& text, std::string const& description);

      private:
        // Thrown internally to give up on the current object.
        struct Error
        {
        };

        enum parser_state_e { st_dictionary_key, st_dictionary_value, st_array };

        struct StackFrame
        {
            StackFrame(InputSource& input, parser_state_e state) :
                state(state),
                offset(input.tell())
            {
            }

            std::vector<ScrubObject> olist;
            std::map<std::string, ScrubObject> dict;
            parser_state_e state;
            std::string key;
            scrub_offset_t offset;
        };

        ScrubObject parseFirst(bool& empty);
        ScrubObject parseRemainder();
        void add(ScrubObject obj);
        void addNull();
        void addBadNull(std::string const& msg);
        void addInt(int count);
        void checkTooManyBadTokens();
        void fixMissingKeys();
        void warn(scrub_offset_t offset, std::string const& msg);
        void warn(std::string const& msg);

        InputSource& input;
        std::string description;
        ScrubTokenizer& tokenizer;
        std::vector<ScrubExc>* warnings;

        std::vector<StackFrame> stack;
        StackFrame* frame{nullptr};

        int bad_count{0};
        int good_count{0};
        int int_count{0};
        long long int_buffer[2]{0, 0};
    };
} // namespace pdfscrub::impl

#endif // SCRUBPARSER_HH
