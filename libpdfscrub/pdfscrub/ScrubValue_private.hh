#ifndef SCRUBVALUE_PRIVATE_HH
#define SCRUBVALUE_PRIVATE_HH

#include <pdfscrub/ScrubObject.hh>

#include <map>
#include <string>
#include <variant>
#include <vector>

// The alternatives of ScrubValue::value must stay in the same order as scrub_object_type_e.

struct Scrub_Null
{
};

struct Scrub_Bool
{
    bool val;
};

struct Scrub_Integer
{
    long long val;
};

struct Scrub_Real
{
    std::string val;
};

struct Scrub_String
{
    std::string val;
};

struct Scrub_Name
{
    std::string name;
};

struct Scrub_Array
{
    std::vector<ScrubObject> elements;
};

struct Scrub_Dictionary
{
    std::map<std::string, ScrubObject> items;
};

struct Scrub_Reference
{
    ScrubObjGen og;
};

class ScrubValue
{
  public:
    template <typename T>
    ScrubValue(T&& value) :
        value(std::forward<T>(value))
    {
    }

    scrub_object_type_e
    getTypeCode() const
    {
        return static_cast<scrub_object_type_e>(value.index());
    }

    template <typename T>
    T*
    as()
    {
        return std::get_if<T>(&value);
    }

    template <typename T>
    T const*
    as() const
    {
        return std::get_if<T>(&value);
    }

    std::variant<
        Scrub_Null,
        Scrub_Bool,
        Scrub_Integer,
        Scrub_Real,
        Scrub_String,
        Scrub_Name,
        Scrub_Array,
        Scrub_Dictionary,
        Scrub_Reference>
        value;
};

#endif // SCRUBVALUE_PRIVATE_HH
