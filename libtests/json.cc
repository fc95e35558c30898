#include <pdfscrub/assert_test.h>

#include <pdfscrub/JSON.hh>
#include <pdfscrub/Pipeline.hh>
#include <pdfscrub/Pl_String.hh>

#include <iostream>
#include <vector>

static void
expect(JSON const& j, std::string const& pretty)
{
    if (j.unparse() != pretty) {
        std::cout << "unexpected JSON:\n" << j.unparse() << "\nexpected:\n" << pretty << "\n";
        assert(false);
    }
}

static void
test_scalars()
{
    // Control characters are escaped; other UTF-8 passes through.
    expect(
        JSON::makeString("Title: \xc3\xa9t\xc3\xa9 \"draft\"\\\x1f\f\n"),
        "\"Title: \xc3\xa9t\xc3\xa9 \\\"draft\\\"\\\\\\u001f\\f\\n\"");
    expect(JSON::makeInt(-40), "-40");
    expect(JSON::makeReal(0.5), "0.5");
    expect(JSON::makeReal(2.0), "2");
    expect(JSON::makeNumber("6.02e23"), "6.02e23");
    expect(JSON::makeBool(false), "false");
    expect(JSON::makeNull(), "null");

    std::string text;
    bool flag = false;
    auto severity = JSON::makeString("high");
    assert(severity.getString(text) && text == "high");
    assert(!severity.getNumber(text) && !severity.getBool(flag));
    auto count = JSON::makeInt(7);
    assert(count.getNumber(text) && text == "7");
    assert(!count.getString(text));
    assert(JSON::makeBool(true).getBool(flag) && flag);
    assert(JSON::makeNull().isNull());
    assert(!JSON::makeNull().getString(text));
}

static JSON
sample_report()
{
    auto report = JSON::makeDictionary();
    report.addDictionaryMember("status", JSON::makeString("Clean"));
    auto findings = report.addDictionaryMember("findings", JSON::makeArray());
    auto finding = findings.addArrayElement(JSON::makeDictionary());
    finding.addDictionaryMember("kind", JSON::makeString("MetadataField"));
    finding.addDictionaryMember("object", JSON::makeInt(12));
    findings.addArrayElement(JSON::makeNull());
    report.addDictionaryMember("waived", JSON::makeArray());
    report.addDictionaryMember("context", JSON::makeDictionary());
    report.addDictionaryMember("a\tb", JSON::makeBool(true));
    return report;
}

static void
test_containers()
{
    expect(JSON::makeArray(), "[]");
    expect(JSON::makeDictionary(), "{}");

    // Members are written sorted by key.
    auto report = sample_report();
    expect(
        report,
        "{\n"
        "  \"a\\tb\": true,\n"
        "  \"context\": {},\n"
        "  \"findings\": [\n"
        "    {\n"
        "      \"kind\": \"MetadataField\",\n"
        "      \"object\": 12\n"
        "    },\n"
        "    null\n"
        "  ],\n"
        "  \"status\": \"Clean\",\n"
        "  \"waived\": []\n"
        "}");
    assert(
        report.unparseCompact() ==
        "{\"a\\tb\":true,\"context\":{},\"findings\":[{\"kind\":\"MetadataField\",\"object\":12},"
        "null],\"status\":\"Clean\",\"waived\":[]}");

    std::string status;
    assert(report.getDictItem("status").getString(status) && status == "Clean");
    assert(report.getDictItem("missing").isNull());
    assert(JSON::makeString("x").getDictItem("status").isNull());

    // A member added again replaces the first.
    report.addDictionaryMember("status", JSON::makeString("Rejected"));
    assert(report.getDictItem("status").getString(status) && status == "Rejected");

    std::vector<std::string> keys;
    assert(report.forEachDictItem([&keys](std::string const& k, JSON) { keys.push_back(k); }));
    assert((keys == std::vector<std::string>{"a\tb", "context", "findings", "status", "waived"}));
    std::vector<std::string> items;
    assert(report.getDictItem("findings").forEachArrayItem(
        [&items](JSON j) { items.push_back(j.unparseCompact()); }));
    assert(
        (items == std::vector<std::string>{"{\"kind\":\"MetadataField\",\"object\":12}", "null"}));
    assert(!report.forEachArrayItem([](JSON) {}));
    assert(!report.getDictItem("findings").forEachDictItem([](std::string const&, JSON) {}));

    // Pipelines get the same bytes as unparse.
    std::string written;
    Pl_String out("out", nullptr, written);
    report.write(&out);
    assert(written == report.unparse());
    written.clear();
    report.writeCompact(&out);
    assert(written == report.unparseCompact());
}

static void
test_parse()
{
    auto record = JSON::parse(R"({"lineage": "doc", "attempt": 2, "links": ["ab", "cd"],
        "waived": false, "note": null, "ratio": -1.5e-3})");
    std::string value;
    assert(record.getDictItem("lineage").getString(value) && value == "doc");
    assert(record.getDictItem("attempt").getNumber(value) && value == "2");
    assert(record.getDictItem("ratio").getNumber(value) && value == "-1.5e-3");
    assert(record.getDictItem("note").isNull());
    assert(record.getDictItem("links").isArray());

    // Output parses back to the same value.
    auto report = sample_report();
    assert(JSON::parse(report.unparse()).unparseCompact() == report.unparseCompact());
    assert(JSON::parse(report.unparseCompact()).unparse() == report.unparse());

    // Escapes, including surrogate pairs
    auto escaped = JSON::parse(R"("\u00e9\ud83e\udd54\/\"\\\b\t")");
    assert(escaped.getString(value) && value == "\xc3\xa9\xf0\x9f\xa5\x94/\"\\\b\t");
    // Raw UTF-8 is accepted as is.
    assert(JSON::parse("\"\xcf\x80\"").getString(value) && value == "\xcf\x80");

    for (auto const& bad:
         {"", "\"open", "{\"k\": }", "[1, 2", "{\"k\" 1}", "nul", "{} {}", "-", "1.", "007",
          "{\"k\": 1,}", "\"\\x\""}) {
        bool threw = false;
        try {
            JSON::parse(bad);
        } catch (std::runtime_error&) {
            threw = true;
        }
        if (!threw) {
            std::cout << "accepted " << bad << std::endl;
            assert(false);
        }
    }
}

static void
test_uninitialized()
{
    // A default-constructed JSON writes as null but is none of the types.
    JSON none;
    assert(none.unparse() == "null");
    assert(none.unparseCompact() == "null");
    assert(!none.isNull() && !none.isArray() && !none.isDictionary());
    std::string text = "kept";
    bool flag = true;
    assert(!none.getString(text) && !none.getNumber(text) && !none.getBool(flag));
    assert(text == "kept" && flag);
    assert(none.getDictItem("status").isNull());
    assert(!none.forEachDictItem([](std::string const&, JSON) {}));
    assert(!none.forEachArrayItem([](JSON) {}));

    bool threw = false;
    try {
        none.addDictionaryMember("status", JSON::makeNull());
    } catch (std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        none.addArrayElement(JSON::makeNull());
    } catch (std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    // Stored in a container, it becomes a real null.
    auto dict = JSON::makeDictionary();
    assert(dict.addDictionaryMember("empty", none).isNull());
    auto arr = JSON::makeArray();
    assert(arr.addArrayElement(none).isNull());

    std::list<std::string> errors;
    assert(!none.checkSchema(JSON(), errors));
    assert(!none.checkSchema(JSON(), JSON::f_optional, errors));
    assert(errors.empty());
}

static void
check_schema(
    JSON& obj, JSON& schema, unsigned long flags, bool exp, std::list<std::string> const& expected)
{
    std::list<std::string> errors;
    assert(exp == obj.checkSchema(schema, flags, errors));
    for (auto const& fragment: expected) {
        bool found = false;
        for (auto const& error: errors) {
            if (error.find(fragment) != std::string::npos) {
                found = true;
            }
        }
        if (!found) {
            std::cout << "no error mentions " << fragment << std::endl;
            assert(false);
        }
    }
}

static void
test_schema()
{
    JSON schema = JSON::parse(R"json(
{
  "input": "(string)",
  "config": {
    "waived": ["(string)"],
    "timeout_seconds": "(number)",
    "force_remove": "(boolean)"
  },
  "records": [
    {
      "lineage": "anything",
      "attempt": "(number)"
    }
  ],
  "chains": {
    "<lineage>": {
      "head": "(string)"
    }
  },
  "pair": [
    { "first": "first element" },
    { "second": "second element" }
  ]
}
)json");

    JSON a = JSON::parse(R"(["not a", "dictionary"])");
    check_schema(a, schema, 0, false, {"top-level object is supposed to be a dictionary"});

    JSON b = JSON::parse(R"(
{
  "input": 12,
  "config": {
    "waived": "OrphanedObject",
    "timeout_seconds": "soon",
    "verbose": true
  },
  "records": [
    {"lineage": "x", "attempt": 1},
    {"lineage": "y", "attempt": "2"}
  ],
  "chains": {
    "doc-1": {"head": "abc"},
    "doc-2": {"tail": "def"}
  },
  "pair": [
    {"first": "missing second"}
  ]
}
)");
    check_schema(
        b,
        schema,
        0,
        false,
        {"json key \".input\" is supposed to be a string",
         "json key \".config.timeout_seconds\" is supposed to be a number",
         "\"verbose\"",
         "json key \".records.1.attempt\" is supposed to be a number",
         ".chains.doc-2",
         "json key \".pair\" is supposed to be an array of length 2"});

    JSON good = JSON::parse(R"(
{
  "input": "in.pdf",
  "config": {
    "waived": "OrphanedObject"
  },
  "records": {"lineage": null, "attempt": 3},
  "chains": {},
  "pair": [
    { "first": 1 },
    { "second": [2] }
  ]
}
)");
    check_schema(good, schema, 0, false, {"\"timeout_seconds\" is present in schema but missing"});
    check_schema(good, schema, JSON::f_optional, true, {});
}

int
main()
{
    test_scalars();
    test_containers();
    test_parse();
    test_uninitialized();
    test_schema();
    std::cout << "json tests done" << std::endl;
    return 0;
}
