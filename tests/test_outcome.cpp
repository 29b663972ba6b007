#include <gtest/gtest.h>
#include "python/outcome.h"
#include "python/serialization.h"
#include "python/text_repair.h"

using namespace snipguard::python;

TEST(OutcomeTest, KindNames) {
    EXPECT_STREQ(errorKindToString(ErrorKind::EMPTY_CODE), "EmptyCode");
    EXPECT_STREQ(errorKindToString(ErrorKind::MEMORY_LIMIT_ERROR), "MemoryLimitError");
    EXPECT_STREQ(errorKindToString(ErrorKind::POLICY_VIOLATION), "PolicyViolation");
}

TEST(OutcomeTest, RuntimeSuggestionsFollowKeywords) {
    std::string generic = suggestionFor(ErrorKind::RUNTIME_ERROR, "something odd");
    EXPECT_NE(suggestionFor(ErrorKind::RUNTIME_ERROR, "Pandas could not align"), generic);
    EXPECT_NE(suggestionFor(ErrorKind::RUNTIME_ERROR, "numpy broadcast failed"), generic);
    EXPECT_NE(suggestionFor(ErrorKind::RUNTIME_ERROR, "PERMISSION denied"), generic);
    EXPECT_NE(suggestionFor(ErrorKind::RUNTIME_ERROR, "out of memory"), generic);
    EXPECT_NE(suggestionFor(ErrorKind::RUNTIME_ERROR, "socket timeout"), generic);
    EXPECT_NE(suggestionFor(ErrorKind::RUNTIME_ERROR, "pandas"), suggestionFor(ErrorKind::RUNTIME_ERROR, "numpy"));
}

TEST(OutcomeTest, EveryKindHasSuggestion) {
    for (int k = 0; k <= static_cast<int>(ErrorKind::RUNTIME_ERROR); ++k) {
        EXPECT_FALSE(suggestionFor(static_cast<ErrorKind>(k), "").empty());
    }
}

TEST(OutcomeTest, VariantAccessors) {
    ExecutionSuccess s;
    s.output = "hi\n";
    s.elapsedSeconds = 0.5;
    ExecutionOutcome ok(s);
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.output(), "hi\n");
    EXPECT_DOUBLE_EQ(ok.elapsedSeconds(), 0.5);
    EXPECT_THROW(ok.failure(), std::bad_variant_access);
    
    ExecutionFailure f;
    f.kind = ErrorKind::KEY_ERROR;
    f.output = "partial";
    ExecutionOutcome failed(f);
    EXPECT_TRUE(failed.failed());
    EXPECT_EQ(failed.output(), "partial");
}

TEST(OutcomeTest, JsonShape) {
    ExecutionSuccess s;
    s.returnValue = PythonValue::fromInt(4);
    s.hasReturnValue = true;
    s.locals["result"] = s.returnValue;
    nlohmann::json ok = toJson(ExecutionOutcome(s));
    EXPECT_TRUE(ok["success"].get<bool>());
    EXPECT_EQ(ok["result"].get<int64_t>(), 4);
    EXPECT_EQ(ok["locals"]["result"].get<int64_t>(), 4);
    
    ExecutionFailure f;
    f.kind = ErrorKind::MEMORY_LIMIT_ERROR;
    f.memoryLimitBytes = 10;
    f.memoryUsedBytes = 20;
    nlohmann::json failed = toJson(ExecutionOutcome(f));
    EXPECT_FALSE(failed["success"].get<bool>());
    EXPECT_EQ(failed["error"], "MemoryLimitError");
    EXPECT_EQ(failed["memory_used_bytes"].get<uint64_t>(), 20u);
}

TEST(OutcomeTest, ContextFromJson) {
    nlohmann::json doc = nlohmann::json::parse(R"({"n": 3, "ratio": 0.5, "tags": ["a", "b"], "meta": {"ok": true}, "none": null})");
    ExecutionContext ctx;
    ASSERT_TRUE(contextFromJson(doc, ctx));
    EXPECT_EQ(ctx.at("n").type, PythonValueType::INT);
    EXPECT_EQ(ctx.at("ratio").type, PythonValueType::FLOAT);
    EXPECT_EQ(ctx.at("tags").listVal.size(), 2u);
    EXPECT_TRUE(ctx.at("meta").dictVal.at("ok").toBool());
    EXPECT_TRUE(ctx.at("none").isNone());
    
    ExecutionContext rejected;
    EXPECT_FALSE(contextFromJson(nlohmann::json::array(), rejected));
}

TEST(OutcomeTest, ValueDescribe) {
    std::map<std::string, PythonValue> d;
    d["k"] = PythonValue::fromString("it's");
    EXPECT_EQ(PythonValue::fromDict(d).describe(), "{'k': \"it's\"}");
    EXPECT_EQ(PythonValue::fromFloat(0.1).describe(), "0.1");
    EXPECT_EQ(PythonValue::fromFloat(2.0).describe(), "2.0");
    EXPECT_EQ(PythonValue::fromBool(true).describe(), "True");
    EXPECT_EQ(PythonValue::fromBytes({'a', 'b'}).describe(), "b'ab'");
    EXPECT_EQ(PythonValue::fromBytes({'i', '\'', 's'}).describe(), "b\"i's\"");
}

TEST(TextRepairTest, PassthroughLeavesTextAlone) {
    PassthroughRepairer repairer;
    EXPECT_TRUE(repairer.validate("x = 'unterminated").valid);
    RepairReport report = repairer.repair("a = 1");
    EXPECT_TRUE(report.success);
    EXPECT_EQ(report.fixedText, "a = 1");
    EXPECT_TRUE(report.changes.empty());
}

TEST(TextRepairTest, ColumnKeysAreTrimmed) {
    EXPECT_EQ(normalizeColumnKeys("df['  price ']"), "df['price']");
    EXPECT_EQ(normalizeColumnKeys("x = df[\" qty\"] + df['a']"), "x = df[\"qty\"] + df['a']");
    EXPECT_EQ(normalizeColumnKeys("other['  keep ']"), "other['  keep ']");
    EXPECT_EQ(normalizeColumnKeys("plain text"), "plain text");
}

TEST(TextRepairTest, ColumnKeysNeedMatchingClose) {
    EXPECT_EQ(normalizeColumnKeys("df[' a\"]"), "df[' a\"]");
    EXPECT_EQ(normalizeColumnKeys("df[' a '"), "df[' a '");
    EXPECT_EQ(normalizeColumnKeys("df[' a\n ']"), "df[' a\n ']");
    EXPECT_EQ(normalizeColumnKeys("df[0] + df[ ' b ']"), "df[0] + df[ ' b ']");
    EXPECT_EQ(normalizeColumnKeys("df[df[' k ']]"), "df[df['k']]");
}

TEST(TextRepairTest, VeryLongColumnKey) {
    std::string key(200000, 'a');
    EXPECT_EQ(normalizeColumnKeys("result = df['  " + key + "']"), "result = df['" + key + "']");
    std::string unterminated = "result = df['" + key;
    EXPECT_EQ(normalizeColumnKeys(unterminated), unterminated);
}
