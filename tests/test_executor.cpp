#include <gtest/gtest.h>
#include "python/executor.h"
#include "utils/config.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace snipguard;
using namespace snipguard::python;

namespace {

// Counts calls and rewrites text when it contains a marker.
class ScriptedRepairer : public TextRepairer {
public:
    ScriptedRepairer(std::string marker, std::string replacement)
        : marker_(std::move(marker)), replacement_(std::move(replacement)) {}
    
    ValidationReport validate(const std::string& text) const override {
        ++validateCalls;
        ValidationReport report;
        report.valid = text.find(marker_) == std::string::npos;
        if (!report.valid) report.errors.push_back("marker found");
        return report;
    }
    
    RepairReport repair(const std::string& text) const override {
        ++repairCalls;
        RepairReport report;
        report.fixedText = text;
        size_t pos = report.fixedText.find(marker_);
        if (pos != std::string::npos) report.fixedText.replace(pos, marker_.size(), replacement_);
        report.changes.push_back("replaced marker");
        return report;
    }
    
    mutable std::atomic<int> validateCalls{0};
    mutable std::atomic<int> repairCalls{0};
    
private:
    std::string marker_;
    std::string replacement_;
};

class ThrowingRepairer : public TextRepairer {
public:
    ValidationReport validate(const std::string&) const override {
        throw std::runtime_error("repairer is broken");
    }
    RepairReport repair(const std::string&) const override {
        throw std::runtime_error("repairer is broken");
    }
};

// Permissive, but without pre-importing the heavy data stack so that timing
// checks do not include first-time imports.
ExecutorConfig quickPermissive(uint32_t seconds = 10) {
    ExecutorConfig cfg = ExecutorConfig::permissive();
    cfg.limits.maxTimeSeconds = seconds;
    cfg.allowedModules = {"math", "json", "re", "time"};
    return cfg;
}

}

class CodeExecutorTest : public ::testing::Test {
protected:
    CodeExecutor executor{quickPermissive()};
};

TEST_F(CodeExecutorTest, ScenarioAReturnsResult) {
    ExecutionOutcome outcome = executor.execute("result = 2 + 2");
    ASSERT_TRUE(outcome.ok()) << outcome.failure().message;
    EXPECT_TRUE(outcome.success().hasReturnValue);
    EXPECT_EQ(outcome.success().returnValue.type, PythonValueType::INT);
    EXPECT_EQ(outcome.success().returnValue.toInt(), 4);
    EXPECT_GE(outcome.elapsedSeconds(), 0.0);
}

TEST_F(CodeExecutorTest, ScenarioBDivisionByZeroIsValueError) {
    ExecutionOutcome outcome = executor.execute("x = 1/0");
    ASSERT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.failure().kind, ErrorKind::VALUE_ERROR);
    EXPECT_EQ(outcome.failure().exceptionType, "ZeroDivisionError");
    EXPECT_NE(outcome.failure().message.find("division"), std::string::npos);
    EXPECT_NE(outcome.failure().trace.find("ZeroDivisionError"), std::string::npos);
    EXPECT_FALSE(outcome.failure().suggestion.empty());
}

TEST_F(CodeExecutorTest, ScenarioCHardenedImportIsDenied) {
    ExecutorConfig cfg = ExecutorConfig::hardened();
    cfg.limits.maxTimeSeconds = 10;
    CodeExecutor hardened(cfg);
    ExecutionOutcome outcome = hardened.execute("import nonexistent_module_xyz");
    ASSERT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.failure().kind, ErrorKind::IMPORT_ERROR);
}

TEST_F(CodeExecutorTest, ScenarioDInfiniteLoopTimesOut) {
    CodeExecutor bounded(quickPermissive(2));
    ExecutionOutcome outcome = bounded.execute("while True: pass");
    ASSERT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.failure().kind, ErrorKind::TIMEOUT_ERROR);
    EXPECT_GE(outcome.elapsedSeconds(), 1.9);
    EXPECT_LT(outcome.elapsedSeconds(), 3.5);
}

TEST_F(CodeExecutorTest, ScenarioECapturesOutput) {
    ExecutionOutcome outcome = executor.execute("print('hi'); result = 'ok'");
    ASSERT_TRUE(outcome.ok()) << outcome.failure().message;
    EXPECT_NE(outcome.output().find("hi"), std::string::npos);
    EXPECT_EQ(outcome.success().returnValue.toString(), "ok");
}

TEST_F(CodeExecutorTest, EmptyCodeSkipsEverything) {
    auto repairer = std::make_shared<ScriptedRepairer>("@@", "");
    ExecutorConfig cfg = quickPermissive();
    cfg.repairer = repairer;
    cfg.enableStaticAnalysis = true;
    CodeExecutor guarded(cfg);
    
    for (const std::string code : {"", "   ", "\n\t \n"}) {
        ExecutionOutcome outcome = guarded.execute(code);
        ASSERT_TRUE(outcome.failed());
        EXPECT_EQ(outcome.failure().kind, ErrorKind::EMPTY_CODE);
    }
    EXPECT_EQ(repairer->validateCalls.load(), 0);
}

TEST_F(CodeExecutorTest, MissingResultIsNotAnError) {
    ExecutionOutcome outcome = executor.execute("x = 3");
    ASSERT_TRUE(outcome.ok());
    EXPECT_FALSE(outcome.success().hasReturnValue);
    EXPECT_TRUE(outcome.success().returnValue.isNone());
    EXPECT_EQ(outcome.success().locals.at("x").toInt(), 3);
}

TEST_F(CodeExecutorTest, MapsEachExceptionFamily) {
    struct Case { const char* code; ErrorKind kind; };
    const Case cases[] = {
        {"def f(:\n  pass", ErrorKind::SYNTAX_ERROR},
        {"if True:\nprint(1)", ErrorKind::SYNTAX_ERROR},
        {"y = undefined_name", ErrorKind::NAME_ERROR},
        {"d = {}\nd['missing']", ErrorKind::KEY_ERROR},
        {"(1).no_such_attribute", ErrorKind::ATTRIBUTE_ERROR},
        {"import module_that_does_not_exist_42", ErrorKind::IMPORT_ERROR},
        {"int('abc')", ErrorKind::VALUE_ERROR},
        {"import math\nmath.exp(100000)", ErrorKind::VALUE_ERROR},
        {"len(5)", ErrorKind::TYPE_ERROR},
        {"[1, 2][5]", ErrorKind::INDEX_ERROR},
        {"raise RuntimeError('boom')", ErrorKind::RUNTIME_ERROR},
        {"raise TimeoutError('mine')", ErrorKind::RUNTIME_ERROR},
        {"raise MemoryError()", ErrorKind::RUNTIME_ERROR},
    };
    for (const auto& c : cases) {
        ExecutionOutcome outcome = executor.execute(c.code);
        ASSERT_TRUE(outcome.failed()) << c.code;
        EXPECT_EQ(outcome.failure().kind, c.kind) << c.code << " -> " << errorKindToString(outcome.failure().kind);
    }
}

TEST_F(CodeExecutorTest, PartialOutputSurvivesFailure) {
    ExecutionOutcome outcome = executor.execute("print('before')\nraise ValueError('bad')");
    ASSERT_TRUE(outcome.failed());
    EXPECT_NE(outcome.output().find("before"), std::string::npos);
    EXPECT_EQ(outcome.failure().message, "bad");
}

TEST_F(CodeExecutorTest, LocalsExcludePrivateNames) {
    ExecutionOutcome outcome = executor.execute("_tmp = 1\n__sg_x = 2\nkept = 3\nresult = kept");
    ASSERT_TRUE(outcome.ok());
    const auto& locals = outcome.success().locals;
    EXPECT_EQ(locals.count("_tmp"), 0u);
    EXPECT_EQ(locals.count("__sg_x"), 0u);
    EXPECT_EQ(locals.count("kept"), 1u);
    EXPECT_EQ(locals.count("result"), 1u);
}

TEST_F(CodeExecutorTest, RunsDoNotLeakIntoEachOther) {
    ExecutionContext ctx;
    ctx["base"] = PythonValue::fromInt(10);
    
    ExecutionOutcome first = executor.execute("leaked = base + 1\nbase = 0", ctx);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(ctx.at("base").toInt(), 10);
    
    ExecutionOutcome second = executor.execute("result = base", ctx);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.success().returnValue.toInt(), 10);
    
    ExecutionOutcome third = executor.execute("result = leaked", ctx);
    ASSERT_TRUE(third.failed());
    EXPECT_EQ(third.failure().kind, ErrorKind::NAME_ERROR);
}

TEST_F(CodeExecutorTest, ContextValuesAreVisible) {
    ExecutionContext ctx;
    ctx["rows"] = PythonValue::fromList({PythonValue::fromInt(1), PythonValue::fromInt(2), PythonValue::fromInt(3)});
    ExecutionOutcome outcome = executor.execute("result = sum(rows)", ctx);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.success().returnValue.toInt(), 6);
}

TEST_F(CodeExecutorTest, ReservedContextNameRaisesNameError) {
    ExecutionContext ctx;
    ctx["__sg_secret"] = PythonValue::fromInt(1);
    ExecutionOutcome outcome = executor.execute("result = __sg_secret", ctx);
    ASSERT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.failure().kind, ErrorKind::NAME_ERROR);
}

TEST_F(CodeExecutorTest, SwallowedAbortIsReasserted) {
    CodeExecutor bounded(quickPermissive(1));
    ExecutionOutcome outcome = bounded.execute(
        "try:\n"
        "    while True: pass\n"
        "except BaseException:\n"
        "    pass\n"
        "while True: pass\n");
    ASSERT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.failure().kind, ErrorKind::TIMEOUT_ERROR);
    EXPECT_LT(outcome.elapsedSeconds(), 3.0);
}

TEST_F(CodeExecutorTest, MemoryCeilingAbortsRun) {
    ExecutorConfig cfg = quickPermissive(10);
    cfg.limits.maxMemoryBytes = 1024 * 1024;
    CodeExecutor tiny(cfg);
    ExecutionOutcome outcome = tiny.execute("while True: pass");
    ASSERT_TRUE(outcome.failed());
    if (!currentResidentBytes()) GTEST_SKIP() << "memory sampling unavailable";
    EXPECT_EQ(outcome.failure().kind, ErrorKind::MEMORY_LIMIT_ERROR);
    EXPECT_EQ(outcome.failure().memoryLimitBytes, 1024u * 1024u);
    EXPECT_GT(outcome.failure().memoryUsedBytes, outcome.failure().memoryLimitBytes);
}

TEST_F(CodeExecutorTest, HardenedProfileEnforcesPolicy) {
    ExecutorConfig cfg = ExecutorConfig::hardened();
    cfg.limits.maxTimeSeconds = 10;
    CodeExecutor hardened(cfg);
    
    ExecutionOutcome outcome = hardened.execute("import os\nresult = os.getcwd()");
    ASSERT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.failure().kind, ErrorKind::POLICY_VIOLATION);
    EXPECT_NE(outcome.failure().message.find("os"), std::string::npos);
    
    ExecutionOutcome allowed = hardened.execute("import math\nresult = math.floor(2.5)");
    ASSERT_TRUE(allowed.ok()) << allowed.failure().message;
    EXPECT_EQ(allowed.success().returnValue.toInt(), 2);
}

TEST_F(CodeExecutorTest, HardenedImportHookBlocksDynamicImport) {
    ExecutorConfig cfg = ExecutorConfig::hardened();
    cfg.limits.maxTimeSeconds = 10;
    cfg.enableStaticAnalysis = false;
    CodeExecutor hardened(cfg);
    
    ExecutionOutcome outcome = hardened.execute("import os");
    ASSERT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.failure().kind, ErrorKind::IMPORT_ERROR);
    
    ExecutionOutcome noEval = hardened.execute("result = eval('1')");
    ASSERT_TRUE(noEval.failed());
    EXPECT_EQ(noEval.failure().kind, ErrorKind::NAME_ERROR);
}

TEST_F(CodeExecutorTest, UnenforcedPolicyOnlyWarns) {
    ExecutorConfig cfg = quickPermissive();
    cfg.enableStaticAnalysis = true;
    cfg.policyRules = PolicyRules::hardened();
    cfg.enforcePolicy = false;
    CodeExecutor lenient(cfg);
    ExecutionOutcome outcome = lenient.execute("import os\nresult = 1");
    ASSERT_TRUE(outcome.ok());
}

TEST_F(CodeExecutorTest, RetriesOriginalWhenRepairBreaksCode) {
    auto repairer = std::make_shared<ScriptedRepairer>("#fix", "(");
    ExecutorConfig cfg = quickPermissive();
    cfg.repairer = repairer;
    CodeExecutor retrying(cfg);
    
    ExecutionOutcome outcome = retrying.execute("print('once') #fix\nresult = 5");
    ASSERT_TRUE(outcome.ok()) << outcome.failure().message;
    EXPECT_EQ(outcome.success().returnValue.toInt(), 5);
    EXPECT_EQ(outcome.output(), "once\n");
    EXPECT_EQ(repairer->repairCalls.load(), 1);
}

TEST_F(CodeExecutorTest, RepairedTextIsUsed) {
    auto repairer = std::make_shared<ScriptedRepairer>("BROKEN", "41 + 1");
    ExecutorConfig cfg = quickPermissive();
    cfg.repairer = repairer;
    CodeExecutor repairing(cfg);
    ExecutionOutcome outcome = repairing.execute("result = BROKEN");
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.success().returnValue.toInt(), 42);
}

TEST_F(CodeExecutorTest, DisabledRepairIsNotCalled) {
    auto repairer = std::make_shared<ScriptedRepairer>("x", "y");
    ExecutorConfig cfg = quickPermissive();
    cfg.repairer = repairer;
    cfg.enableTextRepair = false;
    CodeExecutor plain(cfg);
    ASSERT_TRUE(plain.execute("x = 1").ok());
    EXPECT_EQ(repairer->validateCalls.load(), 0);
}

TEST_F(CodeExecutorTest, ThrowingRepairerKeepsOriginal) {
    ExecutorConfig cfg = quickPermissive();
    cfg.repairer = std::make_shared<ThrowingRepairer>();
    CodeExecutor guarded(cfg);
    ExecutionOutcome outcome = guarded.execute("result = 'fine'");
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.success().returnValue.toString(), "fine");
}

TEST_F(CodeExecutorTest, ConcurrentExecutorsStayIndependent) {
    CodeExecutor slow(quickPermissive(1));
    CodeExecutor fast(quickPermissive(10));
    
    std::unique_ptr<ExecutionOutcome> looping;
    std::unique_ptr<ExecutionOutcome> printing;
    std::thread a([&]() { looping.reset(new ExecutionOutcome(slow.execute("print('loop')\nwhile True: pass"))); });
    std::thread b([&]() {
        printing.reset(new ExecutionOutcome(fast.execute(
            "import time\n"
            "for i in range(5):\n"
            "    print('tick', i)\n"
            "    time.sleep(0.3)\n"
            "result = 'done'\n")));
    });
    a.join();
    b.join();
    
    ASSERT_TRUE(looping && printing);
    ASSERT_TRUE(looping->failed());
    EXPECT_EQ(looping->failure().kind, ErrorKind::TIMEOUT_ERROR);
    EXPECT_EQ(looping->output(), "loop\n");
    
    ASSERT_TRUE(printing->ok()) << printing->failure().message;
    EXPECT_EQ(printing->success().returnValue.toString(), "done");
    EXPECT_EQ(printing->output().find("loop"), std::string::npos);
    EXPECT_NE(printing->output().find("tick 4"), std::string::npos);
}

TEST_F(CodeExecutorTest, SharedExecutorKeepsCallersApart) {
    CodeExecutor shared(quickPermissive(2));
    
    std::unique_ptr<ExecutionOutcome> looping;
    std::unique_ptr<ExecutionOutcome> working;
    std::thread a([&]() {
        looping.reset(new ExecutionOutcome(shared.execute("mine = 'a'\nprint('spinning')\nwhile True: pass")));
    });
    std::thread b([&]() {
        working.reset(new ExecutionOutcome(shared.execute(
            "import time\n"
            "theirs = 'b'\n"
            "for i in range(3):\n"
            "    print('step', i)\n"
            "    time.sleep(0.2)\n"
            "result = theirs\n")));
    });
    a.join();
    b.join();
    
    ASSERT_TRUE(looping && working);
    ASSERT_TRUE(looping->failed());
    EXPECT_EQ(looping->failure().kind, ErrorKind::TIMEOUT_ERROR);
    EXPECT_EQ(looping->output(), "spinning\n");
    EXPECT_LT(looping->elapsedSeconds(), 5.0);
    
    ASSERT_TRUE(working->ok()) << working->failure().message;
    EXPECT_EQ(working->success().returnValue.toString(), "b");
    EXPECT_EQ(working->output(), "step 0\nstep 1\nstep 2\n");
    EXPECT_EQ(working->success().locals.count("mine"), 0u);
    EXPECT_EQ(working->success().locals.count("theirs"), 1u);
}

TEST_F(CodeExecutorTest, EndlessReprOfLocalIsBounded) {
    CodeExecutor bounded(quickPermissive(2));
    ExecutionOutcome outcome = bounded.execute(
        "class Stuck:\n"
        "    def __repr__(self):\n"
        "        while True: pass\n"
        "x = Stuck()\n");
    ASSERT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.failure().kind, ErrorKind::TIMEOUT_ERROR);
    EXPECT_LT(outcome.elapsedSeconds(), 5.0);
}

TEST_F(CodeExecutorTest, EndlessStrOfExceptionIsBounded) {
    CodeExecutor bounded(quickPermissive(2));
    ExecutionOutcome outcome = bounded.execute(
        "class Stuck(Exception):\n"
        "    def __str__(self):\n"
        "        while True: pass\n"
        "raise Stuck()\n");
    ASSERT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.failure().kind, ErrorKind::TIMEOUT_ERROR);
    EXPECT_LT(outcome.elapsedSeconds(), 5.0);
}

TEST_F(CodeExecutorTest, OutputWithLoneSurrogateIsKept) {
    ExecutionOutcome outcome = executor.execute(
        "print('important progress line')\n"
        "print('\\ud800')\n"
        "raise ValueError('after output')\n");
    ASSERT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.failure().kind, ErrorKind::VALUE_ERROR);
    EXPECT_NE(outcome.output().find("important progress line"), std::string::npos);
    EXPECT_NE(outcome.output().find("\\ud800"), std::string::npos);
}

TEST_F(CodeExecutorTest, ColumnKeysAreNormalized) {
    ExecutionContext ctx;
    std::map<std::string, PythonValue> df;
    df["price"] = PythonValue::fromInt(9);
    ctx["df"] = PythonValue::fromDict(df);
    ExecutionOutcome outcome = executor.execute("result = df['  price ']", ctx);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.success().returnValue.toInt(), 9);
}

TEST_F(CodeExecutorTest, ExecuteFileReadsSnippet) {
    auto path = std::filesystem::temp_directory_path() / "snipguard_exec_test.py";
    {
        std::ofstream out(path);
        out << "result = 6 * 7\n";
    }
    ExecutionOutcome outcome = executor.executeFile(path.string());
    std::filesystem::remove(path);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.success().returnValue.toInt(), 42);
    
    ExecutionOutcome missing = executor.executeFile("/nonexistent/snippet.py");
    EXPECT_TRUE(missing.failed());
}

TEST_F(CodeExecutorTest, ConvenienceEntryPoint) {
    ExecutionContext ctx;
    ctx["n"] = PythonValue::fromInt(5);
    ExecutionOutcome outcome = executeSafeCode("result = n * n", ctx, 2048, 10);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.success().returnValue.toInt(), 25);
}

TEST_F(CodeExecutorTest, ConvenienceEntryPointRejectsOverflowingMemory) {
    ExecutionOutcome outcome = executeSafeCode("result = 1", {}, UINT64_MAX, 10);
    ASSERT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.failure().kind, ErrorKind::RUNTIME_ERROR);
    EXPECT_EQ(outcome.failure().exceptionType, "Invalid argument");
}

TEST_F(CodeExecutorTest, ObjectResultsKeepHandle) {
    ExecutionOutcome outcome = executor.execute("result = {1, 2, 3}");
    ASSERT_TRUE(outcome.ok());
    const PythonValue& value = outcome.success().returnValue;
    EXPECT_EQ(value.type, PythonValueType::OBJECT);
    EXPECT_EQ(value.typeName, "set");
    EXPECT_TRUE(value.object.valid());
    EXPECT_EQ(value.describe(), "{1, 2, 3}");
}

TEST(ExecutorConfigTest, ProfileFactories) {
    ExecutorConfig permissive = ExecutorConfig::permissive();
    EXPECT_EQ(permissive.profile, SandboxProfile::PERMISSIVE);
    EXPECT_FALSE(permissive.enforcePolicy);
    EXPECT_FALSE(permissive.enableStaticAnalysis);
    EXPECT_TRUE(permissive.enableTextRepair);
    EXPECT_TRUE(permissive.policyRules.empty());
    EXPECT_EQ(permissive.limits.maxMemoryBytes, 2048ULL * 1024 * 1024);
    EXPECT_EQ(permissive.limits.maxTimeSeconds, 120u);
    
    ExecutorConfig hardened = ExecutorConfig::hardened();
    EXPECT_EQ(hardened.profile, SandboxProfile::HARDENED);
    EXPECT_TRUE(hardened.enforcePolicy);
    EXPECT_EQ(hardened.importMode, ImportMode::ALLOW_LIST);
    EXPECT_FALSE(hardened.policyRules.dangerousModules.empty());
}

TEST(ExecutorConfigTest, FromConfigReadsKeys) {
    utils::Config config;
    config.set("sandbox.profile", "hardened");
    config.set("sandbox.max_time_seconds", 7);
    config.set("sandbox.max_memory_mb", 256);
    config.set("sandbox.enforce_policy", "false");
    config.setList("sandbox.allowed_modules", {"math", "json"});
    
    auto cfg = ExecutorConfig::fromConfig(config);
    ASSERT_TRUE(cfg.ok()) << cfg.error().message;
    EXPECT_EQ(cfg.value().profile, SandboxProfile::HARDENED);
    EXPECT_EQ(cfg.value().limits.maxTimeSeconds, 7u);
    EXPECT_EQ(cfg.value().limits.maxMemoryBytes, 256ULL * 1024 * 1024);
    EXPECT_FALSE(cfg.value().enforcePolicy);
    EXPECT_EQ(cfg.value().allowedModules, (std::vector<std::string>{"math", "json"}));
    EXPECT_EQ(cfg.value().policyRules.allowedModules, (std::set<std::string>{"math", "json"}));
}

TEST(ExecutorConfigTest, FromConfigRejectsBadValues) {
    utils::Config unknown;
    unknown.set("sandbox.profile", "strict");
    auto a = ExecutorConfig::fromConfig(unknown);
    ASSERT_TRUE(a.failed());
    EXPECT_EQ(a.error().code, ErrorCode::INVALID_CONFIG);
    
    utils::Config zeroTime;
    zeroTime.set("sandbox.max_time_seconds", 0);
    EXPECT_TRUE(ExecutorConfig::fromConfig(zeroTime).failed());
    
    utils::Config negativeMemory;
    negativeMemory.set("sandbox.max_memory_mb", -5);
    EXPECT_TRUE(ExecutorConfig::fromConfig(negativeMemory).failed());
    
    utils::Config hugeMemory;
    hugeMemory.set("sandbox.max_memory_mb", static_cast<int64_t>(1) << 50);
    EXPECT_TRUE(ExecutorConfig::fromConfig(hugeMemory).failed());
    
    utils::Config largestMemory;
    largestMemory.set("sandbox.max_memory_mb", static_cast<int64_t>(UINT64_MAX >> 20));
    auto largest = ExecutorConfig::fromConfig(largestMemory);
    ASSERT_TRUE(largest.ok());
    EXPECT_EQ(largest.value().limits.maxMemoryBytes, (UINT64_MAX >> 20) * 1024 * 1024);
    
    utils::Config badFlag;
    badFlag.set("sandbox.enforce_policy", "sometimes");
    EXPECT_TRUE(ExecutorConfig::fromConfig(badFlag).failed());
}
