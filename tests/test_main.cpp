#include <QtTest/QtTest>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>

#include "utils/TestUtils.hpp"
#include "../src/core/common/Logger.hpp"

// Forward declarations of test classes that are defined in separate compilation units
extern int runTestExpected(int argc, char** argv);
extern int runTestConfig(int argc, char** argv);
extern int runTestJobStateStore(int argc, char** argv);
extern int runTestModelProvisioner(int argc, char** argv);
extern int runTestEngineRunner(int argc, char** argv);
extern int runTestTranscriptNormalizer(int argc, char** argv);
extern int runTestTranscriptionPipeline(int argc, char** argv);

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    Scribe::Logger::instance().initialize("scribe-tests.log", Scribe::Logger::Level::Trace);
    Scribe::Test::TestUtils::initializeTestEnvironment();

    int totalResult = 0;
    int testCount = 0;
    int passedTests = 0;

    struct TestInfo {
        const char* name;
        int (*function)(int, char**);
    };

    TestInfo tests[] = {
        {"Expected", runTestExpected},
        {"Config", runTestConfig},
        {"JobStateStore", runTestJobStateStore},
        {"ModelProvisioner", runTestModelProvisioner},
        {"EngineRunner", runTestEngineRunner},
        {"TranscriptNormalizer", runTestTranscriptNormalizer},
        {"TranscriptionPipeline", runTestTranscriptionPipeline}
    };

    for (const auto& test : tests) {
        qDebug() << "\n========================================";
        qDebug() << "Running test suite:" << test.name;
        qDebug() << "========================================";

        testCount++;
        int result = test.function(argc, argv);

        if (result == 0) {
            qDebug() << "Test suite" << test.name << "PASSED";
            passedTests++;
        } else {
            qDebug() << "Test suite" << test.name << "FAILED with code" << result;
            totalResult |= result;
        }
    }

    Scribe::Test::TestUtils::cleanupTestEnvironment();

    // Summary
    qDebug() << "\n========================================";
    qDebug() << "TEST SUMMARY";
    qDebug() << "========================================";
    qDebug() << "Total test suites:" << testCount;
    qDebug() << "Passed:" << passedTests;
    qDebug() << "Failed:" << (testCount - passedTests);
    qDebug() << "Overall result:" << (totalResult == 0 ? "PASS" : "FAIL");

    return totalResult;
}
