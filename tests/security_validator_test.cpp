#include <string>

#include <boost/regex.hpp>
#include <gtest/gtest.h>

#include "execution/security_validator.hpp"

namespace codebox::execution {
namespace {

TEST(SecurityValidatorTest, AcceptsOrdinaryPrograms) {
    const SecurityValidator validator;
    EXPECT_FALSE(validator.Validate("print(\"Hello, World!\")").has_value());
    EXPECT_FALSE(validator.Validate(
        "public class Main {\n"
        "    public static void main(String[] args) {\n"
        "        System.out.println(\"Hi\");\n"
        "    }\n"
        "}\n").has_value());
    EXPECT_FALSE(validator.Validate("#include <iostream>\nint main() { std::cout << 1; }\n").has_value());
    EXPECT_FALSE(validator.Validate("console.log([1, 2, 3].map(x => x * 2));").has_value());
}

TEST(SecurityValidatorTest, RejectsJavaRuntimeAccess) {
    const SecurityValidator validator;
    const auto violation = validator.Validate("Runtime.getRuntime().exec(\"ls\");");
    ASSERT_TRUE(violation.has_value());
    EXPECT_NE(violation->find("Potentially unsafe code detected"), std::string::npos);
    EXPECT_NE(violation->find("Runtime"), std::string::npos);
}

TEST(SecurityValidatorTest, ReportsFirstMatchingRule) {
    const SecurityValidator validator;
    const auto violation = validator.Validate("import os\nos.system('ls')");
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(*violation, std::string("Potentially unsafe code detected: ") + R"(\bos\.)");
}

TEST(SecurityValidatorTest, MatchesCaseInsensitively) {
    const SecurityValidator validator;
    EXPECT_TRUE(validator.Validate("x = SUBPROCESS").has_value());
    EXPECT_TRUE(validator.Validate("const cp = require('CHILD_PROCESS');").has_value());
}

TEST(SecurityValidatorTest, RespectsWordBoundaries) {
    const SecurityValidator validator;
    EXPECT_FALSE(validator.Validate("processed = 3\nprint(processed)").has_value());
    EXPECT_FALSE(validator.Validate("evaluation = 1").has_value());
}

TEST(SecurityValidatorTest, RejectsNativeProcessPrimitives) {
    const SecurityValidator validator;
    EXPECT_TRUE(validator.Validate("int main() { system (\"ls\"); }").has_value());
    EXPECT_TRUE(validator.Validate("int main() { fork(); }").has_value());
    EXPECT_TRUE(validator.Validate("execvp(argv[0], argv);").has_value());
    EXPECT_TRUE(validator.Validate("FILE* f = popen(\"ls\", \"r\");").has_value());
}

TEST(SecurityValidatorTest, EnforcesLengthInCodePoints) {
    const SecurityValidator validator(100);
    EXPECT_FALSE(validator.Validate(std::string(100, 'a')).has_value());

    const auto violation = validator.Validate(std::string(101, 'a'));
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(*violation, "Code exceeds maximum length limit");

    std::string accented;
    for (int i = 0; i < 100; ++i) {
        accented += "\xC3\xA9";
    }
    EXPECT_FALSE(validator.Validate(accented).has_value());
}

TEST(SecurityValidatorTest, OversizedInputIsRejectedAsTooLongBeforeScanning) {
    const SecurityValidator validator(100);
    const auto violation = validator.Validate("Runtime " + std::string(5000, 'a'));
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(*violation, "Code exceeds maximum length limit");
}

TEST(SecurityValidatorTest, LongWordRunAfterDenyPrefixIsRejectedAsTooLong) {
    const SecurityValidator validator;
    const auto violation = validator.Validate("execv" + std::string(50000, 'a'));
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(*violation, "Code exceeds maximum length limit");
}

TEST(SecurityValidatorTest, LargeConfiguredLimitStillScansLongInput) {
    const SecurityValidator validator(200000);
    EXPECT_FALSE(validator.Validate("execv" + std::string(150000, 'a')).has_value());

    const auto violation = validator.Validate("execv" + std::string(150000, 'a') + "(argv)");
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(*violation, std::string("Potentially unsafe code detected: ") + R"(\bexecv\w*\s*\()");
}

TEST(SecurityValidatorTest, ExtraPatternsAreApplied) {
    const SecurityValidator validator(10000, {R"(\bctypes\b)"});
    const auto violation = validator.Validate("import ctypes");
    ASSERT_TRUE(violation.has_value());
    EXPECT_NE(violation->find("ctypes"), std::string::npos);
}

TEST(SecurityValidatorTest, InvalidExtraPatternThrows) {
    EXPECT_THROW(SecurityValidator(10000, {"("}), boost::regex_error);
}

TEST(SecurityValidatorTest, DefaultPatternListIsStable) {
    EXPECT_EQ(SecurityValidator::DefaultPatterns().size(), 20u);
}

}  // namespace
}  // namespace codebox::execution
