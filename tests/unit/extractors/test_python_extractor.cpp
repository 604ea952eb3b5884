//
// Created by gregorian-rayne on 10/11/26.
//

#include "syswalk/extractors/python_extractor.hpp"

#include <gtest/gtest.h>

namespace syswalk::extractors
{
    TEST(PythonImportParseTest, RelativeImportsOnly) {
        const auto result = parse_relative_imports(R"(
import os
from os import path
from __future__ import annotations
from . import sibling
from .pkg import thing
from ..lib.mod import (
    a,
    b,
)
)");

        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        const auto& imports = result.value();
        ASSERT_EQ(imports.size(), 2u);
        EXPECT_EQ(imports[0], (RelativeImport{1, "pkg"}));
        EXPECT_EQ(imports[1], (RelativeImport{2, "lib.mod"}));
    }

    TEST(PythonImportParseTest, NestedAndCompoundStatements) {
        const auto result = parse_relative_imports(
            "def load():\n"
            "    from .plugins import registry\n"
            "    return registry\n"
            "if True: from .flags import FLAG\n"
            "x = 1; from ...root import base\n"
        );

        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        const auto& imports = result.value();
        ASSERT_EQ(imports.size(), 3u);
        EXPECT_EQ(imports[0], (RelativeImport{1, "plugins"}));
        EXPECT_EQ(imports[1], (RelativeImport{1, "flags"}));
        EXPECT_EQ(imports[2], (RelativeImport{3, "root"}));
    }

    TEST(PythonImportParseTest, IgnoresStringsAndComments) {
        const auto result = parse_relative_imports(R"(
# from .commented import nothing
doc = """
from .docstring import nothing
"""
msg = 'from .quoted import nothing'
value = data["from"]
)");

        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        EXPECT_TRUE(result.value().empty());
    }

    TEST(PythonImportParseTest, LineContinuation) {
        const auto result = parse_relative_imports("from .a \\\n    import b\n");

        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        ASSERT_EQ(result.value().size(), 1u);
        EXPECT_EQ(result.value()[0].module, "a");
    }

    TEST(PythonImportParseTest, UnterminatedString) {
        const auto result = parse_relative_imports("x = 'oops\nfrom .a import b\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
        EXPECT_EQ(result.error().message(), "unterminated string literal");
        EXPECT_EQ(result.error().context().value(), "line 1");
    }

    TEST(PythonImportParseTest, UnclosedBracket) {
        const auto result = parse_relative_imports("from .a import b\ncall(1,\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().message(), "'(' was never closed");
        EXPECT_EQ(result.error().context().value(), "line 2");
    }

    TEST(PythonImportParseTest, MismatchedBracket) {
        const auto result = parse_relative_imports("x = [1, 2)\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().message(), "closing ')' does not match '['");
    }

    TEST(PythonImportParseTest, BrokenFromImport) {
        EXPECT_TRUE(parse_relative_imports("from .a\n").is_err());
        EXPECT_TRUE(parse_relative_imports("from import x\n").is_err());
        EXPECT_TRUE(parse_relative_imports("from .a. import x\n").is_err());
    }

    TEST(PythonImportScanTest, LexicalFallback) {
        const auto imports = scan_relative_imports(
            "from .alpha import x\n"
            "from ..beta.gamma import y\n"
            "from .. import z\n"
            "from os import path\n"
        );

        ASSERT_EQ(imports.size(), 2u);
        EXPECT_EQ(imports[0], (RelativeImport{1, "alpha"}));
        EXPECT_EQ(imports[1], (RelativeImport{2, "beta.gamma"}));
    }

    TEST(PythonImportScanTest, LexicalFallbackOnLongModuleName) {
        const auto name = std::string(300000, 'a');
        const auto imports = scan_relative_imports("from ." + name + " import x\nfrom .b import y\n");

        ASSERT_EQ(imports.size(), 2u);
        EXPECT_EQ(imports[0].module.size(), name.size());
        EXPECT_EQ(imports[1], (RelativeImport{1, "b"}));
    }

    TEST(PythonImportScanTest, LexicalFallbackNeedsSeparators) {
        const auto imports = scan_relative_imports("from.a import x\nfrom .a importer\nfrom .a\timport\ty\n");

        ASSERT_EQ(imports.size(), 1u);
        EXPECT_EQ(imports[0], (RelativeImport{1, "a"}));
    }

    TEST(PythonModuleCandidatesTest, LevelsMapToParentDirectories) {
        const auto one = module_candidates(RelativeImport{1, "pkg.mod"});
        ASSERT_EQ(one.size(), 2u);
        EXPECT_EQ(one[0], "./pkg/mod.py");
        EXPECT_EQ(one[1], "./pkg/mod");

        const auto three = module_candidates(RelativeImport{3, "util"});
        EXPECT_EQ(three[0], "../../util.py");
        EXPECT_EQ(three[1], "../../util");
    }

    class PythonExtractorTest : public ::testing::Test {
    protected:
        PythonExtractor extractor_;
    };

    TEST_F(PythonExtractorTest, Name) {
        EXPECT_EQ(extractor_.name(), "Python");
        EXPECT_EQ(extractor_.supported_extensions().size(), 1u);
    }

    TEST_F(PythonExtractorTest, ExtractBuildsModuleAndPackageCandidates) {
        auto result = extractor_.extract("from .models import User\n", "/proj/app/views.py");

        ASSERT_TRUE(result.is_ok());
        const auto& extraction = result.value();
        EXPECT_FALSE(extraction.degraded);
        ASSERT_EQ(extraction.references.size(), 1u);
        EXPECT_EQ(extraction.references[0].origin, fs::path("/proj/app/views.py"));
        EXPECT_EQ(extraction.references[0].text, "./models.py");
        ASSERT_EQ(extraction.references[0].alternatives.size(), 1u);
        EXPECT_EQ(extraction.references[0].alternatives[0], "./models");
    }

    TEST_F(PythonExtractorTest, SyntaxErrorFallsBackToScan) {
        auto result = extractor_.extract("from .models import User\nprint('oops\n", "/proj/app/views.py");

        ASSERT_TRUE(result.is_ok());
        const auto& extraction = result.value();
        EXPECT_TRUE(extraction.degraded);
        EXPECT_NE(extraction.degraded_reason.find("unterminated string literal"), std::string::npos);
        ASSERT_EQ(extraction.references.size(), 1u);
        EXPECT_EQ(extraction.references[0].text, "./models.py");
    }
}  // namespace syswalk::extractors
