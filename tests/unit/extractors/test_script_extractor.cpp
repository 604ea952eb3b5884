//
// Created by gregorian-rayne on 10/11/26.
//

#include "syswalk/extractors/script_extractor.hpp"

#include <gtest/gtest.h>
#include <memory>

namespace syswalk::extractors
{
    class ScriptExtractorTest : public ::testing::Test {
    protected:
        void SetUp() override {
            extractor_ = std::make_unique<ScriptExtractor>();
        }

        std::vector<std::string> texts(const std::string_view content) const {
            auto result = extractor_->extract(content, "/proj/web/app.js");
            EXPECT_TRUE(result.is_ok());
            std::vector<std::string> out;
            for (const auto& ref : result.value().references) {
                out.push_back(ref.text);
            }
            return out;
        }

        std::unique_ptr<ScriptExtractor> extractor_;
    };

    TEST_F(ScriptExtractorTest, Name) {
        EXPECT_EQ(extractor_->name(), "Script");
    }

    TEST_F(ScriptExtractorTest, SupportedExtensions) {
        const auto extensions = extractor_->supported_extensions();
        EXPECT_EQ(extensions.size(), 6u);
    }

    TEST_F(ScriptExtractorTest, StaticImports) {
        const auto refs = texts(R"(
import React from 'react';
import util from './util.js';
import { a, b as c } from "../lib/helpers";
import * as ns from './ns';
import './side-effect.css';
)");

        ASSERT_EQ(refs.size(), 4u);
        EXPECT_EQ(refs[0], "./util.js");
        EXPECT_EQ(refs[1], "../lib/helpers");
        EXPECT_EQ(refs[2], "./ns");
        EXPECT_EQ(refs[3], "./side-effect.css");
    }

    TEST_F(ScriptExtractorTest, MultiLineImportClause) {
        const auto refs = texts("import {\n  one,\n  two,\n} from './many.js'\n");

        ASSERT_EQ(refs.size(), 1u);
        EXPECT_EQ(refs[0], "./many.js");
    }

    TEST_F(ScriptExtractorTest, RequireAndDynamicImport) {
        const auto refs = texts(R"(
const fs = require('fs');
const util = require( "./util" );
const lazy = await import('./lazy.mjs');
const abs = require('/shared/config.js');
)");

        ASSERT_EQ(refs.size(), 3u);
        EXPECT_EQ(refs[0], "./util");
        EXPECT_EQ(refs[1], "./lazy.mjs");
        EXPECT_EQ(refs[2], "/shared/config.js");
    }

    TEST_F(ScriptExtractorTest, ReExports) {
        const auto refs = texts(R"(
export { default } from './button.jsx';
export * from "../types";
export const answer = 42;
)");

        ASSERT_EQ(refs.size(), 2u);
        EXPECT_EQ(refs[0], "./button.jsx");
        EXPECT_EQ(refs[1], "../types");
    }

    TEST_F(ScriptExtractorTest, IgnoresLookalikes) {
        const auto refs = texts(R"(
myrequire('./nope.js');
const importer = './nope2.js';
const x = require(`./template.js`);
require('');
)");

        EXPECT_TRUE(refs.empty());
    }

    TEST_F(ScriptExtractorTest, ReferencesCarryOrigin) {
        auto result = extractor_->extract("import a from './a.js'", "/proj/web/app.js");

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().references.size(), 1u);
        EXPECT_EQ(result.value().references[0].origin, fs::path("/proj/web/app.js"));
        EXPECT_TRUE(result.value().references[0].alternatives.empty());
        EXPECT_FALSE(result.value().degraded);
    }

    TEST(ScriptSpecifierTest, FindSpecifiersKeepsBareNames) {
        const auto specs = ScriptExtractor::find_specifiers("import x from 'lodash'; require('./y')");

        ASSERT_EQ(specs.size(), 2u);
        EXPECT_EQ(specs[0], "lodash");
        EXPECT_EQ(specs[1], "./y");
    }

    TEST(LooksRelativeTest, Prefixes) {
        EXPECT_TRUE(looks_relative("./a.js"));
        EXPECT_TRUE(looks_relative("../a.js"));
        EXPECT_TRUE(looks_relative("/a.js"));
        EXPECT_FALSE(looks_relative("a.js"));
        EXPECT_FALSE(looks_relative("https://cdn.example.com/a.js"));
        EXPECT_FALSE(looks_relative("#top"));
        EXPECT_FALSE(looks_relative(""));
    }
}  // namespace syswalk::extractors
