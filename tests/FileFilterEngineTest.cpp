// =================================================================
// tests/FileFilterEngineTest.cpp
// =================================================================
// Unit tests for FileFilterEngine.

#include "Sieve/FileFilterEngine.hpp"
#include "Sieve/Logger.hpp"
#include "Sieve/PathNormalizer.hpp"
#include <iostream>
#include <cassert>

using namespace Sieve;

static FileMap makeManaged() {
    FileMap files;
    auto add = [&files](const std::string& path, bool included, bool excluded) {
        FileRecord record(path, PathNormalizer::normalizeForComparison(path));
        record.included = included;
        record.force_excluded = excluded;
        files[path] = record;
    };
    add("src/App.tsx", true, false);
    add("src/utils/format.ts", true, false);
    add("src/utils/format.test.ts", false, false);
    add("docs/README.md", false, true);
    add("package.json", false, false);
    return files;
}

static std::vector<std::string> pathsOf(const FilterResult& result) {
    std::vector<std::string> paths;
    for (const auto& record : result.files) {
        paths.push_back(record.path);
    }
    return paths;
}

class FileFilterEngineTest {
public:
    void testModes() {
        std::cout << "Testing filter modes..." << std::endl;

        FileFilterEngine engine;
        FileMap files = makeManaged();

        FilterResult all = engine.filter(files, {}, "", FilterMode::ALL, {});
        assert(all.files.size() == 5);
        assert(!all.hasErrors());

        FilterResult selected = engine.filter(files, {}, "", FilterMode::SELECTED, {});
        assert((pathsOf(selected) == std::vector<std::string>{"src/App.tsx", "src/utils/format.ts"}));

        // Patterns are ignored outside regex mode
        RegexPatterns patterns;
        patterns.title = "nothing-matches-this";
        assert(engine.filter(files, {}, "", FilterMode::ALL, patterns).files.size() == 5);

        std::cout << "✓ Filter mode test passed" << std::endl;
    }

    void testSearchTerm() {
        std::cout << "Testing search term..." << std::endl;

        FileFilterEngine engine;
        FileMap files = makeManaged();

        FilterResult result = engine.filter(files, {}, "  FORMAT ", FilterMode::ALL, {});
        assert((pathsOf(result) == std::vector<std::string>{"src/utils/format.test.ts", "src/utils/format.ts"}));

        // Search narrows the selected set, never widens it
        FilterResult narrowed = engine.filter(files, {}, "format", FilterMode::SELECTED, {});
        assert(pathsOf(narrowed) == std::vector<std::string>{"src/utils/format.ts"});

        assert(engine.filter(files, {}, "zzz", FilterMode::ALL, {}).files.empty());

        std::cout << "✓ Search term test passed" << std::endl;
    }

    void testTitleRegexes() {
        std::cout << "Testing title regexes..." << std::endl;

        FileFilterEngine engine;
        FileMap files = makeManaged();

        RegexPatterns patterns;
        patterns.title = "\\.TSX?$";
        FilterResult result = engine.filter(files, {}, "", FilterMode::REGEX, patterns);
        assert(result.files.size() == 3);

        patterns.negative_title = "\\.test\\.";
        result = engine.filter(files, {}, "", FilterMode::REGEX, patterns);
        assert((pathsOf(result) == std::vector<std::string>{"src/App.tsx", "src/utils/format.ts"}));

        std::cout << "✓ Title regex test passed" << std::endl;
    }

    void testContentRegexes() {
        std::cout << "Testing content regexes..." << std::endl;

        FileFilterEngine engine;
        FileMap files = makeManaged();
        ContentMap contents = {
            {"src/App.tsx", "export default function App() { return useState(0); }"},
            {"src/utils/format.ts", "export const format = (n: number) => n.toFixed(2);"},
            {"package.json", "{\"name\": \"demo\"}"},
        };

        RegexPatterns positive;
        positive.content = "usestate";
        FilterResult result = engine.filter(files, contents, "", FilterMode::REGEX, positive);
        // Files without content are dropped by a positive content pattern
        assert(pathsOf(result) == std::vector<std::string>{"src/App.tsx"});

        RegexPatterns negative;
        negative.negative_content = "export";
        result = engine.filter(files, contents, "", FilterMode::REGEX, negative);
        // Unknown content is kept by a negative content pattern
        assert((pathsOf(result) == std::vector<std::string>{"docs/README.md", "package.json",
                                                            "src/utils/format.test.ts"}));

        // Without any contents the content slots do not run
        assert(engine.filter(files, {}, "", FilterMode::REGEX, positive).files.size() == 5);

        std::cout << "✓ Content regex test passed" << std::endl;
    }

    void testLargeContent() {
        std::cout << "Testing content regexes on long lines..." << std::endl;

        FileFilterEngine engine;
        FileMap files = makeManaged();

        // Minified bundle: one 160 KB line after a short header
        std::string minified;
        for (int i = 0; i < 20000; ++i) {
            minified += "var a=1;";
        }
        ContentMap contents = {
            {"src/App.tsx", "import React from 'react';\n" + minified},
            {"src/utils/format.ts", std::string(200000, 'a')},
            {"package.json", "{\n  \"name\": \"demo\"\n}"},
        };
        const std::string skipped = "Skipped content lines longer than 4096 characters";

        RegexPatterns any_line;
        any_line.content = ".*";
        FilterResult result = engine.filter(files, contents, "", FilterMode::REGEX, any_line);
        assert((pathsOf(result) == std::vector<std::string>{"package.json", "src/App.tsx"}));
        assert(result.content_error && *result.content_error == skipped);

        // A match only inside the long line is not found
        RegexPatterns in_long_line;
        in_long_line.content = "var.*zzz";
        result = engine.filter(files, contents, "", FilterMode::REGEX, in_long_line);
        assert(result.files.empty());
        assert(result.content_error && *result.content_error == skipped);

        // The 'c' of "React" removes App.tsx; the skipped line cannot remove format.ts
        RegexPatterns negative;
        negative.negative_content = "(a|b)*c";
        result = engine.filter(files, contents, "", FilterMode::REGEX, negative);
        assert((pathsOf(result) == std::vector<std::string>{"docs/README.md", "package.json",
                                                            "src/utils/format.test.ts",
                                                            "src/utils/format.ts"}));
        assert(result.negative_content_error && *result.negative_content_error == skipped);
        assert(!result.content_error);

        // Anchors apply per line
        ContentMap manifest = {{"package.json", contents.at("package.json")}};
        RegexPatterns anchored;
        anchored.content = "^\\s*\"name\"";
        result = engine.filter(files, manifest, "", FilterMode::REGEX, anchored);
        assert(pathsOf(result) == std::vector<std::string>{"package.json"});
        assert(!result.hasErrors());

        std::cout << "✓ Long line content test passed" << std::endl;
    }

    void testInvalidPatterns() {
        std::cout << "Testing invalid patterns..." << std::endl;

        FileFilterEngine engine(20);
        FileMap files = makeManaged();

        RegexPatterns patterns;
        patterns.title = "([unclosed";
        patterns.negative_title = "\\.md$";
        patterns.content = std::string(21, 'a');

        FilterResult result = engine.filter(files, {}, "", FilterMode::REGEX, patterns);
        assert(result.title_error);
        assert(result.title_error->rfind("Invalid regex: ", 0) == 0);
        assert(result.content_error);
        assert(*result.content_error == "Regex pattern is too long (max 20 characters)");
        assert(!result.negative_title_error);
        assert(!result.negative_content_error);
        assert(result.hasErrors());

        // The broken slot is skipped, the valid one still applies
        assert(result.files.size() == 4);
        for (const auto& record : result.files) {
            assert(record.path != "docs/README.md");
        }

        assert(!engine.validatePattern(""));
        assert(!engine.validatePattern("^src/"));
        assert(engine.validatePattern("*"));

        std::cout << "✓ Invalid pattern test passed" << std::endl;
    }

    void testSortForDisplay() {
        std::cout << "Testing display order..." << std::endl;

        std::vector<FileRecord> files = {
            FileRecord("src/z.ts", "src/z.ts"),
            FileRecord("lib/a.ts", "lib/a.ts"),
            FileRecord("src/a/b.ts", "src/a/b.ts"),
            FileRecord("README.md", "README.md"),
        };
        FileFilterEngine::sortForDisplay(files);

        assert(files[0].path == "README.md");
        assert(files[1].path == "lib/a.ts");
        assert(files[2].path == "src/a/b.ts");
        assert(files[3].path == "src/z.ts");

        std::cout << "✓ Display order test passed" << std::endl;
    }

    void testModeNames() {
        std::cout << "Testing mode names..." << std::endl;

        assert(FileFilterEngine::parseMode("Selected") == FilterMode::SELECTED);
        assert(FileFilterEngine::parseMode(" regex ") == FilterMode::REGEX);
        assert(FileFilterEngine::parseMode("all") == FilterMode::ALL);
        assert(!FileFilterEngine::parseMode("some"));
        assert(FileFilterEngine::modeName(FilterMode::REGEX) == "regex");

        std::cout << "✓ Mode name test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running FileFilterEngine unit tests..." << std::endl;

        testModes();
        testSearchTerm();
        testTitleRegexes();
        testContentRegexes();
        testLargeContent();
        testInvalidPatterns();
        testSortForDisplay();
        testModeNames();

        std::cout << "All FileFilterEngine tests passed!" << std::endl;
    }
};

int main() {
    Logger::getInstance().setConsoleLogLevel(LogLevel::CRITICAL);

    try {
        FileFilterEngineTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All FileFilterEngine component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
