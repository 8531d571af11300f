// =================================================================
// tests/LocalListingClientTest.cpp
// =================================================================
// Unit tests for LocalListingClient and GlobPattern.

#include "Sieve/LocalListingClient.hpp"
#include "Sieve/GlobPattern.hpp"
#include "Sieve/Logger.hpp"
#include "Sieve/PathNormalizer.hpp"
#include <algorithm>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>

namespace fs = std::filesystem;
using namespace Sieve;

class LocalListingClientTest {
private:
    std::string test_dir;

    void setupTestFiles() {
        fs::create_directories(test_dir + "/src/utils");
        fs::create_directories(test_dir + "/node_modules/lib");
        fs::create_directories(test_dir + "/.git");
        fs::create_directories(test_dir + "/generated");

        std::ofstream(test_dir + "/src/main.ts") << "export {};";
        std::ofstream(test_dir + "/src/utils/format.ts") << "export const x = 1;";
        std::ofstream(test_dir + "/node_modules/lib/index.js") << "module.exports = {};";
        std::ofstream(test_dir + "/.git/config") << "[core]";
        std::ofstream(test_dir + "/.env") << "SECRET=1";
        std::ofstream(test_dir + "/generated/out.ts") << "// generated";
        std::ofstream(test_dir + "/README.md") << "# Demo";
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    std::vector<std::string> relativeFiles(const ListingResponse& response) const {
        std::vector<std::string> files;
        for (const auto& file : response.files) {
            auto relative = PathNormalizer::makeRelative(file, test_dir);
            assert(relative && "Listed files must sit under the project directory");
            files.push_back(*relative);
        }
        return files;
    }

    ListingRequest makeRequest(const std::string& directory) const {
        ListingRequest request;
        request.directory = directory;
        return request;
    }

public:
    LocalListingClientTest()
        : test_dir(PathNormalizer::normalizePath(
              (fs::temp_directory_path() / "sieve_local_listing_test").string())) {}

    void testBasicListing() {
        std::cout << "Testing basic listing..." << std::endl;

        setupTestFiles();

        LocalListingClient client;
        ListingResponse response = client.listFiles(makeRequest(test_dir), CancellationToken());

        assert(response.isSuccess());
        std::vector<std::string> files = relativeFiles(response);
        assert((files == std::vector<std::string>{"README.md", "generated/out.ts", "src/main.ts",
                                                   "src/utils/format.ts"}));
        assert(response.sizes.size() == response.files.size());
        assert(response.sizes[0] && *response.sizes[0] == 6);

        cleanupTestFiles();
        std::cout << "✓ Basic listing test passed" << std::endl;
    }

    void testPatternAndIgnores() {
        std::cout << "Testing pattern and ignore rules..." << std::endl;

        setupTestFiles();

        LocalListingClient client;
        client.addIgnorePattern("generated/");
        client.setIncludeDotfiles(true);

        ListingRequest request = makeRequest(test_dir);
        request.include_stats = false;
        request.pattern = "**/*.ts";
        ListingResponse response = client.listFiles(request, CancellationToken());

        std::vector<std::string> files = relativeFiles(response);
        assert((files == std::vector<std::string>{"src/main.ts", "src/utils/format.ts"}));
        assert(response.sizes.empty());

        request.pattern = "**/*";
        files = relativeFiles(client.listFiles(request, CancellationToken()));
        // Dotfiles are listed on request; .git stays excluded by name
        assert(std::find(files.begin(), files.end(), ".env") != files.end());
        assert(std::find(files.begin(), files.end(), ".git/config") == files.end());
        assert(std::find(files.begin(), files.end(), "node_modules/lib/index.js") == files.end());

        cleanupTestFiles();
        std::cout << "✓ Pattern and ignore test passed" << std::endl;
    }

    void testDirectoryValidation() {
        std::cout << "Testing directory validation..." << std::endl;

        setupTestFiles();
        LocalListingClient client;

        ListingResponse missing = client.listFiles(makeRequest(test_dir + "/nope"), CancellationToken());
        assert(missing.status == 404);
        assert(!missing.isSuccess());

        assert(client.listFiles(makeRequest("relative/dir"), CancellationToken()).status == 400);
        assert(client.listFiles(makeRequest(""), CancellationToken()).status == 400);
        assert(client.listFiles(makeRequest(test_dir + "/../x"), CancellationToken()).status == 400);

        ListingResponse not_dir = client.listFiles(makeRequest(test_dir + "/README.md"), CancellationToken());
        assert(not_dir.status == 400);
        assert(not_dir.error == "Path exists but is not a directory");

        cleanupTestFiles();
        std::cout << "✓ Directory validation test passed" << std::endl;
    }

    void testCancelledToken() {
        std::cout << "Testing cancelled listing..." << std::endl;

        setupTestFiles();
        LocalListingClient client;
        CancellationSource source;
        source.cancel();

        bool aborted = false;
        try {
            client.listFiles(makeRequest(test_dir), source.token());
        } catch (const ListingAbortedError&) {
            aborted = true;
        }
        assert(aborted);

        cleanupTestFiles();
        std::cout << "✓ Cancelled listing test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running LocalListingClient unit tests..." << std::endl;

        testBasicListing();
        testPatternAndIgnores();
        testDirectoryValidation();
        testCancelledToken();

        std::cout << "All LocalListingClient tests passed!" << std::endl;
    }
};

class GlobPatternTest {
public:
    void testBasicPatterns() {
        std::cout << "Testing basic glob patterns..." << std::endl;

        GlobPattern extension("*.ts");
        assert(extension.matches("main.ts"));
        assert(extension.matches("src/deep/main.ts"));
        assert(!extension.matches("main.tsx"));

        GlobPattern question("file?.md");
        assert(question.matches("file1.md"));
        assert(!question.matches("file10.md"));

        GlobPattern klass("[!a]*.js");
        assert(klass.matches("b.js"));
        assert(!klass.matches("a.js"));

        std::cout << "✓ Basic glob pattern test passed" << std::endl;
    }

    void testDoubleStar() {
        std::cout << "Testing ** patterns..." << std::endl;

        GlobPattern everything("**/*");
        assert(everything.matches("README.md"));
        assert(everything.matches("src/a/b/c.ts"));

        GlobPattern under("src/**");
        assert(under.matches("src/a/b.ts"));
        assert(!under.matches("lib/a.ts"));

        GlobPattern middle("src/**/test/*.ts");
        assert(middle.matches("src/test/a.ts"));
        assert(middle.matches("src/x/y/test/a.ts"));
        assert(!middle.matches("src/x/test/deeper/a.ts"));

        std::cout << "✓ ** pattern test passed" << std::endl;
    }

    void testPatternFlags() {
        std::cout << "Testing pattern flags..." << std::endl;

        GlobPattern directory("build/");
        assert(directory.isDirectoryOnly());
        assert(directory.matches("build", true));
        assert(!directory.matches("build", false));

        GlobPattern anchored("/dist");
        assert(anchored.matches("dist", true));
        assert(!anchored.matches("src/dist", true));

        assert(GlobPattern("# comment").isEmpty());
        assert(GlobPattern("   ").isEmpty());
        assert(GlobPattern("!keep.ts").isNegation());

        std::cout << "✓ Pattern flag test passed" << std::endl;
    }

    void testPatternSet() {
        std::cout << "Testing pattern sets..." << std::endl;

        GlobPatternSet set;
        set.addPattern("*.log");
        set.addPattern("!important.log");
        set.addPattern("");
        assert(set.size() == 2);

        assert(set.matches("debug.log"));
        assert(!set.matches("important.log"));
        assert(!set.matches("main.ts"));

        std::string ignore_file = (fs::temp_directory_path() / "sieve_glob_ignore").string();
        std::ofstream(ignore_file) << "# comment\n*.tmp\n\ncache/\n";
        GlobPatternSet loaded;
        assert(loaded.loadFromFile(ignore_file) == 2);
        assert(loaded.matches("a/b.tmp"));
        assert(loaded.matches("x/cache", true));
        fs::remove(ignore_file);

        assert(GlobPatternSet().loadFromFile("/definitely/not/here") == 0);

        std::cout << "✓ Pattern set test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running GlobPattern unit tests..." << std::endl;

        testBasicPatterns();
        testDoubleStar();
        testPatternFlags();
        testPatternSet();

        std::cout << "All GlobPattern tests passed!" << std::endl;
    }
};

int main() {
    Logger::getInstance().setConsoleLogLevel(LogLevel::CRITICAL);

    try {
        GlobPatternTest glob_test;
        glob_test.runAllTests();

        LocalListingClientTest listing_test;
        listing_test.runAllTests();

        std::cout << "\n🎉 All LocalListingClient component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
