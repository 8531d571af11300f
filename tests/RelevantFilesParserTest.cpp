// =================================================================
// tests/RelevantFilesParserTest.cpp
// =================================================================
// Unit tests for RelevantFilesParser and JobRecord decoding.

#include "Sieve/RelevantFilesParser.hpp"
#include "Sieve/Logger.hpp"
#include <iostream>
#include <cassert>

using namespace Sieve;

class RelevantFilesParserTest {
public:
    void testJobRecordFromJson() {
        std::cout << "Testing job record decoding..." << std::endl;

        nlohmann::json json = {
            {"id", 42},
            {"status", "failed"},
            {"response", nullptr},
            {"errorMessage", "model unavailable"}
        };
        JobRecord job = JobRecord::fromJson(json);
        assert(job.id == "42");
        assert(job.status == "failed");
        assert(job.response.empty());
        assert(job.error_message == "model unavailable");
        assert(job.metadata.is_null());
        assert(job.isTerminal());
        assert(!job.isCompleted());

        JobRecord running = JobRecord::fromJson({{"id", "job-1"}, {"status", "running"}});
        assert(!running.isTerminal());

        bool threw = false;
        try {
            JobRecord::fromJson({{"status", 3}});
        } catch (const nlohmann::json::exception&) {
            threw = true;
        }
        assert(threw);

        std::cout << "✓ Job record decoding test passed" << std::endl;
    }

    void testMetadataObject() {
        std::cout << "Testing metadata object..." << std::endl;

        RelevantFilesParser parser("/proj");
        nlohmann::json metadata = {
            {"pathData", {{"paths", nlohmann::json::array({"src/a.ts", "  ", "/proj/src/b.ts", 7})}}}
        };

        std::vector<std::string> paths = parser.pathsFromMetadata(metadata);
        assert((paths == std::vector<std::string>{"src/a.ts", "src/b.ts"}));

        std::cout << "✓ Metadata object test passed" << std::endl;
    }

    void testMetadataStrings() {
        std::cout << "Testing metadata encoded as strings..." << std::endl;

        RelevantFilesParser parser;
        nlohmann::json path_data = {{"result", {{"paths", nlohmann::json::array({"lib/x.py"})}}}};
        nlohmann::json metadata = {{"pathData", path_data.dump()}};
        nlohmann::json encoded = metadata.dump();

        assert(parser.pathsFromMetadata(encoded) == std::vector<std::string>{"lib/x.py"});
        assert(parser.pathsFromMetadata(nlohmann::json("{not json")).empty());
        assert(parser.pathsFromMetadata(nlohmann::json::object()).empty());
        assert(parser.pathsFromMetadata(nullptr).empty());

        std::cout << "✓ Metadata string test passed" << std::endl;
    }

    void testTags() {
        std::cout << "Testing file tags..." << std::endl;

        RelevantFilesParser parser("/proj");
        std::string text =
            "Relevant files:\n"
            "<file path=\"src/a.ts\"/>\n"
            "<file>  /proj/src/b.ts </file>\n"
            "<file path=\"docs/guide.md\"></file>\n";

        std::vector<std::string> paths = parser.pathsFromTags(text);
        assert((paths == std::vector<std::string>{"src/a.ts", "src/b.ts", "docs/guide.md"}));
        assert(parser.pathsFromResponseText(text) == paths);

        std::cout << "✓ File tag test passed" << std::endl;
    }

    void testLineHeuristics() {
        std::cout << "Testing line heuristics..." << std::endl;

        RelevantFilesParser parser("/proj");
        std::string text =
            "Here are the relevant files for the task:\n"
            "1. src/components/Button.tsx\n"
            "- /proj/lib/util.ts\n"
            "Note: src/ignored.ts\n"
            "# src/heading.ts\n"
            "README\n"
            "src/image.png\n"
            "see [a](src/a.ts)\n"
            "src/odd|name.ts\n"
            "config/\n"
            "\n";

        // "config/" is neither a source path nor rooted, so it is dropped too
        std::vector<std::string> paths = parser.pathsFromLines(text);
        assert((paths == std::vector<std::string>{"src/components/Button.tsx", "lib/util.ts"}));

        std::cout << "✓ Line heuristic test passed" << std::endl;
    }

    void testExtractPrefersMetadata() {
        std::cout << "Testing extraction order..." << std::endl;

        RelevantFilesParser parser;
        JobRecord job;
        job.id = "job-7";
        job.status = "completed";
        job.response = "<file path=\"from/response.ts\"/>";
        job.metadata = {{"pathData", {{"paths", nlohmann::json::array({"from/metadata.ts"})}}}};

        assert(parser.extractPaths(job) == std::vector<std::string>{"from/metadata.ts"});

        job.metadata = "{broken";
        assert(parser.extractPaths(job) == std::vector<std::string>{"from/response.ts"});

        job.response = "./src/main.cpp\n";
        assert(parser.extractPaths(job) == std::vector<std::string>{"src/main.cpp"});

        std::cout << "✓ Extraction order test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running RelevantFilesParser unit tests..." << std::endl;

        testJobRecordFromJson();
        testMetadataObject();
        testMetadataStrings();
        testTags();
        testLineHeuristics();
        testExtractPrefersMetadata();

        std::cout << "All RelevantFilesParser tests passed!" << std::endl;
    }
};

int main() {
    Logger::getInstance().setConsoleLogLevel(LogLevel::CRITICAL);

    try {
        RelevantFilesParserTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All RelevantFilesParser component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
