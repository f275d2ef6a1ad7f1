#include "branta/ExampleFile.hpp"

#include "branta/ErrorReporter.hpp"
#include "branta/internal/FileSystem.hpp"

#include "doctest/doctest.h"

#include <fstream>
#include <memory>

namespace branta {

TEST_CASE("ExampleFile read") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    fs::path path = fs::temp_directory_path() / "branta_ExampleFile_unittests.txt";

    SUBCASE("one example per line") {
        {
            std::ofstream outFile(path, std::ofstream::binary);
            outFile << "ab\r\n\naab\nb a\n";
        }
        ExampleFile file(path.string());
        REQUIRE(file.read(errorReporter));
        CHECK(errorReporter->ok());
        REQUIRE(file.examples().size() == 4);
        CHECK(file.examples()[0] == "ab");
        CHECK(file.examples()[1] == "");
        CHECK(file.examples()[2] == "aab");
        CHECK(file.examples()[3] == "b a");
        fs::remove(path);
    }
    SUBCASE("no final newline") {
        {
            std::ofstream outFile(path, std::ofstream::binary);
            outFile << "x\ny";
        }
        ExampleFile file(path.string());
        REQUIRE(file.read(errorReporter));
        REQUIRE(file.examples().size() == 2);
        CHECK(file.examples()[1] == "y");
        fs::remove(path);
    }
    SUBCASE("missing file") {
        fs::remove(path);
        ExampleFile file(path.string());
        CHECK(!file.read(errorReporter));
        CHECK(errorReporter->errorCount() == 1);
        CHECK(file.examples().empty());
    }
}

} // namespace branta
