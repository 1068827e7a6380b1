#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "../src/common/NeuroQAPExceptions.h"
#include "../src/io/TextDataIO.h"

using namespace neuroqap;
using namespace neuroqap::io;

class TextDataIOTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "neuroqap_text_io_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string WriteFile(const std::string& name, const std::string& contents) {
        auto path = (test_dir / name).string();
        std::ofstream file(path, std::ios::binary);
        file << contents;
        return path;
    }

    std::filesystem::path test_dir;
};

TEST_F(TextDataIOTest, ParseFloatAcceptsDecimalNumbers) {
    EXPECT_EQ(TextDataIO::ParseFloat("3.5"), 3.5);
    EXPECT_EQ(TextDataIO::ParseFloat("  -2.25\t"), -2.25);
    EXPECT_EQ(TextDataIO::ParseFloat("1e-3"), 1e-3);
    EXPECT_EQ(TextDataIO::ParseFloat("42"), 42.0);
}

TEST_F(TextDataIOTest, ParseFloatRejectsEverythingElse) {
    EXPECT_FALSE(TextDataIO::ParseFloat("").has_value());
    EXPECT_FALSE(TextDataIO::ParseFloat("   ").has_value());
    EXPECT_FALSE(TextDataIO::ParseFloat("-- warning --").has_value());
    EXPECT_FALSE(TextDataIO::ParseFloat("3.5 volumes").has_value());
    EXPECT_FALSE(TextDataIO::ParseFloat("1 2").has_value());
    EXPECT_FALSE(TextDataIO::ParseFloat("NaN").has_value());
    EXPECT_FALSE(TextDataIO::ParseFloat("inf").has_value());
}

TEST_F(TextDataIOTest, PassFloatsSkipsNonNumericLines) {
    auto values = TextDataIO::PassFloats("3.5\n-- warning --\n2.1\nNaN");

    EXPECT_EQ(values, (std::vector<double>{3.5, 2.1}));
}

TEST_F(TextDataIOTest, PassFloatsHandlesToolOutput) {
    const std::string output =
        "++ 3dToutcount: AFNI version=AFNI_23.0.00\n"
        "++ 1 dataset, 4 time points\r\n"
        "0.0012\r\n"
        "0.0031\r"
        "0\n"
        "\n"
        "0.25\n";

    auto values = TextDataIO::PassFloats(output);

    EXPECT_EQ(values, (std::vector<double>{0.0012, 0.0031, 0.0, 0.25}));
    EXPECT_TRUE(TextDataIO::PassFloats("").empty());
    EXPECT_TRUE(TextDataIO::PassFloats("** FATAL ERROR: no dataset\n").empty());
}

TEST_F(TextDataIOTest, SplitLinesHandlesAllLineBreaks) {
    auto lines = TextDataIO::SplitLines("a\nb\r\nc\rd\n");

    EXPECT_EQ(lines, (std::vector<std::string>{"a", "b", "c", "d"}));
}

TEST_F(TextDataIOTest, SplitLinesHandlesControlSeparators) {
    auto lines = TextDataIO::SplitLines("a\vb\fc\x1c" "d\x1d" "e\x1e" "f");

    EXPECT_EQ(lines, (std::vector<std::string>{"a", "b", "c", "d", "e", "f"}));
    EXPECT_FALSE(TextDataIO::IsLineBreak('\t'));
    EXPECT_EQ(TextDataIO::PassFloats("0.1\f0.2\v0.3"), (std::vector<double>{0.1, 0.2, 0.3}));
}

TEST_F(TextDataIOTest, ReadNumericTableInfersWidth) {
    auto path = WriteFile("table.txt", "# header\n1 2 3\n\n4 5 6 # trailing\n");

    auto rows = TextDataIO::ReadNumericTable(path);

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1], (std::vector<double>{4, 5, 6}));
}

TEST_F(TextDataIOTest, ReadNumericTableReportsBadRows) {
    auto path = WriteFile("ragged.txt", "1 2 3\n# ok\n4 5\n");

    try {
        TextDataIO::ReadNumericTable(path);
        FAIL() << "Expected MalformedInputException";
    } catch (const MalformedInputException& e) {
        EXPECT_EQ(e.GetLineNumber(), 3);
        EXPECT_EQ(e.GetCategory(), NeuroQAPException::Category::MalformedData);
    }
}

TEST_F(TextDataIOTest, ScalarFileRoundTrip) {
    auto path = (test_dir / "values.txt").string();
    std::vector<double> values = {0.0, 0.1, 1.0 / 3.0, 12345.678};

    TextDataIO::WriteScalarFile(path, values);
    auto read_back = TextDataIO::ReadScalarFile(path);

    ASSERT_EQ(read_back.size(), values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        EXPECT_DOUBLE_EQ(read_back[i], values[i]);
    }

    auto text = TextDataIO::ReadTextFile(path);
    EXPECT_NE(text.find("1.000000000000000056e-01"), std::string::npos);
}

TEST_F(TextDataIOTest, ScalarFileRejectsText) {
    auto path = WriteFile("scalars.txt", "0.1\n0.2\nfoo\n");

    EXPECT_THROW(TextDataIO::ReadScalarFile(path), MalformedInputException);
}

TEST_F(TextDataIOTest, MissingFilesRaiseIOErrors) {
    auto missing = (test_dir / "missing.txt").string();

    EXPECT_THROW(TextDataIO::ReadTextFile(missing), TextIOException);
    EXPECT_THROW(TextDataIO::ReadScalarFile(missing), TextIOException);
    EXPECT_THROW(TextDataIO::WriteScalarFile((test_dir / "no_dir" / "out.txt").string(), {1.0}),
                 TextIOException);
}
