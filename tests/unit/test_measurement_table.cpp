#include <gtest/gtest.h>
#include "scoring/measurement_table.hpp"
#include "network/metabolic_network.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <fstream>

using namespace amod;

class MeasurementTableTest : public ::testing::Test {
protected:
    MeasurementTable table;

    void SetUp() override {
        table.add("M1", "liver", 1.5, 0.01);
        table.add("M1", "plasma", -0.4, 0.3);
        table.add("M2", "liver", -1.2, 0.02);
    }

    std::string write_temp(const std::string& name, const std::string& content) {
        std::string path = ::testing::TempDir() + name;
        std::ofstream out(path);
        out << content;
        return path;
    }
};

// ==========================================
// Basic Operations Tests
// ==========================================

TEST_F(MeasurementTableTest, CountsRowsNodesAndStudies) {
    EXPECT_EQ(table.size(), 3);
    EXPECT_EQ(table.num_nodes(), 2);
    EXPECT_EQ(table.studies(), (std::vector<std::string>{"liver", "plasma"}));
}

TEST_F(MeasurementTableTest, FindReturnsStudyMap) {
    const auto* m1 = table.find("M1");
    ASSERT_NE(m1, nullptr);
    EXPECT_EQ(m1->size(), 2);
    EXPECT_DOUBLE_EQ(m1->at("liver").fold_change, 1.5);

    EXPECT_EQ(table.find("M9"), nullptr);
    EXPECT_FALSE(table.has_measurement("M9"));
}

TEST_F(MeasurementTableTest, DerivedValues) {
    StudyValue v{1.5, 0.01};
    EXPECT_NEAR(v.p_value_log10(), -2.0, 1e-12);
    EXPECT_TRUE(v.is_significant(0.05));
    EXPECT_FALSE(v.is_significant(0.01));
}

TEST_F(MeasurementTableTest, RangeAndMinimum) {
    auto range = table.fold_change_range();
    EXPECT_DOUBLE_EQ(range.first, -1.2);
    EXPECT_DOUBLE_EQ(range.second, 1.5);
    EXPECT_DOUBLE_EQ(table.min_p_value(), 0.01);
}

TEST_F(MeasurementTableTest, UnmatchedNodes) {
    NetworkNode m1;
    m1.id = "M1";
    NetworkNode r1;
    r1.id = "R1";
    r1.type = NodeType::REACTION;
    MetabolicNetwork network({m1, r1}, {{"M1", "R1"}});

    EXPECT_EQ(table.unmatched_nodes(network), (std::vector<std::string>{"M2"}));
}

// ==========================================
// Validation Tests
// ==========================================

TEST_F(MeasurementTableTest, RejectsOutOfRangePValue) {
    EXPECT_THROW(table.add("M3", "liver", 1.0, 0.0), MeasurementError);
    EXPECT_THROW(table.add("M3", "liver", 1.0, 1.5), MeasurementError);
    EXPECT_NO_THROW(table.add("M3", "liver", 1.0, 1.0));
}

TEST_F(MeasurementTableTest, RejectsNonFiniteFold) {
    EXPECT_THROW(table.add("M3", "liver", std::nan(""), 0.5), MeasurementError);
}

TEST_F(MeasurementTableTest, RejectsDuplicateRow) {
    try {
        table.add("M1", "liver", 0.2, 0.5);
        FAIL() << "Expected MeasurementError";
    } catch (const MeasurementError& e) {
        EXPECT_EQ(e.node_id(), "M1");
        EXPECT_EQ(e.study_id(), "liver");
    }
}

// ==========================================
// Serialization Tests
// ==========================================

TEST_F(MeasurementTableTest, JsonRoundTrip) {
    auto restored = MeasurementTable::from_json(table.to_json());
    EXPECT_EQ(restored.size(), table.size());
    EXPECT_EQ(restored.find("M1")->at("plasma"), table.find("M1")->at("plasma"));
}

TEST_F(MeasurementTableTest, RawFoldIsConvertedToLog2) {
    auto m = Measurement::from_json({{"node", "A"}, {"study", "s"}, {"fold", 4.0}, {"p_value", 0.2}});
    EXPECT_DOUBLE_EQ(m.value.fold_change, 2.0);

    EXPECT_THROW(Measurement::from_json({{"node", "A"}, {"study", "s"}, {"fold", -1.0}, {"p_value", 0.2}}),
                 MeasurementError);
    EXPECT_THROW(Measurement::from_json({{"node", "A"}, {"study", "s"}, {"p_value", 0.2}}),
                 MeasurementError);
}

TEST_F(MeasurementTableTest, LoadsTsv) {
    std::string path = write_temp("amod_measurements.tsv",
        "node\tstudy\tfold_change\tp_value\n"
        "# comment\n"
        "M1\tliver\t1.5\t0.01\n"
        "\n"
        "M2\tliver\t-1.2\t0.02\r\n");

    auto loaded = MeasurementTable::load(path);
    EXPECT_EQ(loaded.size(), 2);
    EXPECT_DOUBLE_EQ(loaded.find("M2")->at("liver").p_value, 0.02);
}

TEST_F(MeasurementTableTest, TsvWithBadNumberNamesTheRow) {
    std::string path = write_temp("amod_bad_measurements.tsv",
        "node\tstudy\tfold_change\tp_value\n"
        "M1\tliver\tup\t0.01\n");

    try {
        MeasurementTable::load_from_tsv(path);
        FAIL() << "Expected MeasurementError";
    } catch (const MeasurementError& e) {
        EXPECT_EQ(e.node_id(), "M1");
    }
}

TEST_F(MeasurementTableTest, TsvRequiresHeaderColumns) {
    std::string path = write_temp("amod_no_header.tsv", "a\tb\n1\t2\n");
    EXPECT_THROW(MeasurementTable::load_from_tsv(path), std::runtime_error);
}
