#include <gtest/gtest.h>
#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include "../src/common/NeuroQAPExceptions.h"
#include "../src/io/TextDataIO.h"
#include "../src/temporal_qc/MetricsReport.h"
#include "../src/temporal_qc/TemporalQC.h"

using namespace neuroqap;
using namespace neuroqap::temporal;

class TemporalQCTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "neuroqap_temporal_qc_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string WriteFile(const std::string& name, const std::string& contents) {
        auto path = (test_dir / name).string();
        std::ofstream file(path);
        file << contents;
        return path;
    }

    static TransformSequence TranslationSequence(const std::vector<double>& x_positions) {
        TransformSequence transforms;
        for (double x : x_positions) {
            TransformMatrix matrix;
            matrix.SetIdentity();
            matrix[0][3] = x;
            transforms.push_back(matrix);
        }
        return transforms;
    }

    // 8x8x1 grid, 6 timepoints, voxel i has mean 100 + i and std i + 1
    static std::shared_ptr<const MaskedVoxelSeries> CreateVoxelSeries() {
        const size_t num_timepoints = 6;
        MaskedVoxelSeries::Image4DType volumes;
        for (size_t t = 0; t < num_timepoints; ++t) {
            auto volume = std::make_unique<MaskedVoxelSeries::VolumeType>(8, 8, 1);
            for (size_t i = 0; i < volume->GetNumberOfVoxels(); ++i) {
                const double sign = (t % 2 == 0) ? -1.0 : 1.0;
                (*volume)[i] = static_cast<float>(100.0 + i + sign * (i + 1.0));
            }
            volumes.push_back(std::move(volume));
        }

        MaskedVoxelSeries::MaskType mask(8, 8, 1);
        mask.Fill(1);

        return std::make_shared<MaskedVoxelSeries>(std::move(volumes), std::move(mask));
    }

    static ScanInputs CreateScan(const std::string& participant) {
        ScanInputs inputs;
        inputs.participant = participant;
        inputs.session = "ses-1";
        inputs.series = "rest_1";
        inputs.transforms = TranslationSequence({0.0, 0.1, 0.5, 0.5, 0.6, 0.6});
        inputs.outlier_values = std::vector<double>{0.001, 0.002, 0.001, 0.2, 0.002, 0.001};
        inputs.quality_values = std::vector<double>{0.01, 0.011, 0.012, 0.01, 0.011, 0.012};
        return inputs;
    }

    std::filesystem::path test_dir;
};

TEST_F(TemporalQCTest, DefaultParameters) {
    auto params = TemporalQC::GetDefaultParameters();

    EXPECT_DOUBLE_EQ(params.rmax, 80.0);
    EXPECT_DOUBLE_EQ(params.fd_threshold, 0.2);
    EXPECT_DOUBLE_EQ(params.iqr_multiplier, 1.5);
    EXPECT_DOUBLE_EQ(params.nuisance_percentile, 98.0);
    EXPECT_EQ(params.min_nuisance_voxels, 50u);
    EXPECT_EQ(params.zero_variance_policy, ZeroVariancePolicy::Exclude);
    EXPECT_NO_THROW(TemporalQC::ValidateParameters(params));
}

TEST_F(TemporalQCTest, InvalidParametersAreRejected) {
    auto params = TemporalQC::GetDefaultParameters();
    params.rmax = -1.0;
    EXPECT_THROW(TemporalQC processor(params), ConfigurationException);

    params = TemporalQC::GetDefaultParameters();
    params.nuisance_percentile = 100.0;
    EXPECT_THROW(TemporalQC::ValidateParameters(params), ConfigurationException);

    params = TemporalQC::GetDefaultParameters();
    params.iqr_multiplier = 0.0;
    EXPECT_THROW(TemporalQC::ValidateParameters(params), ConfigurationException);

    params = TemporalQC::GetDefaultParameters();
    params.min_nuisance_voxels = 0;
    EXPECT_THROW(TemporalQC::ValidateParameters(params), ConfigurationException);
}

TEST_F(TemporalQCTest, ProcessComputesEveryFamily) {
    ScanInputs inputs = CreateScan("sub-01");
    inputs.voxel_series = CreateVoxelSeries();

    TemporalQC processor;
    auto metrics = processor.Process(inputs);

    EXPECT_EQ(metrics.participant, "sub-01");
    EXPECT_EQ(metrics.num_timepoints, 6u);

    // FD = {0, 0.1, 0.4, 0, 0.1, 0}
    ASSERT_TRUE(metrics.displacement.has_value());
    ASSERT_EQ(metrics.fd_series.size(), 6u);
    EXPECT_NEAR(metrics.displacement->mean_fd, 0.1, 1e-9);
    EXPECT_NEAR(metrics.displacement->max_fd, 0.4, 1e-9);
    EXPECT_EQ(metrics.displacement->num_fd_above_threshold, 1);
    EXPECT_NEAR(metrics.displacement->percent_fd_above_threshold, 100.0 / 6.0, 1e-9);

    ASSERT_TRUE(metrics.outlier_fraction.has_value());
    EXPECT_NEAR(metrics.outlier_fraction->mean, 0.207 / 6.0, 1e-12);
    EXPECT_NEAR(metrics.outlier_fraction->percent_outliers, 1.0 / 6.0, 1e-12);

    ASSERT_TRUE(metrics.quality.has_value());
    EXPECT_NEAR(metrics.quality->mean, 0.011, 1e-12);

    ASSERT_TRUE(metrics.voxel.has_value());
    EXPECT_GE(metrics.voxel->gcor, 0.0);
    EXPECT_NEAR(metrics.voxel->nuisance_mean_std, 63.5, 1e-9);
    EXPECT_GT(metrics.voxel->mean_sfs, 0.0);
}

TEST_F(TemporalQCTest, AbsentInputsLeaveFamiliesUnset) {
    ScanInputs inputs;
    inputs.participant = "sub-02";
    inputs.quality_values = std::vector<double>{0.02, 0.03, 0.025};

    TemporalQC processor;
    auto metrics = processor.Process(inputs);

    EXPECT_FALSE(metrics.displacement.has_value());
    EXPECT_FALSE(metrics.outlier_fraction.has_value());
    EXPECT_FALSE(metrics.voxel.has_value());
    ASSERT_TRUE(metrics.quality.has_value());
    EXPECT_EQ(metrics.num_timepoints, 3u);
}

TEST_F(TemporalQCTest, VoxelMetricsCanBeDisabled) {
    ScanInputs inputs = CreateScan("sub-03");
    inputs.voxel_series = CreateVoxelSeries();

    auto params = TemporalQC::GetDefaultParameters();
    params.compute_voxel_metrics = false;
    auto metrics = TemporalQC(params).Process(inputs);

    EXPECT_FALSE(metrics.voxel.has_value());
    EXPECT_TRUE(metrics.displacement.has_value());
}

TEST_F(TemporalQCTest, PrecomputedDisplacementIsUsedWithoutTransforms) {
    ScanInputs inputs;
    inputs.participant = "sub-04";
    inputs.precomputed_displacement = std::vector<double>{0.0, 0.3, 0.1};

    auto metrics = TemporalQC().Process(inputs);

    ASSERT_TRUE(metrics.displacement.has_value());
    EXPECT_NEAR(metrics.displacement->max_fd, 0.3, 1e-12);
    EXPECT_EQ(metrics.displacement->num_fd_above_threshold, 1);
}

TEST_F(TemporalQCTest, NumericFailureNamesTheScan) {
    ScanInputs inputs;
    inputs.participant = "sub-05";
    inputs.session = "ses-2";
    inputs.series = "rest_2";
    inputs.outlier_values = std::vector<double>();

    try {
        TemporalQC().Process(inputs);
        FAIL() << "Expected NumericException";
    } catch (const NumericException& e) {
        EXPECT_EQ(e.GetScanIdentifier(), "sub-05/ses-2/rest_2");
        EXPECT_NE(std::string(e.what()).find("sub-05/ses-2/rest_2"), std::string::npos);
    }
}

TEST_F(TemporalQCTest, BatchIsolatesFailingScans) {
    BatchTemporalQC::BatchOptions options;
    options.verbose = false;
    options.save_summary_report = true;
    options.report_file = (test_dir / "report.csv").string();
    options.log_file = (test_dir / "batch.log").string();

    BatchTemporalQC batch(options);
    batch.AddJob(CreateScan("sub-01"));

    ScanInputs broken = CreateScan("sub-02");
    broken.quality_values = std::vector<double>();
    batch.AddJob(broken);

    batch.AddJob(CreateScan("sub-03"));

    EXPECT_FALSE(batch.ProcessAllJobs());

    auto stats = batch.GetBatchStatistics();
    EXPECT_EQ(stats.total_jobs, 3);
    EXPECT_EQ(stats.completed_jobs, 2);
    EXPECT_EQ(stats.failed_jobs, 1);

    auto failed = batch.GetFailedJobs();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].inputs.participant, "sub-02");
    EXPECT_NE(failed[0].error_message.find("sub-02"), std::string::npos);

    auto rows = MetricsReport::ReadMetricsCSV(options.report_file);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].participant, "sub-01");
    EXPECT_EQ(rows[1].participant, "sub-03");

    auto log = io::TextDataIO::ReadTextFile(options.log_file);
    EXPECT_NE(log.find("FAILED"), std::string::npos);
}

TEST_F(TemporalQCTest, BatchStopsOnFirstErrorWhenRequested) {
    BatchTemporalQC::BatchOptions options;
    options.verbose = false;
    options.save_summary_report = false;
    options.continue_on_error = false;

    BatchTemporalQC batch(options);
    ScanInputs broken = CreateScan("sub-01");
    broken.outlier_values = std::vector<double>();
    batch.AddJob(broken);
    batch.AddJob(CreateScan("sub-02"));

    EXPECT_FALSE(batch.ProcessAllJobs());
    EXPECT_TRUE(batch.GetCompletedJobs().empty());
}

TEST_F(TemporalQCTest, ParallelBatchMatchesSequentialResults) {
    BatchTemporalQC::BatchOptions options;
    options.verbose = false;
    options.save_summary_report = false;
    options.max_parallel_jobs = 3;

    BatchTemporalQC batch(options);
    for (int i = 0; i < 6; ++i) {
        batch.AddJob(CreateScan("sub-" + std::to_string(i)));
    }

    std::atomic<int> finished{0};
    batch.SetBatchProgressCallback([&finished](const BatchTemporalQC::BatchJob&, double progress) {
        if (progress >= 1.0) {
            ++finished;
        }
    });

    EXPECT_TRUE(batch.ProcessAllJobs());
    EXPECT_EQ(finished.load(), 6);

    auto expected = TemporalQC().Process(CreateScan("sub-0"));
    for (const auto& job : batch.GetJobs()) {
        ASSERT_TRUE(job.completed);
        EXPECT_EQ(job.metrics.fd_series, expected.fd_series);
    }
}

TEST_F(TemporalQCTest, FileBackedJobsReadToolOutput) {
    auto motion = WriteFile("sub-01_rest.1D",
                            "1 0 0 0 0 1 0 0 0 0 1 0\n"
                            "1 0 0 0.3 0 1 0 0 0 0 1 0\n"
                            "1 0 0 0.3 0 1 0 0 0 0 1 0\n");
    auto outliers = WriteFile("outcount.txt", "++ 3dToutcount\n0.01\n0.02\n0.015\n");
    auto quality = WriteFile("tqual.txt", "++ 3dTqual\n0.004\n0.005\n0.006\n");
    auto rel_rms = WriteFile("prefix_rel.rms", "0.0\n0.05\n0.25\n");

    BatchTemporalQC::BatchOptions options;
    options.verbose = false;
    options.save_summary_report = false;

    BatchTemporalQC batch(options);
    ScanInputs identity;
    identity.participant = "sub-01";
    batch.AddFileJob(identity, motion, outliers, quality);
    identity.participant = "sub-02";
    batch.AddFileJob(identity, rel_rms);
    identity.participant = "sub-03";
    batch.AddFileJob(identity, (test_dir / "missing.1D").string());

    EXPECT_FALSE(batch.ProcessAllJobs());

    const auto& jobs = batch.GetJobs();
    ASSERT_TRUE(jobs[0].completed);
    EXPECT_NEAR(jobs[0].metrics.displacement->max_fd, 0.3, 1e-9);
    EXPECT_NEAR(jobs[0].metrics.outlier_fraction->mean, 0.015, 1e-12);
    EXPECT_NEAR(jobs[0].metrics.quality->mean, 0.005, 1e-12);

    ASSERT_TRUE(jobs[1].completed);
    EXPECT_NEAR(jobs[1].metrics.displacement->max_fd, 0.25, 1e-12);

    EXPECT_FALSE(jobs[2].completed);
    EXPECT_FALSE(jobs[2].error_message.empty());
}

TEST_F(TemporalQCTest, MetricsTableRoundTrip) {
    ScanInputs with_voxels = CreateScan("sub-01");
    with_voxels.voxel_series = CreateVoxelSeries();

    TemporalQC processor;
    std::vector<TemporalQCMetrics> records = {processor.Process(with_voxels),
                                              processor.Process(CreateScan("sub-02"))};

    auto path = (test_dir / "metrics.csv").string();
    MetricsReport::WriteMetricsCSV(path, records);
    auto rows = MetricsReport::ReadMetricsCSV(path);

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].session, "ses-1");
    EXPECT_EQ(rows[0].series, "rest_1");
    EXPECT_DOUBLE_EQ(rows[0].values.at("RMSD (Mean)"), records[0].displacement->mean_fd);
    EXPECT_DOUBLE_EQ(rows[0].values.at("GCOR"), records[0].voxel->gcor);
    EXPECT_DOUBLE_EQ(rows[0].values.at("Quality (Mean)"), records[0].quality->mean);

    // Absent voxel family leaves empty cells
    EXPECT_EQ(rows[1].values.count("GCOR"), 0u);
    EXPECT_EQ(rows[1].values.count("RMSD (Mean)"), 1u);
}

TEST_F(TemporalQCTest, ReadMetricsRejectsMalformedTables) {
    auto no_ids = WriteFile("no_ids.csv", "Participant,GCOR\nsub-01,0.1\n");
    EXPECT_THROW(MetricsReport::ReadMetricsCSV(no_ids), MalformedInputException);

    auto ragged = WriteFile("ragged.csv", "Participant,Session,Series,GCOR\nsub-01,s,r\n");
    try {
        MetricsReport::ReadMetricsCSV(ragged);
        FAIL() << "Expected MalformedInputException";
    } catch (const MalformedInputException& e) {
        EXPECT_EQ(e.GetLineNumber(), 2);
    }

    auto text = WriteFile("text.csv", "Participant,Session,Series,GCOR\nsub-01,s,r,high\n");
    EXPECT_THROW(MetricsReport::ReadMetricsCSV(text), MalformedInputException);
}

TEST_F(TemporalQCTest, QuotedIdentifiersSurviveTheTable) {
    EXPECT_EQ(MetricsReport::EscapeCSVField("plain"), "plain");
    EXPECT_EQ(MetricsReport::EscapeCSVField("a,b"), "\"a,b\"");
    EXPECT_EQ(MetricsReport::SplitCSVLine("\"a,b\",\"say \"\"hi\"\"\",3"),
              (std::vector<std::string>{"a,b", "say \"hi\"", "3"}));
}

TEST_F(TemporalQCTest, IdentifiersWithLineBreaksAreReadBack) {
    TemporalQC processor;
    ScanInputs scan = CreateScan("sub-01");
    scan.session = "ses\n1";
    scan.series = "rest \"a,b\"\r\nrun";
    std::vector<TemporalQCMetrics> records = {processor.Process(scan),
                                              processor.Process(CreateScan("sub-02"))};

    auto path = (test_dir / "multiline.csv").string();
    MetricsReport::WriteMetricsCSV(path, records);
    auto rows = MetricsReport::ReadMetricsCSV(path);

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].participant, "sub-01");
    EXPECT_EQ(rows[0].session, "ses\n1");
    EXPECT_EQ(rows[0].series, "rest \"a,b\"\r\nrun");
    EXPECT_DOUBLE_EQ(rows[0].values.at("RMSD (Mean)"), records[0].displacement->mean_fd);
    EXPECT_EQ(rows[1].participant, "sub-02");

    // Line numbers of later rows still count every physical line
    auto ragged = WriteFile("ragged_multiline.csv",
                            "Participant,Session,Series,GCOR\n\"sub\n01\",s,r,0.1\nsub-02,s\n");
    try {
        MetricsReport::ReadMetricsCSV(ragged);
        FAIL() << "Expected MalformedInputException";
    } catch (const MalformedInputException& e) {
        EXPECT_EQ(e.GetLineNumber(), 4);
    }
}

TEST_F(TemporalQCTest, CorrelateMetricTablesJoinsOnScanIdentity) {
    auto old_path = WriteFile("old.csv",
                              "Participant,Session,Series,GCOR,RMSD (Mean),Quality\n"
                              "s1,1,rest,0.1,0.20,5\n"
                              "s2,1,rest,0.2,0.10,5\n"
                              "s3,1,rest,0.3,0.40,5\n"
                              "s9,1,rest,9.0,9.00,5\n");
    auto new_path = WriteFile("new.csv",
                              "Participant,Session,Series,GCOR,Mean FD,Quality\n"
                              "s3,1,rest,0.6,0.40,7\n"
                              "s1,1,rest,0.2,0.20,7\n"
                              "s2,1,rest,0.4,0.10,7\n");

    auto correlations = MetricsReport::CorrelateMetricTables(
        MetricsReport::ReadMetricsCSV(old_path), MetricsReport::ReadMetricsCSV(new_path),
        {"Mean FD,RMSD (Mean)"});

    ASSERT_EQ(correlations.count("GCOR"), 1u);
    EXPECT_NEAR(correlations.at("GCOR"), 1.0, 1e-12);
    ASSERT_EQ(correlations.count("RMSD (Mean)"), 1u);
    EXPECT_NEAR(correlations.at("RMSD (Mean)"), 1.0, 1e-12);

    // Constant columns have no defined correlation
    EXPECT_EQ(correlations.count("Quality"), 0u);
}

TEST_F(TemporalQCTest, CorrelateMetricTablesRequiresCommaSeparatedReplacements) {
    std::vector<MetricsRow> rows(2);

    EXPECT_THROW(MetricsReport::CorrelateMetricTables(rows, rows, {"no separator"}),
                 ConfigurationException);
}

TEST_F(TemporalQCTest, CorrelateMetricTablesNeedsTwoJoinedRows) {
    MetricsRow old_row;
    old_row.participant = "s1";
    old_row.values["GCOR"] = 0.1;
    MetricsRow new_row = old_row;
    new_row.values["GCOR"] = 0.2;

    auto correlations = MetricsReport::CorrelateMetricTables({old_row}, {new_row});

    EXPECT_TRUE(correlations.empty());
}
