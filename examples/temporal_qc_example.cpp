/**
 * @file temporal_qc_example.cpp
 * @brief Command-line front end for the NeuroQAP temporal QC metrics
 */

#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "../src/common/NeuroQAPExceptions.h"
#include "../src/external/AfniToolRunner.h"
#include "../src/temporal_qc/MetricsReport.h"
#include "../src/temporal_qc/TemporalQC.h"

using namespace neuroqap;
using namespace neuroqap::temporal;

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <command> [arguments] [options]\n";
    std::cout << "\nCommands:\n";
    std::cout << "  fd <motion_file>                      : Write the framewise displacement file\n";
    std::cout << "  scan <participant> <session> <series> : Compute the temporal QC record of one scan\n";
    std::cout << "  correlate <old.csv> <new.csv>         : Correlate two metrics tables\n";
    std::cout << "  demo                                  : Run every metric on synthetic data\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --out <file>              : Output file (fd: displacement file, scan: metrics CSV)\n";
    std::cout << "  --rmax <mm>               : Brain radius for FD (default: 80mm)\n";
    std::cout << "  --fd-threshold <mm>       : High-motion FD threshold (default: 0.2mm)\n";
    std::cout << "  --motion <file>           : 3dvolreg matrix file or MCFLIRT rel.rms file\n";
    std::cout << "  --outliers <file>         : Saved 3dToutcount output\n";
    std::cout << "  --quality <file>          : Saved 3dTqual output\n";
    std::cout << "  --func <file>             : Run 3dToutcount and 3dTqual on this dataset\n";
    std::cout << "  --mask <file>             : Mask for 3dToutcount\n";
    std::cout << "  --replacements <file>     : Column renames, one 'old,new' per line\n";
}

void printMetrics(const TemporalQCMetrics& metrics) {
    std::cout << "\n=== Temporal QC Summary ===" << std::endl;
    std::cout << "Scan: " << metrics.participant << " / " << metrics.session
              << " / " << metrics.series << std::endl;
    std::cout << "Timepoints: " << metrics.num_timepoints << std::endl;

    auto values = MetricsReport::ToColumnValues(metrics);
    for (const auto& column : MetricsReport::GetMetricColumns()) {
        auto it = values.find(column);
        std::cout << "  " << std::left << std::setw(42) << column << std::right;
        if (it == values.end()) {
            std::cout << "n/a" << std::endl;
        } else {
            std::cout << std::fixed << std::setprecision(4) << it->second << std::endl;
        }
    }
    std::cout << "===========================" << std::endl;
}

int runFramewiseDisplacement(const std::string& motion_file, const std::string& out_file,
                             double rmax) {
    std::string written = FramewiseDisplacement::ComputeFramewiseDisplacementFile(
        motion_file, rmax, out_file);
    std::cout << "Framewise displacement written to " << written << std::endl;
    return 0;
}

int runScan(const ScanInputs& identity, const std::string& motion_file,
            const std::string& outlier_file, const std::string& quality_file,
            const std::string& func_file, const std::string& mask_file,
            const std::string& out_file, const TemporalQCParameters& params) {
    BatchTemporalQC::BatchOptions options;
    options.verbose = false;
    options.save_summary_report = !out_file.empty();
    options.report_file = out_file;

    ScanInputs inputs = identity;
    if (!func_file.empty()) {
        std::cout << "Running 3dToutcount and 3dTqual on " << func_file << std::endl;
        inputs.outlier_values = external::AfniToolRunner::OutlierTimepoints(func_file, mask_file);
        inputs.quality_values = external::AfniToolRunner::QualityTimepoints(func_file);
    }

    BatchTemporalQC batch(options, params);
    batch.AddFileJob(inputs, motion_file, outlier_file, quality_file);
    batch.ProcessAllJobs();

    const auto& job = batch.GetJobs().front();
    if (!job.completed) {
        std::cerr << "Temporal QC failed: " << job.error_message << std::endl;
        return 1;
    }

    printMetrics(job.metrics);
    if (!out_file.empty()) {
        std::cout << "\nMetrics table: " << out_file << std::endl;
    }
    return 0;
}

int runCorrelate(const std::string& old_file, const std::string& new_file,
                 const std::string& replacements_file) {
    std::vector<std::string> replacements;
    if (!replacements_file.empty()) {
        replacements = MetricsReport::ReadReplacements(replacements_file);
    }

    auto correlations = MetricsReport::CorrelateMetricTables(
        MetricsReport::ReadMetricsCSV(old_file), MetricsReport::ReadMetricsCSV(new_file),
        replacements);

    std::cout << "\n=== Metric Correlations ===" << std::endl;
    for (const auto& entry : correlations) {
        std::cout << "  " << std::left << std::setw(42) << entry.first << std::right
                  << std::fixed << std::setprecision(6) << entry.second << std::endl;
    }
    if (correlations.empty()) {
        std::cout << "  No metric shared by both tables" << std::endl;
    }
    return 0;
}

// Synthetic 4x4x4 scan with a shared global signal, voxel-specific noise and one
// translation step in the motion parameters
int runDemo(const TemporalQCParameters& params) {
    const size_t nx = 4, ny = 4, nz = 4;
    const size_t num_timepoints = 20;

    MaskedVoxelSeries::Image4DType volumes;
    for (size_t t = 0; t < num_timepoints; ++t) {
        auto volume = std::make_unique<MaskedVoxelSeries::VolumeType>(nx, ny, nz);
        const double global = std::sin(0.7 * t);
        for (size_t i = 0; i < volume->GetNumberOfVoxels(); ++i) {
            const double voxel_noise = std::cos(1.3 * t + 0.37 * i);
            (*volume)[i] = static_cast<float>(100.0 + i + global + (1.0 + 0.05 * i) * voxel_noise);
        }
        volumes.push_back(std::move(volume));
    }

    MaskedVoxelSeries::MaskType mask(nx, ny, nz);
    mask.Fill(1);

    ScanInputs inputs;
    inputs.participant = "sub-demo";
    inputs.session = "ses-1";
    inputs.series = "rest_1";
    inputs.voxel_series =
        std::make_shared<MaskedVoxelSeries>(std::move(volumes), std::move(mask));

    for (size_t t = 0; t < num_timepoints; ++t) {
        TransformMatrix transform;
        transform.SetIdentity();
        transform[0][3] = t < num_timepoints / 2 ? 0.0 : 0.5;
        transform[1][3] = 0.01 * t;
        inputs.transforms.push_back(transform);
    }

    std::vector<double> outliers, quality;
    for (size_t t = 0; t < num_timepoints; ++t) {
        outliers.push_back(t == 7 ? 0.2 : 0.001 * (t % 3));
        quality.push_back(0.01 + 0.0005 * (t % 4));
    }
    inputs.outlier_values = outliers;
    inputs.quality_values = quality;

    TemporalQC processor(params);
    printMetrics(processor.Process(inputs));
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> positional;

    TemporalQCParameters params = TemporalQC::GetDefaultParameters();
    std::string out_file, motion_file, outlier_file, quality_file;
    std::string func_file, mask_file, replacements_file;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--out" && i + 1 < argc) {
                out_file = argv[++i];
            } else if (arg == "--rmax" && i + 1 < argc) {
                params.rmax = std::stod(argv[++i]);
            } else if (arg == "--fd-threshold" && i + 1 < argc) {
                params.fd_threshold = std::stod(argv[++i]);
            } else if (arg == "--motion" && i + 1 < argc) {
                motion_file = argv[++i];
            } else if (arg == "--outliers" && i + 1 < argc) {
                outlier_file = argv[++i];
            } else if (arg == "--quality" && i + 1 < argc) {
                quality_file = argv[++i];
            } else if (arg == "--func" && i + 1 < argc) {
                func_file = argv[++i];
            } else if (arg == "--mask" && i + 1 < argc) {
                mask_file = argv[++i];
            } else if (arg == "--replacements" && i + 1 < argc) {
                replacements_file = argv[++i];
            } else if (arg.rfind("--", 0) == 0) {
                std::cerr << "Unknown option: " << arg << std::endl;
                return 1;
            } else {
                positional.push_back(arg);
            }
        }

        TemporalQC::ValidateParameters(params);

        if (command == "fd" && positional.size() == 1) {
            return runFramewiseDisplacement(positional[0], out_file, params.rmax);
        } else if (command == "scan" && positional.size() == 3) {
            ScanInputs identity;
            identity.participant = positional[0];
            identity.session = positional[1];
            identity.series = positional[2];
            return runScan(identity, motion_file, outlier_file, quality_file, func_file,
                           mask_file, out_file, params);
        } else if (command == "correlate" && positional.size() == 2) {
            return runCorrelate(positional[0], positional[1], replacements_file);
        } else if (command == "demo" && positional.empty()) {
            return runDemo(params);
        }

        printUsage(argv[0]);
        return 1;

    } catch (const NeuroQAPException& e) {
        std::cerr << e.GetFormattedReport();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
