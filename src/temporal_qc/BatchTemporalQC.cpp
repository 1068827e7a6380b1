/**
 * @file BatchTemporalQC.cpp
 * @brief Implementation of batch temporal QC processing
 */

#include "../common/NeuroQAPExceptions.h"
#include "../io/TextDataIO.h"
#include "MetricsReport.h"
#include "TemporalQC.h"
#include <chrono>
#include <fstream>
#include <future>
#include <iostream>
#include <thread>

namespace neuroqap {
namespace temporal {

BatchTemporalQC::BatchTemporalQC(const BatchOptions &options,
                                 const TemporalQCParameters &params)
    : m_options(options), m_params(params) {
  TemporalQC::ValidateParameters(m_params);
  if (m_options.max_parallel_jobs < 1) {
    throw ConfigurationException("max_parallel_jobs",
                                 std::to_string(m_options.max_parallel_jobs),
                                 "at least 1");
  }
}

void BatchTemporalQC::AddJob(const ScanInputs &inputs) {
  BatchJob job;
  job.inputs = inputs;
  m_jobs.push_back(job);
}

void BatchTemporalQC::AddFileJob(const ScanInputs &identity,
                                 const std::string &motion_file,
                                 const std::string &outlier_output_file,
                                 const std::string &quality_output_file) {
  BatchJob job;
  job.inputs = identity;
  job.motion_file = motion_file;
  job.outlier_output_file = outlier_output_file;
  job.quality_output_file = quality_output_file;
  m_jobs.push_back(job);
}

bool BatchTemporalQC::ProcessAllJobs() {
  if (m_jobs.empty()) {
    return true;
  }

  auto start_time = std::chrono::high_resolution_clock::now();

  if (m_options.verbose) {
    std::cout << "Starting temporal QC of " << m_jobs.size() << " scans"
              << std::endl;
    std::cout << "Maximum parallel jobs: " << m_options.max_parallel_jobs
              << std::endl;
  }

  std::ofstream log_file;
  if (!m_options.log_file.empty()) {
    log_file.open(m_options.log_file);
    if (log_file.is_open()) {
      log_file << "# NeuroQAP Temporal QC Batch Log" << std::endl;
      log_file << "# Started: "
               << std::chrono::duration_cast<std::chrono::seconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count()
               << std::endl;
    } else if (m_options.verbose) {
      std::cerr << "Cannot open log file " << m_options.log_file << std::endl;
    }
  }

  auto log_job = [&](size_t index) {
    if (!log_file.is_open()) {
      return;
    }
    const auto &job = m_jobs[index];
    log_file << "Job " << index << " (" << job.inputs.GetIdentifier()
             << "): " << (job.completed ? "COMPLETED" : "FAILED") << " in "
             << job.processing_time_ms << " ms";
    if (!job.completed) {
      log_file << " - " << job.error_message;
    }
    log_file << std::endl;
  };

  bool overall_success = true;

  if (m_options.max_parallel_jobs == 1) {
    for (size_t i = 0; i < m_jobs.size(); ++i) {
      const bool job_success = ProcessJob(i);
      log_job(i);

      if (!job_success) {
        overall_success = false;
        if (!m_options.continue_on_error) {
          break;
        }
      }
    }
  } else {
    // Each job only touches its own slot of m_jobs
    std::vector<std::pair<size_t, std::future<bool>>> active;
    size_t next_job = 0;
    bool stop_launching = false;

    while ((!stop_launching && next_job < m_jobs.size()) || !active.empty()) {
      while (!stop_launching &&
             active.size() < static_cast<size_t>(m_options.max_parallel_jobs) &&
             next_job < m_jobs.size()) {
        const size_t job_index = next_job++;
        active.emplace_back(job_index,
                            std::async(std::launch::async, [this, job_index]() {
                              return ProcessJob(job_index);
                            }));
      }

      for (auto it = active.begin(); it != active.end();) {
        if (it->second.wait_for(std::chrono::milliseconds(10)) ==
            std::future_status::ready) {
          const bool job_success = it->second.get();
          log_job(it->first);

          if (!job_success) {
            overall_success = false;
            // Running jobs finish; no new job is started
            if (!m_options.continue_on_error) {
              stop_launching = true;
            }
          }
          it = active.erase(it);
        } else {
          ++it;
        }
      }
    }
  }

  auto end_time = std::chrono::high_resolution_clock::now();
  double total_time =
      std::chrono::duration<double, std::milli>(end_time - start_time).count();

  if (m_options.verbose) {
    auto stats = GetBatchStatistics();
    std::cout << "Temporal QC completed in " << total_time / 1000.0
              << " seconds" << std::endl;
    std::cout << "Completed scans: " << stats.completed_jobs << "/"
              << stats.total_jobs << std::endl;
    std::cout << "Failed scans: " << stats.failed_jobs << std::endl;
  }

  if (m_options.save_summary_report) {
    try {
      MetricsReport::WriteMetricsCSV(m_options.report_file,
                                     GetCompletedMetrics());
      if (m_options.verbose) {
        std::cout << "Metrics written to " << m_options.report_file
                  << std::endl;
      }
    } catch (const TextIOException &e) {
      overall_success = false;
      std::cerr << e.what() << std::endl;
      if (log_file.is_open()) {
        log_file << "# Report failed: " << e.what() << std::endl;
      }
    }
  }

  if (log_file.is_open()) {
    log_file << "# Batch completed in " << total_time << " ms" << std::endl;
    log_file.close();
  }

  return overall_success;
}

bool BatchTemporalQC::ProcessJob(size_t job_index) {
  if (job_index >= m_jobs.size()) {
    return false;
  }

  auto &job = m_jobs[job_index];
  auto start_time = std::chrono::high_resolution_clock::now();

  auto elapsed_ms = [&start_time]() {
    return std::chrono::duration<double, std::milli>(
               std::chrono::high_resolution_clock::now() - start_time)
        .count();
  };

  try {
    if (m_options.verbose) {
      std::cout << "Processing scan " << job_index << ": "
                << job.inputs.GetIdentifier() << std::endl;
    }

    if (m_batch_progress_callback) {
      m_batch_progress_callback(job, 0.0);
    }

    TemporalQC processor(m_params);
    job.metrics = processor.Process(LoadJobInputs(job));
    job.completed = true;
    job.error_message.clear();
    job.processing_time_ms = elapsed_ms();

    if (m_batch_progress_callback) {
      m_batch_progress_callback(job, 1.0);
    }

    return true;

  } catch (const std::exception &e) {
    job.completed = false;
    job.error_message = e.what();
    job.processing_time_ms = elapsed_ms();

    if (m_options.verbose) {
      std::cerr << "Scan " << job_index << " failed: " << e.what()
                << std::endl;
    }

    return false;
  }
}

ScanInputs BatchTemporalQC::LoadJobInputs(const BatchJob &job) {
  ScanInputs inputs = job.inputs;

  if (!job.motion_file.empty()) {
    if (FramewiseDisplacement::IsPrecomputedDisplacementFile(job.motion_file)) {
      inputs.precomputed_displacement =
          io::TextDataIO::ReadScalarFile(job.motion_file);
    } else {
      inputs.transforms =
          FramewiseDisplacement::ReadTransformSequence(job.motion_file);
    }
  }

  if (!job.outlier_output_file.empty()) {
    inputs.outlier_values = io::TextDataIO::PassFloats(
        io::TextDataIO::ReadTextFile(job.outlier_output_file));
  }

  if (!job.quality_output_file.empty()) {
    inputs.quality_values = io::TextDataIO::PassFloats(
        io::TextDataIO::ReadTextFile(job.quality_output_file));
  }

  return inputs;
}

std::vector<BatchTemporalQC::BatchJob> BatchTemporalQC::GetCompletedJobs() const {
  std::vector<BatchJob> completed;

  for (const auto &job : m_jobs) {
    if (job.completed) {
      completed.push_back(job);
    }
  }

  return completed;
}

std::vector<BatchTemporalQC::BatchJob> BatchTemporalQC::GetFailedJobs() const {
  std::vector<BatchJob> failed;

  for (const auto &job : m_jobs) {
    if (!job.completed) {
      failed.push_back(job);
    }
  }

  return failed;
}

std::vector<TemporalQCMetrics> BatchTemporalQC::GetCompletedMetrics() const {
  std::vector<TemporalQCMetrics> metrics;

  for (const auto &job : m_jobs) {
    if (job.completed) {
      metrics.push_back(job.metrics);
    }
  }

  return metrics;
}

BatchTemporalQC::BatchStatistics BatchTemporalQC::GetBatchStatistics() const {
  BatchStatistics stats;
  stats.total_jobs = static_cast<int>(m_jobs.size());

  for (const auto &job : m_jobs) {
    if (job.completed) {
      stats.completed_jobs++;
    } else {
      stats.failed_jobs++;
    }
    stats.total_processing_time_ms += job.processing_time_ms;
  }

  if (stats.completed_jobs > 0) {
    stats.average_processing_time_ms =
        stats.total_processing_time_ms / stats.completed_jobs;
  }

  return stats;
}

} // namespace temporal
} // namespace neuroqap
