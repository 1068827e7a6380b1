/**
 * @file FramewiseDisplacement.cpp
 * @brief Implementation of Jenkinson framewise displacement
 */

#include "FramewiseDisplacement.h"
#include "../common/NeuroQAPExceptions.h"
#include "../io/TextDataIO.h"
#include "itkExceptionObject.h"
#include "vnl/vnl_det.h"
#include <cmath>
#include <filesystem>

namespace neuroqap {
namespace temporal {

DisplacementSeries
FramewiseDisplacement::ComputeJenkinson(const TransformSequence &transforms,
                                        double rmax) {
  ValidateRadius(rmax);

  if (transforms.empty()) {
    throw NumericException(NumericException::Reason::EmptyInput,
                           "ComputeJenkinson", "no transforms");
  }

  FDAccumulator accumulator;
  accumulator.values.reserve(transforms.size());

  for (const auto &transform : transforms) {
    accumulator = Accumulate(std::move(accumulator), transform, rmax);
  }

  return std::move(accumulator.values);
}

FDAccumulator FramewiseDisplacement::Accumulate(FDAccumulator accumulator,
                                                const TransformMatrix &current,
                                                double rmax) {
  if (!accumulator.previous) {
    accumulator.values.push_back(0.0);
  } else {
    accumulator.values.push_back(
        JenkinsonDisplacement(*accumulator.previous, current, rmax));
  }

  accumulator.previous = current;
  return accumulator;
}

double FramewiseDisplacement::JenkinsonDisplacement(
    const TransformMatrix &previous, const TransformMatrix &current,
    double rmax) {
  const auto &vnl_previous = previous.GetVnlMatrix();
  const double determinant = vnl_det(vnl_previous[0], vnl_previous[1],
                                     vnl_previous[2], vnl_previous[3]);
  if (!std::isfinite(determinant) ||
      std::abs(determinant) < kSingularityTolerance) {
    throw NumericException(NumericException::Reason::SingularMatrix,
                           "JenkinsonDisplacement",
                           "previous transform determinant is " +
                               std::to_string(determinant));
  }

  TransformMatrix inverse;
  try {
    inverse = TransformMatrix(previous.GetInverse());
  } catch (const itk::ExceptionObject &e) {
    throw NumericException(NumericException::Reason::SingularMatrix,
                           "JenkinsonDisplacement", e.GetDescription());
  }

  TransformMatrix relative = current * inverse;
  for (unsigned int i = 0; i < 4; ++i) {
    relative[i][i] -= 1.0;
  }

  // trace(A'A) is the squared Frobenius norm of the rotational block
  double trace_ata = 0.0;
  double btb = 0.0;
  for (unsigned int i = 0; i < 3; ++i) {
    for (unsigned int j = 0; j < 3; ++j) {
      trace_ata += relative[i][j] * relative[i][j];
    }
    btb += relative[i][3] * relative[i][3];
  }

  const double fd = std::sqrt((rmax * rmax / 5.0) * trace_ata + btb);
  if (!std::isfinite(fd)) {
    throw NumericException(NumericException::Reason::NonFiniteResult,
                           "JenkinsonDisplacement");
  }

  return fd;
}

DisplacementSeries
FramewiseDisplacement::FromPrecomputed(const std::vector<double> &displacements) {
  if (displacements.empty()) {
    throw NumericException(NumericException::Reason::EmptyInput,
                           "FromPrecomputed", "no displacement values");
  }
  return displacements;
}

TransformMatrix
FramewiseDisplacement::MatrixFromRow(const std::vector<double> &row) {
  if (row.size() != 12) {
    throw MalformedInputException(
        "<memory>", 0,
        "affine row needs 12 values, found " + std::to_string(row.size()));
  }

  TransformMatrix matrix;
  matrix.SetIdentity();

  // Row-major 3x4 block; the homogeneous row stays [0 0 0 1]
  for (unsigned int i = 0; i < 3; ++i) {
    for (unsigned int j = 0; j < 4; ++j) {
      matrix[i][j] = row[i * 4 + j];
    }
  }

  return matrix;
}

TransformSequence FramewiseDisplacement::TransformSequenceFromRows(
    const std::vector<std::vector<double>> &rows) {
  TransformSequence sequence;
  sequence.reserve(rows.size());

  for (const auto &row : rows) {
    sequence.push_back(MatrixFromRow(row));
  }

  return sequence;
}

TransformSequence
FramewiseDisplacement::ReadTransformSequence(const std::string &filename) {
  return TransformSequenceFromRows(
      io::TextDataIO::ReadNumericTable(filename, 12));
}

bool FramewiseDisplacement::IsPrecomputedDisplacementFile(
    const std::string &filename) {
  return filename.find(kPrecomputedMarker) != std::string::npos;
}

std::string FramewiseDisplacement::DefaultOutputPath(const std::string &in_file) {
  std::filesystem::path input(in_file);
  std::string name = input.stem().string() + "_fdfile" +
                     input.extension().string();
  return std::filesystem::absolute(name).string();
}

std::string FramewiseDisplacement::ComputeFramewiseDisplacementFile(
    const std::string &in_file, double rmax, const std::string &out_file) {
  std::string output = out_file.empty() ? DefaultOutputPath(in_file) : out_file;

  if (IsPrecomputedDisplacementFile(in_file)) {
    std::error_code ec;
    std::filesystem::copy_file(
        in_file, output, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
      throw TextIOException(in_file, "Copy", ec.message());
    }
    return output;
  }

  auto displacement = ComputeJenkinson(ReadTransformSequence(in_file), rmax);
  io::TextDataIO::WriteScalarFile(output, displacement);
  return output;
}

void FramewiseDisplacement::ValidateRadius(double rmax) {
  if (!std::isfinite(rmax) || rmax <= 0.0) {
    throw ConfigurationException("rmax", std::to_string(rmax),
                                 "finite positive radius in mm");
  }
}

} // namespace temporal
} // namespace neuroqap
