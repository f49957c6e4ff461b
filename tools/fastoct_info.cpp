// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/initialize.h"
#include "absl/status/status.h"
#include "absl/time/civil_time.h"
#include "absl/time/time.h"
#include "fastoct/fastoct.h"
#include "fastoct/utilities/fmt.h"

ABSL_FLAG(std::string, input, "",
          "Path to the vendor file (FDS, FDA, E2E, IMG, OCT or DCM)");
ABSL_FLAG(bool, deinterlace, false,
          "Split Zeiss frames into two half-depth slices");
ABSL_FLAG(uint32_t, zeiss_ascans, 512, "A-scans per frame for Zeiss .img");
ABSL_FLAG(uint32_t, zeiss_depth, 1024, "Samples per A-scan for Zeiss .img");
ABSL_FLAG(bool, verbose, false,
          "Show per-slice status, patient metadata and every warning");

namespace {

namespace fofmt = fastoct::fmt;

void PrintSeparator(char c = '=') { fofmt::print("{}\n", std::string(80, c)); }

void PrintHeader(std::string_view title) {
  fofmt::print("\n");
  PrintSeparator('=');
  fofmt::print(" {}\n", title);
  PrintSeparator('=');
}

void PrintSubHeader(std::string_view title) {
  fofmt::print("\n--- {} ---\n", title);
}

void PrintKeyValue(std::string_view key, std::string_view value,
                   int width = 30) {
  fofmt::print("{:<{}}{}\n", fofmt::format("{}:", key), width, value);
}

void PrintKeyValue(std::string_view key, size_t value, int width = 30) {
  PrintKeyValue(key, std::to_string(value), width);
}

void PrintOptional(std::string_view key,
                   const std::optional<std::string>& value, int width = 30) {
  if (value.has_value()) {
    PrintKeyValue(key, *value, width);
  }
}

void PrintError(std::string_view what, const absl::Status& status) {
  fofmt::print(stderr, "\nError: {}\nStatus: {}\n", what, status.ToString());
}

void PrintWarnings(const std::vector<fastoct::Warning>& warnings,
                   std::string_view indent, bool verbose) {
  if (warnings.empty()) {
    return;
  }
  PrintKeyValue(fofmt::format("{}Warnings", indent), warnings.size());
  if (!verbose) {
    return;
  }
  for (const auto& warning : warnings) {
    fofmt::print("{}  - {}\n", indent, warning.ToString());
  }
}

void PrintAcquisition(fastoct::Laterality laterality,
                      const std::optional<absl::CivilSecond>& datetime,
                      const fastoct::PatientMetadata& patient,
                      const fastoct::DeviceMetadata& device, bool verbose) {
  PrintKeyValue("  Laterality", fastoct::GetName(laterality));
  if (datetime.has_value()) {
    PrintKeyValue("  Acquired", absl::FormatCivilTime(*datetime));
  }
  PrintOptional("  Manufacturer", device.manufacturer);
  PrintOptional("  Model", device.model);
  PrintOptional("  Serial Number", device.serial_number);
  PrintOptional("  Software", device.software_version);

  // Patient identity only on request
  if (!verbose) {
    return;
  }
  PrintOptional("  Patient ID", patient.patient_id);
  PrintOptional("  Patient Name", patient.name);
  PrintOptional("  Sex", patient.sex);
  if (patient.birthdate.has_value()) {
    PrintKeyValue("  Birthdate", absl::FormatCivilTime(*patient.birthdate));
  }
}

void PrintVolumes(const fastoct::DecodeResult<fastoct::OctVolume>& volumes,
                  bool verbose) {
  PrintHeader("OCT Volumes");
  PrintKeyValue("Number of Volumes", volumes.size());
  PrintWarnings(volumes.warnings, "", verbose);

  for (const auto& [volume, warnings] : volumes.items) {
    PrintSubHeader(fofmt::format("Volume {}", volume.volume_id));

    PrintKeyValue("  Slices", volume.GetNumSlices());
    PrintKeyValue("  Missing Slices", volume.CountMissing());
    PrintKeyValue("  Slice Geometry", volume.GetGeometry().ToString());
    if (!volume.contours.empty()) {
      PrintKeyValue("  Contours", volume.contours.size());
    }
    PrintAcquisition(volume.laterality, volume.acquisition_datetime,
                     volume.patient, volume.device, verbose);
    PrintWarnings(warnings, "  ", verbose);

    if (verbose) {
      for (size_t i = 0; i < volume.slices.size(); ++i) {
        fofmt::print("    [{:>4}] {}\n", i, volume.slices[i].ToString());
      }
    }
  }
}

void PrintFundusImages(
    const fastoct::DecodeResult<fastoct::FundusImage>& images, bool verbose) {
  PrintHeader("Fundus Images");
  PrintKeyValue("Number of Images", images.size());
  PrintWarnings(images.warnings, "", verbose);

  for (const auto& [image, warnings] : images.items) {
    PrintSubHeader(fofmt::format("Image {}", image.image_id));
    PrintKeyValue("  Geometry", image.image.GetGeometry().ToString());
    PrintAcquisition(image.laterality, image.acquisition_datetime,
                     image.patient, image.device, verbose);
    PrintWarnings(warnings, "  ", verbose);
  }
}

int InfoCommand(const std::string& input_file,
                const fastoct::ReadOptions& options, bool verbose) {
  fofmt::print("Opening file: {}\n", input_file);
  auto reader_or = fastoct::OpenReader(input_file, options);

  if (!reader_or.ok()) {
    PrintError("Failed to open file", reader_or.status());
    return 1;
  }

  const auto& reader = *reader_or;
  PrintKeyValue("Format", reader->GetFormatName());
  PrintKeyValue("File Size", static_cast<size_t>(reader->GetBuffer().Size()));

  int exit_code = 0;

  auto volumes = reader->ReadOctVolumes();
  if (volumes.ok()) {
    PrintVolumes(*volumes, verbose);
  } else {
    PrintError("Failed to read OCT volumes", volumes.status());
    exit_code = 1;
  }

  auto images = reader->ReadFundusImages();
  if (images.ok()) {
    PrintFundusImages(*images, verbose);
  } else {
    PrintError("Failed to read fundus images", images.status());
    exit_code = 1;
  }

  fofmt::print("\n");
  PrintSeparator('=');
  fofmt::print("{}\n", exit_code == 0 ? "Successfully read file information!"
                                      : "File read with errors");
  PrintSeparator('=');
  return exit_code;
}

void PrintUsage(const char* program_name) {
  fofmt::print(stderr, "Usage: {} --input=<path> [options]\n\n", program_name);
  fofmt::print(stderr,
               "Options:\n"
               "  --input=<path>       Path to vendor file (required)\n"
               "  --verbose            Show slices, patient data, warnings\n"
               "  --deinterlace        Split Zeiss frames (default: false)\n"
               "  --zeiss_ascans=<n>   Zeiss A-scans per frame (default: 512)\n"
               "  --zeiss_depth=<n>    Zeiss samples per A-scan "
               "(default: 1024)\n");

  fofmt::print(stderr, "\nSupported extensions:");
  for (const auto& extension :
       fastoct::GetGlobalRegistry().GetSupportedExtensions()) {
    fofmt::print(stderr, " {}", extension);
  }

  fofmt::print(stderr, "\n\nExamples:\n");
  fofmt::print(stderr, "  {} --input=scan.e2e --verbose\n", program_name);
  fofmt::print(stderr,
               "  {} --input=cube.img --zeiss_ascans=200 --zeiss_depth=1024\n",
               program_name);
}

}  // namespace

int main(int argc, char* argv[]) {
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  const std::string input_file = absl::GetFlag(FLAGS_input);
  if (input_file.empty()) {
    fofmt::print(stderr, "Error: --input flag is required\n\n");
    PrintUsage(argv[0]);
    return 1;
  }

  fastoct::ReadOptions options;
  options.de_interlace = absl::GetFlag(FLAGS_deinterlace);
  options.zeiss_ascans = absl::GetFlag(FLAGS_zeiss_ascans);
  options.zeiss_depth = absl::GetFlag(FLAGS_zeiss_depth);

  return InfoCommand(input_file, options, absl::GetFlag(FLAGS_verbose));
}
