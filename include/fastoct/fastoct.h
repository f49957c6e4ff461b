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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_FASTOCT_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_FASTOCT_H_

#include <filesystem>
#include <memory>

#include "absl/status/statusor.h"

/**
 * @file fastoct.h
 * @brief Main header for the FastOCT library
 *
 * This header includes the data model, the format readers and the registry
 * for reading ophthalmic OCT and fundus files (Topcon FDS/FDA, Heidelberg
 * E2E, Zeiss IMG, Bioptigen, Optovue and DICOM).
 *
 * @see fastoct/core/ for the data model
 * @see fastoct/readers/ for format readers
 * @see fastoct/runtime/ for the registry
 */

// ============================================================================
// Data Model
// ============================================================================

#include "fastoct/core/decode_result.h"
#include "fastoct/core/metadata.h"
#include "fastoct/core/slice.h"
#include "fastoct/core/volume.h"
#include "fastoct/errors.h"

// ============================================================================
// Format Readers
// ============================================================================

#include "fastoct/format_reader.h"
#include "fastoct/readers/bioptigen/bioptigen.h"
#include "fastoct/readers/dicom/dicom.h"
#include "fastoct/readers/heidelberg/e2e.h"
#include "fastoct/readers/optovue/optovue.h"
#include "fastoct/readers/topcon/fda.h"
#include "fastoct/readers/topcon/fds.h"
#include "fastoct/readers/zeiss/zeiss_img.h"

// ============================================================================
// Public API
// ============================================================================

#include "fastoct/read_options.h"
#include "fastoct/runtime/format_descriptor.h"
#include "fastoct/runtime/reader_registry.h"

namespace fastoct {

/// @brief Open a vendor file with the global registry
///
/// The reader is chosen by extension and, for extensions shared by several
/// formats, by file signature.
inline absl::StatusOr<std::unique_ptr<FormatReader>> OpenReader(
    const std::filesystem::path& path,
    const ReadOptions& options = ReadOptions()) {
  return GetGlobalRegistry().CreateReader(path, options);
}

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_FASTOCT_H_
