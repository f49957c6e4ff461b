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

#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "fastoct/format_reader.h"  // Complete type needed for unique_ptr
#include "fastoct/readers/bioptigen/bioptigen.h"
#include "fastoct/readers/dicom/dicom.h"
#include "fastoct/readers/heidelberg/e2e.h"
#include "fastoct/readers/optovue/optovue.h"
#include "fastoct/readers/topcon/fda.h"
#include "fastoct/readers/topcon/fds.h"
#include "fastoct/readers/zeiss/zeiss_img.h"
#include "fastoct/runtime/reader_registry.h"

/**
 * @file register_builtin_formats.cpp
 * @brief Registration of the built-in vendor formats
 *
 * Bioptigen is registered ahead of Optovue; both claim `.oct` and their
 * signature checks keep them apart.
 */

namespace fastoct::runtime {

void RegisterBuiltinFormats(ReaderRegistry& registry) {
  std::vector<FormatDescriptor> descriptors;
  descriptors.push_back(formats::topcon::CreateFdsFormatDescriptor());
  descriptors.push_back(formats::topcon::CreateFdaFormatDescriptor());
  descriptors.push_back(formats::heidelberg::CreateE2eFormatDescriptor());
  descriptors.push_back(formats::zeiss::CreateZeissImgFormatDescriptor());
  descriptors.push_back(formats::bioptigen::CreateBioptigenFormatDescriptor());
  descriptors.push_back(formats::optovue::CreateOptovueFormatDescriptor());
  descriptors.push_back(formats::dicom::CreateDicomFormatDescriptor());

  VLOG(1) << "Registering " << descriptors.size() << " built-in formats";
  registry.RegisterFormats(std::move(descriptors));
}

}  // namespace fastoct::runtime
