// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file dicom_file_info.hpp
 * @brief Summary attributes of a single DICOM file
 * @details Reads the patient, study, series and image attributes that the
 *          command-line "info" command reports. Parsing is delegated to
 *          DCMTK; only the file header and the requested elements are read
 *          (pixel data is not loaded).
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace dicom_transfer::core {

/// Error types for DICOM file inspection
enum class DicomError {
    FileNotFound,
    InvalidDicomFormat
};

/// Error result with message
struct DicomErrorInfo {
    DicomError code;
    std::string message;
};

/// Attributes reported for one DICOM file
struct DicomFileInfo {
    /// Placeholder for attributes absent from the dataset
    static constexpr const char* NOT_AVAILABLE = "N/A";

    // Patient Module
    std::string patientId = NOT_AVAILABLE;
    std::string patientName = NOT_AVAILABLE;

    // Study Module
    std::string studyDate = NOT_AVAILABLE;
    std::string studyDescription = NOT_AVAILABLE;
    std::string studyInstanceUid = NOT_AVAILABLE;

    // Series Module
    std::string modality = NOT_AVAILABLE;
    std::string seriesDescription = NOT_AVAILABLE;

    // SOP Common Module
    std::string sopClassUid = NOT_AVAILABLE;
    std::string sopInstanceUid = NOT_AVAILABLE;

    // Image Module
    int rows = 0;
    int columns = 0;

    /**
     * @brief Attribute name/value pairs in display order
     */
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> fields() const;

    /**
     * @brief Read summary attributes from a DICOM file
     * @param filePath Path to the DICOM file
     * @return Attributes on success, error info if the file is missing or
     *         cannot be parsed as DICOM
     */
    [[nodiscard]] static std::expected<DicomFileInfo, DicomErrorInfo>
    read(const std::filesystem::path& filePath);
};

} // namespace dicom_transfer::core
