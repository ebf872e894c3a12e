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
 * @file dicom_validator.hpp
 * @brief Cheap DICOM Part 10 signature check
 * @details Classifies a filesystem entry as a DICOM object by looking for
 *          the "DICM" magic that follows the 128-byte file preamble. The
 *          file extension is never consulted. No dataset parsing happens
 *          here, so the check stays cheap enough to run once per file
 *          while walking slow removable media.
 *
 * ## Thread Safety
 * - All functions are stateless and may be called from any thread
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <array>
#include <cstddef>
#include <filesystem>

namespace dicom_transfer::core {

/**
 * @brief DICOM Part 10 signature validator
 *
 * @example
 * @code
 * if (DicomValidator::isDicomObject("/media/cdrom/IMG0001")) {
 *     // stage it
 * }
 * @endcode
 */
class DicomValidator {
public:
    /// Length of the file preamble preceding the magic
    static constexpr std::size_t PREAMBLE_LENGTH = 128;

    /// Part 10 magic that must follow the preamble
    static constexpr std::array<char, 4> MAGIC = {'D', 'I', 'C', 'M'};

    /// Smallest file that can carry preamble and magic
    static constexpr std::size_t MINIMUM_FILE_SIZE = PREAMBLE_LENGTH + MAGIC.size();

    /**
     * @brief Check whether a file carries the DICOM Part 10 signature
     *
     * Never throws. Missing, unreadable, too-short files and directories
     * all yield false.
     *
     * @param path File to inspect
     * @return true if bytes [128, 132) equal "DICM"
     */
    [[nodiscard]] static bool isDicomObject(const std::filesystem::path& path) noexcept;
};

} // namespace dicom_transfer::core
