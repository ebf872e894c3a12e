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
 * @file folder_backend.hpp
 * @brief Destination that copies staged objects into a directory
 * @details Creates the destination tree when absent and writes each staged
 *          object as export_NNNNNN.dcm, overwriting existing files so that a
 *          repeated dispatch yields the same file set.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/transfer/destination_backend.hpp"

namespace dicom_transfer::services {

/**
 * @brief Folder destination backend
 */
class FolderBackend : public IDestinationBackend {
public:
    /// Prefix of exported file names
    static constexpr const char* EXPORT_FILE_PREFIX = "export";

    explicit FolderBackend(FolderDestination destination);

    [[nodiscard]] std::expected<DispatchResult, TransferErrorInfo>
    dispatch(const std::vector<StagedObject>& objects,
             const ProgressSink& progress,
             const CancellationToken& cancel) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "folder"; }

    [[nodiscard]] const FolderDestination& destination() const noexcept { return destination_; }

private:
    FolderDestination destination_;
};

} // namespace dicom_transfer::services
