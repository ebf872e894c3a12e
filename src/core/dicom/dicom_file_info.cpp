#include "core/dicom_file_info.hpp"
#include "core/logging.hpp"

#include <dcmtk/config/osconfig.h>
#include <dcmtk/dcmdata/dcdeftag.h>
#include <dcmtk/dcmdata/dcfilefo.h>

namespace dicom_transfer::core {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("DicomFileInfo");
    return logger;
}

void readString(DcmItem* item, const DcmTagKey& tag, std::string& target) {
    OFString value;
    if (item->findAndGetOFString(tag, value).good() && !value.empty()) {
        target = value.c_str();
    }
}

} // anonymous namespace

std::vector<std::pair<std::string, std::string>> DicomFileInfo::fields() const {
    auto dimension = [](int value) {
        return value > 0 ? std::to_string(value) : std::string(NOT_AVAILABLE);
    };

    return {
        {"PatientID", patientId},
        {"PatientName", patientName},
        {"StudyDate", studyDate},
        {"Modality", modality},
        {"StudyDescription", studyDescription},
        {"StudyInstanceUID", studyInstanceUid},
        {"SeriesDescription", seriesDescription},
        {"SOPClassUID", sopClassUid},
        {"SOPInstanceUID", sopInstanceUid},
        {"Rows", dimension(rows)},
        {"Columns", dimension(columns)},
    };
}

std::expected<DicomFileInfo, DicomErrorInfo>
DicomFileInfo::read(const std::filesystem::path& filePath) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(filePath, ec)) {
        return std::unexpected(DicomErrorInfo{
            DicomError::FileNotFound,
            "File not found: " + filePath.string()
        });
    }

    DcmFileFormat fileFormat;
    // Stop before pixel data; only header attributes are reported
    OFCondition cond = fileFormat.loadFileUntilTag(
        filePath.string().c_str(),
        EXS_Unknown,
        EGL_noChange,
        DCM_MaxReadLength,
        ERM_autoDetect,
        DCM_PixelData
    );
    if (cond.bad()) {
        getLogger()->debug("Failed to parse {}: {}", filePath.string(), cond.text());
        return std::unexpected(DicomErrorInfo{
            DicomError::InvalidDicomFormat,
            std::string("Not a readable DICOM file: ") + cond.text()
        });
    }

    DicomFileInfo info;
    DcmDataset* dataset = fileFormat.getDataset();

    readString(dataset, DCM_PatientID, info.patientId);
    readString(dataset, DCM_PatientName, info.patientName);
    readString(dataset, DCM_StudyDate, info.studyDate);
    readString(dataset, DCM_StudyDescription, info.studyDescription);
    readString(dataset, DCM_StudyInstanceUID, info.studyInstanceUid);
    readString(dataset, DCM_Modality, info.modality);
    readString(dataset, DCM_SeriesDescription, info.seriesDescription);
    readString(dataset, DCM_SOPClassUID, info.sopClassUid);
    readString(dataset, DCM_SOPInstanceUID, info.sopInstanceUid);

    Uint16 value = 0;
    if (dataset->findAndGetUint16(DCM_Rows, value).good()) {
        info.rows = value;
    }
    if (dataset->findAndGetUint16(DCM_Columns, value).good()) {
        info.columns = value;
    }

    return info;
}

} // namespace dicom_transfer::core
